#include <doctest/doctest.h>
#include "orrery/geometry/Frustum.hpp"

#include <glm/gtc/constants.hpp>
#include <glm/gtc/epsilon.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

using namespace orrery::geometry;

namespace {
    bool near(const glm::vec3& a, const glm::vec3& b, float eps = 1e-3f) {
        return glm::all(glm::epsilonEqual(a, b, eps));
    }

    // Camera at the origin looking down +Z.
    glm::mat4 forwardViewProj(float nearPlane = 1.0f, float farPlane = 100.0f) {
        const glm::mat4 proj = glm::perspectiveLH_ZO(glm::half_pi<float>(), 1.0f, nearPlane, farPlane);
        const glm::mat4 view = glm::lookAtLH(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        return proj * view;
    }
}

TEST_CASE("Frustum plane extraction") {
    const Frustum f = Frustum::extractPlanes(forwardViewProj(), true);

    SUBCASE("Normalized planes have unit normals") {
        for (const Plane& p : f.planes) {
            CHECK(glm::length(p.normal) == doctest::Approx(1.0f).epsilon(1e-4));
        }
    }

    SUBCASE("Planes face inwards in left, right, bottom, top, near, far order") {
        CHECK(f.planes[Frustum::Left].normal.x > 0.0f);
        CHECK(f.planes[Frustum::Right].normal.x < 0.0f);
        CHECK(f.planes[Frustum::Bottom].normal.y > 0.0f);
        CHECK(f.planes[Frustum::Top].normal.y < 0.0f);
        CHECK(near(f.planes[Frustum::Near].normal, {0.0f, 0.0f, 1.0f}));
        CHECK(near(f.planes[Frustum::Far].normal, {0.0f, 0.0f, -1.0f}));

        CHECK(signedDistance(f.planes[Frustum::Near], {0.0f, 0.0f, 1.0f}) == doctest::Approx(0.0f).epsilon(1e-3));
        CHECK(signedDistance(f.planes[Frustum::Far], {0.0f, 0.0f, 60.0f}) == doctest::Approx(40.0f).epsilon(1e-3));
    }

    SUBCASE("Point containment") {
        CHECK(f.containsPoint({0.0f, 0.0f, 50.0f}));
        CHECK(f.containsPoint({9.0f, -9.0f, 10.0f}));
        CHECK_FALSE(f.containsPoint({0.0f, 0.0f, 500.0f}));
        CHECK_FALSE(f.containsPoint({0.0f, 0.0f, 0.5f}));
        CHECK_FALSE(f.containsPoint({0.0f, 0.0f, -5.0f}));
        CHECK_FALSE(f.containsPoint({11.0f, 0.0f, 10.0f}));
        CHECK_FALSE(f.containsPoint({0.0f, 11.0f, 10.0f}));
    }

    SUBCASE("Unnormalized planes classify points the same way") {
        const Frustum raw = Frustum::extractPlanes(forwardViewProj(), false);
        CHECK(raw.containsPoint({0.0f, 0.0f, 50.0f}));
        CHECK_FALSE(raw.containsPoint({0.0f, 0.0f, 500.0f}));
        CHECK(glm::length(raw.planes[Frustum::Left].normal) != doctest::Approx(1.0f));
    }
}

TEST_CASE("Frustum OpenGL depth range") {
    const glm::mat4 proj = glm::perspectiveLH_NO(glm::half_pi<float>(), 1.0f, 1.0f, 100.0f);
    const Frustum gl = Frustum::extractPlanesGL(proj, true);
    CHECK(gl.containsPoint({0.0f, 0.0f, 1.5f}));
    CHECK_FALSE(gl.containsPoint({0.0f, 0.0f, 0.5f}));
    CHECK_FALSE(gl.containsPoint({0.0f, 0.0f, 150.0f}));
    CHECK(signedDistance(gl.planes[Frustum::Near], {0.0f, 0.0f, 1.0f}) == doctest::Approx(0.0f).epsilon(1e-3));
}

TEST_CASE("Frustum bounds tests") {
    const Frustum f = Frustum::extractPlanes(forwardViewProj(), true);

    SUBCASE("Spheres") {
        CHECK(f.intersectsSphere({0.0f, 0.0f, 10.0f}, 1.0f));
        // Centre just past the right plane, radius reaching back in.
        CHECK(f.intersectsSphere({10.5f, 0.0f, 10.0f}, 1.0f));
        CHECK_FALSE(f.intersectsSphere({20.0f, 0.0f, 10.0f}, 1.0f));
        CHECK_FALSE(f.intersectsSphere(BoundingSphere{{0.0f, 0.0f, -10.0f}, 2.0f}));
    }

    SUBCASE("Boxes") {
        BoundingBox inside{{-1.0f, -1.0f, 9.0f}, {1.0f, 1.0f, 11.0f}};
        BoundingBox straddling{{5.0f, -1.0f, 9.0f}, {15.0f, 1.0f, 11.0f}};
        BoundingBox outside{{20.0f, -1.0f, 9.0f}, {22.0f, 1.0f, 11.0f}};
        BoundingBox behind{{-1.0f, -1.0f, -11.0f}, {1.0f, 1.0f, -9.0f}};
        CHECK(f.intersectsBox(inside));
        CHECK(f.intersectsBox(straddling));
        CHECK_FALSE(f.intersectsBox(outside));
        CHECK_FALSE(f.intersectsBox(behind));
    }

    SUBCASE("Spheres enclosing boxes") {
        const BoundingBox inside{{-1.0f, -1.0f, 9.0f}, {1.0f, 1.0f, 11.0f}};
        const BoundingSphere insideSphere = boundingSphere(inside);
        CHECK(near(insideSphere.center, {0.0f, 0.0f, 10.0f}));
        CHECK(insideSphere.radius == doctest::Approx(std::sqrt(3.0f)));
        CHECK(f.intersectsSphere(insideSphere));

        const BoundingBox straddling{{5.0f, -1.0f, 9.0f}, {15.0f, 1.0f, 11.0f}};
        CHECK(f.intersectsSphere(boundingSphere(straddling)));

        const BoundingBox outside{{20.0f, -1.0f, 9.0f}, {22.0f, 1.0f, 11.0f}};
        CHECK_FALSE(f.intersectsSphere(boundingSphere(outside)));
    }
}

TEST_CASE("Plane helpers") {
    SUBCASE("Normalization rescales the distance too") {
        const Plane p = normalizePlane(Plane{{0.0f, 3.0f, 4.0f}, 10.0f});
        CHECK(near(p.normal, {0.0f, 0.6f, 0.8f}));
        CHECK(p.distance == doctest::Approx(2.0f));
    }

    SUBCASE("Zero normals are left untouched") {
        const Plane p = normalizePlane(Plane{{0.0f, 0.0f, 0.0f}, 5.0f});
        CHECK(p.normal == glm::vec3(0.0f));
        CHECK(p.distance == 5.0f);
    }

    SUBCASE("vec4 conversion") {
        const Plane p = Plane::fromVec4({1.0f, 2.0f, 3.0f, 4.0f});
        CHECK(p.asVec4() == glm::vec4(1.0f, 2.0f, 3.0f, 4.0f));
    }
}

TEST_CASE("Frustum corners") {
    const auto corners = frustumCorners(forwardViewProj(1.0f, 100.0f));
    // 90 degree fov with a square aspect: half extent equals depth.
    CHECK(near(corners[0], {-1.0f, -1.0f, 1.0f}));
    CHECK(near(corners[2], {1.0f, 1.0f, 1.0f}));
    CHECK(near(corners[4], {-100.0f, -100.0f, 100.0f}, 0.05f));
    CHECK(near(corners[6], {100.0f, 100.0f, 100.0f}, 0.05f));
}

TEST_CASE("transformBox") {
    const BoundingBox unit{{-1.0f, -2.0f, -3.0f}, {1.0f, 2.0f, 3.0f}};

    SUBCASE("Translation shifts the box") {
        const BoundingBox moved = transformBox(unit, glm::translate(glm::mat4(1.0f), {10.0f, 0.0f, 0.0f}));
        CHECK(near(moved.m_min, {9.0f, -2.0f, -3.0f}));
        CHECK(near(moved.m_max, {11.0f, 2.0f, 3.0f}));
    }

    SUBCASE("Quarter turn about Y swaps X and Z extents") {
        const glm::mat4 m = glm::rotate(glm::mat4(1.0f), glm::half_pi<float>(), {0.0f, 1.0f, 0.0f});
        const BoundingBox turned = transformBox(unit, m);
        CHECK(near(turned.m_min, {-3.0f, -2.0f, -1.0f}));
        CHECK(near(turned.m_max, {3.0f, 2.0f, 1.0f}));
    }

    SUBCASE("Scale grows the box") {
        const BoundingBox scaled = transformBox(unit, glm::scale(glm::mat4(1.0f), glm::vec3(2.0f)));
        CHECK(near(scaled.extents(), {2.0f, 4.0f, 6.0f}));
        CHECK(scaled.isValid());
    }

    SUBCASE("Default box is empty") {
        BoundingBox empty;
        CHECK_FALSE(empty.isValid());
        empty.expand({1.0f, 1.0f, 1.0f});
        CHECK(empty.isValid());
        CHECK(near(empty.center(), {1.0f, 1.0f, 1.0f}));
    }
}
