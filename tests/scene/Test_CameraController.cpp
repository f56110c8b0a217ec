#include <doctest/doctest.h>
#include "orrery/scene/CameraController.hpp"

#include <glm/gtc/epsilon.hpp>

using namespace orrery::scene;

namespace {
    bool near(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f) {
        return glm::all(glm::epsilonEqual(a, b, eps));
    }
}

TEST_CASE("CameraController movement") {
    CameraController controller({0.0f, 0.0f, 0.0f});
    CHECK(near(controller.front(), {0.0f, 0.0f, 1.0f}));
    CHECK(near(controller.right(), {1.0f, 0.0f, 0.0f}));

    SUBCASE("Moves along its own axes") {
        CameraInput input;
        input.move = {1.0f, 0.0f, 1.0f};
        controller.update(input, 1.0f);
        CHECK(near(controller.position(), {2.5f, 0.0f, 2.5f}));

        input.move = {0.0f, -1.0f, 0.0f};
        controller.update(input, 2.0f);
        CHECK(near(controller.position(), {2.5f, -5.0f, 2.5f}));
    }

    SUBCASE("Boost scales the speed") {
        CameraInput input;
        input.move = {0.0f, 0.0f, 1.0f};
        input.boost = true;
        controller.setMoveSpeed(1.0f);
        controller.setBoostFactor(4.0f);
        controller.update(input, 0.5f);
        CHECK(near(controller.position(), {0.0f, 0.0f, 2.0f}));
    }

    SUBCASE("Look input is ignored unless enabled") {
        CameraInput input;
        input.lookDelta = {100.0f, 50.0f};
        controller.update(input, 0.016f);
        CHECK(controller.yaw() == doctest::Approx(90.0f));
        CHECK(controller.pitch() == doctest::Approx(0.0f));

        input.lookEnabled = true;
        controller.update(input, 0.016f);
        CHECK(controller.yaw() == doctest::Approx(80.0f));
        CHECK(controller.pitch() == doctest::Approx(-5.0f));
        // Turning right swings the front towards +X.
        CHECK(controller.front().x > 0.0f);
    }

    SUBCASE("Pitch is clamped") {
        CameraInput input;
        input.lookEnabled = true;
        input.lookDelta = {0.0f, -10000.0f};
        controller.update(input, 0.016f);
        CHECK(controller.pitch() == doctest::Approx(CameraController::kMaxPitch));
        input.lookDelta = {0.0f, 10000.0f};
        controller.update(input, 0.016f);
        CHECK(controller.pitch() == doctest::Approx(-CameraController::kMaxPitch));
    }
}

TEST_CASE("CameraController drives a free camera") {
    CameraController controller({1.0f, 2.0f, 3.0f}, 0.0f, 0.0f);
    Camera cam;

    CHECK(controller.applyToCamera(cam));
    CHECK(near(cam.position(), {1.0f, 2.0f, 3.0f}));
    CHECK(near(cam.forward(), controller.front()));
    CHECK(near(cam.forward(), {1.0f, 0.0f, 0.0f}));

    SUBCASE("Orbit cameras are left alone") {
        Camera orbit(Perspective{}, OrbitState{});
        const glm::vec3 position = orbit.position();
        CHECK_FALSE(controller.applyToCamera(orbit));
        CHECK(orbit.position() == position);
    }

    SUBCASE("Sync picks up the camera pose") {
        Camera other;
        other.setPosition({0.0f, 5.0f, 0.0f});
        other.lookAt({-3.0f, 5.0f, 3.0f});
        controller.syncFromCamera(other);
        CHECK(near(controller.position(), other.position()));
        CHECK(near(controller.front(), other.forward()));

        // Applying right after a sync changes nothing.
        controller.applyToCamera(other);
        CHECK(near(other.forward(), glm::normalize(glm::vec3(-1.0f, 0.0f, 1.0f))));
    }
}
