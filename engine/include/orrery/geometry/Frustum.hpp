#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstddef>
#include "orrery/geometry/Bounds.hpp"

namespace orrery::geometry {

    // Points with dot(normal, p) + distance >= 0 are on the inner side.
    struct Plane {
        glm::vec3 normal{0.0f};
        float distance = 0.0f;

        static Plane fromVec4(const glm::vec4& v) { return Plane{glm::vec3(v), v.w}; }
        glm::vec4 asVec4() const { return glm::vec4(normal, distance); }
    };

    // Rescales so the normal has unit length. A zero normal is returned unchanged.
    inline Plane normalizePlane(const Plane& p) {
        const float len = glm::length(p.normal);
        if (len == 0.0f) {
            return p;
        }
        return Plane{p.normal / len, p.distance / len};
    }

    // Metric only when the plane is normalized.
    inline float signedDistance(const Plane& p, const glm::vec3& point) {
        return glm::dot(p.normal, point) + p.distance;
    }

    struct Frustum {
        enum Side : size_t { Left = 0, Right, Bottom, Top, Near, Far, Count };

        std::array<Plane, Count> planes{};

        // Gribb-Hartmann extraction for a [0, 1] clip depth (Vulkan / D3D).
        static Frustum extractPlanes(const glm::mat4& viewProj, bool normalize);
        // Same for a [-1, 1] clip depth (OpenGL).
        static Frustum extractPlanesGL(const glm::mat4& viewProj, bool normalize);

        bool containsPoint(const glm::vec3& p) const {
            for (const Plane& plane : planes) {
                if (signedDistance(plane, p) < 0.0f) return false;
            }
            return true;
        }

        // Planes must be normalized for the radius comparison to mean anything.
        bool intersectsSphere(const glm::vec3& center, float radius) const {
            for (const Plane& plane : planes) {
                if (signedDistance(plane, center) < -radius) return false;
            }
            return true;
        }

        bool intersectsSphere(const BoundingSphere& s) const { return intersectsSphere(s.center, s.radius); }

        // Conservative: tests the box corner furthest along each plane normal.
        bool intersectsBox(const BoundingBox& b) const {
            for (const Plane& plane : planes) {
                const glm::vec3 positive{
                    plane.normal.x > 0.0f ? b.m_max.x : b.m_min.x,
                    plane.normal.y > 0.0f ? b.m_max.y : b.m_min.y,
                    plane.normal.z > 0.0f ? b.m_max.z : b.m_min.z,
                };
                if (signedDistance(plane, positive) < 0.0f) return false;
            }
            return true;
        }
    };

    namespace detail {
        inline Frustum planesFromRows(const glm::mat4& vp, bool glDepth, bool normalize) {
            // glm is column-major: transposing turns rows of vp into columns.
            const glm::mat4 t = glm::transpose(vp);
            Frustum f;
            f.planes[Frustum::Left] = Plane::fromVec4(t[3] + t[0]);
            f.planes[Frustum::Right] = Plane::fromVec4(t[3] - t[0]);
            f.planes[Frustum::Bottom] = Plane::fromVec4(t[3] + t[1]);
            f.planes[Frustum::Top] = Plane::fromVec4(t[3] - t[1]);
            f.planes[Frustum::Near] = Plane::fromVec4(glDepth ? t[3] + t[2] : t[2]);
            f.planes[Frustum::Far] = Plane::fromVec4(t[3] - t[2]);

            if (normalize) {
                for (Plane& p : f.planes) {
                    p = normalizePlane(p);
                }
            }
            return f;
        }
    }

    inline Frustum Frustum::extractPlanes(const glm::mat4& viewProj, bool normalize) {
        return detail::planesFromRows(viewProj, false, normalize);
    }

    inline Frustum Frustum::extractPlanesGL(const glm::mat4& viewProj, bool normalize) {
        return detail::planesFromRows(viewProj, true, normalize);
    }

    // World-space corners of a [0, 1] depth frustum: near quad first, then far quad.
    inline std::array<glm::vec3, 8> frustumCorners(const glm::mat4& viewProj) {
        const glm::vec4 ndcCorners[8] = {
            {-1, -1, 0, 1}, { 1, -1, 0, 1},
            { 1,  1, 0, 1}, {-1,  1, 0, 1},
            {-1, -1, 1, 1}, { 1, -1, 1, 1},
            { 1,  1, 1, 1}, {-1,  1, 1, 1}
        };

        const glm::mat4 invVP = glm::inverse(viewProj);
        std::array<glm::vec3, 8> points{};
        for (int i = 0; i < 8; i++) {
            const glm::vec4 q = invVP * ndcCorners[i];
            points[i] = glm::vec3(q) / q.w;
        }
        return points;
    }
}
