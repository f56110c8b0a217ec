#pragma once

#include <glm/glm.hpp>
#include <limits>

namespace orrery::geometry {

    struct BoundingBox {
        glm::vec3 m_min{std::numeric_limits<float>::max()};
        glm::vec3 m_max{std::numeric_limits<float>::lowest()};

        bool isValid() const {
            return m_min.x <= m_max.x && m_min.y <= m_max.y && m_min.z <= m_max.z;
        }
        glm::vec3 center() const { return (m_min + m_max) * 0.5f; }
        glm::vec3 extents() const { return (m_max - m_min) * 0.5f; }

        void expand(const glm::vec3& p) {
            m_min = glm::min(m_min, p);
            m_max = glm::max(m_max, p);
        }
    };

    struct BoundingSphere {
        glm::vec3 center{0.0f};
        float radius = 0.0f;
    };

    // World-space AABB of a transformed box (center/extent form, exact for affine m).
    inline BoundingBox transformBox(const BoundingBox& b, const glm::mat4& m) {
        const glm::vec3 c = b.center();
        const glm::vec3 e = b.extents();

        const glm::vec3 wc = glm::vec3(m * glm::vec4(c, 1.0f));

        const glm::mat3 r(m);
        const glm::mat3 absR(glm::abs(r[0]), glm::abs(r[1]), glm::abs(r[2]));
        const glm::vec3 we = absR * e;

        BoundingBox out{};
        out.m_min = wc - we;
        out.m_max = wc + we;
        return out;
    }

    inline BoundingSphere boundingSphere(const BoundingBox& b) {
        return BoundingSphere{b.center(), glm::length(b.extents())};
    }
}
