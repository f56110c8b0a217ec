#include "orrery/scene/transform.hpp"

#include <glm/geometric.hpp>
#include <glm/gtx/matrix_decompose.hpp>

namespace orrery::scene
{
    Transform Transform::fromMatrix(const glm::mat4& m)
    {
        Transform out{};
        glm::vec3 skew{};
        glm::vec4 perspective{};
        if (glm::decompose(m, out.m_scale, out.m_rotation, out.m_translation, skew, perspective))
        {
            out.m_rotation = glm::normalize(out.m_rotation);
            return out;
        }

        // Singular basis (a zero scale axis): keep translation and axis lengths only.
        out.m_translation = glm::vec3(m[3]);
        out.m_rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
        out.m_scale = {glm::length(glm::vec3(m[0])), glm::length(glm::vec3(m[1])), glm::length(glm::vec3(m[2]))};
        return out;
    }
} // namespace orrery::scene
