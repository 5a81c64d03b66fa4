// Cubiq Rendering System
// frustum.cpp - Frustum culling implementation

#include <cubiq/rendering/frustum.hpp>

#include <glm/gtc/matrix_access.hpp>

namespace cubiq::rendering {

namespace {

glm::vec4 normalized_plane(const glm::vec4& plane) {
    float length = glm::length(glm::vec3(plane));
    return length > 1e-4f ? plane / length : plane;
}

}  // namespace

void Frustum::extract_from_matrix(const glm::mat4& view_projection) {
    const glm::vec4 w = glm::row(view_projection, 3);
    for (std::size_t axis = 0; axis < 3; ++axis) {
        const glm::vec4 r = glm::row(view_projection, static_cast<glm::length_t>(axis));
        planes_[axis * 2] = normalized_plane(w + r);
        planes_[axis * 2 + 1] = normalized_plane(w - r);
    }
}

bool Frustum::is_visible(const AABB& aabb) const {
    for (const auto& plane : planes_) {
        const glm::vec3 normal(plane);
        // Corner furthest along the normal
        const glm::vec3 corner = glm::mix(aabb.min, aabb.max, glm::greaterThanEqual(normal, glm::vec3(0.0f)));
        if (glm::dot(normal, corner) + plane.w < 0.0f) {
            return false;
        }
    }
    return true;
}

}  // namespace cubiq::rendering
