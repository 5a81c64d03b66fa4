// Cubiq Rendering System
// frustum.hpp - Chunk bounds and view frustum culling

#pragma once

#include <glm/glm.hpp>

#include <array>
#include <cstddef>

namespace cubiq::rendering {

struct AABB {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};

    [[nodiscard]] glm::vec3 get_center() const { return (min + max) * 0.5f; }
    [[nodiscard]] glm::vec3 get_size() const { return max - min; }

    // Cube of the given edge length with its minimum corner at origin
    static AABB from_cube(const glm::vec3& origin, float size) { return {origin, origin + glm::vec3(size)}; }
};

// Six clip planes stored as (normal.xyz, distance), normals pointing inward.
// A default-constructed frustum accepts everything.
class Frustum {
public:
    enum Side : std::size_t { Left, Right, Bottom, Top, Near, Far, SideCount };

    using Planes = std::array<glm::vec4, SideCount>;

    // Gribb-Hartmann extraction, OpenGL clip space
    void extract_from_matrix(const glm::mat4& view_projection);

    // False only when the box lies entirely behind some plane
    [[nodiscard]] bool is_visible(const AABB& aabb) const;

    [[nodiscard]] const Planes& get_planes() const { return planes_; }

private:
    Planes planes_{};
};

}  // namespace cubiq::rendering
