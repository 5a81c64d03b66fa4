// Cubiq Rendering System
// sprite_sheet.hpp - Fixed-grid texture atlas

#pragma once

#include <glm/glm.hpp>

#include <cstdint>

namespace cubiq::rendering {

// Atlas of equally sized square sprites laid out row-major from the top-left
class SpriteSheet {
public:
    // Throws std::invalid_argument if the sprite size is zero or larger than the texture
    SpriteSheet(uint32_t texture_width, uint32_t texture_height, uint32_t sprite_size);

    [[nodiscard]] uint32_t get_columns() const { return columns_; }
    [[nodiscard]] uint32_t get_rows() const { return rows_; }
    [[nodiscard]] uint32_t get_sprite_count() const { return columns_ * rows_; }

    // UV rectangle (u0, v0, u1, v1); indices wrap around the sprite count
    [[nodiscard]] glm::vec4 get_uv(uint32_t sprite_index) const;

private:
    uint32_t texture_width_;
    uint32_t texture_height_;
    uint32_t sprite_size_;
    uint32_t columns_;
    uint32_t rows_;
};

}  // namespace cubiq::rendering
