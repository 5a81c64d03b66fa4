// Cubiq Rendering System
// sprite_sheet.cpp - Texture atlas implementation

#include <cubiq/rendering/sprite_sheet.hpp>

#include <stdexcept>

namespace cubiq::rendering {

SpriteSheet::SpriteSheet(uint32_t texture_width, uint32_t texture_height, uint32_t sprite_size)
    : texture_width_(texture_width), texture_height_(texture_height), sprite_size_(sprite_size) {
    if (sprite_size == 0 || sprite_size > texture_width || sprite_size > texture_height) {
        throw std::invalid_argument("sprite size must be non-zero and fit inside the texture");
    }
    columns_ = texture_width / sprite_size;
    rows_ = texture_height / sprite_size;
}

glm::vec4 SpriteSheet::get_uv(uint32_t sprite_index) const {
    uint32_t index = sprite_index % get_sprite_count();
    uint32_t column = index % columns_;
    uint32_t row = index / columns_;

    float u0 = static_cast<float>(column * sprite_size_) / static_cast<float>(texture_width_);
    float v0 = static_cast<float>(row * sprite_size_) / static_cast<float>(texture_height_);
    float u1 = static_cast<float>((column + 1) * sprite_size_) / static_cast<float>(texture_width_);
    float v1 = static_cast<float>((row + 1) * sprite_size_) / static_cast<float>(texture_height_);
    return {u0, v0, u1, v1};
}

}  // namespace cubiq::rendering
