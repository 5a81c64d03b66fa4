// Cubiq Rendering System
// effect.hpp - Shading state shared by every chunk draw of a frame

#pragma once

#include <glm/glm.hpp>

#include <string>
#include <utility>

namespace cubiq::rendering {

class Effect {
public:
    explicit Effect(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string& get_name() const { return name_; }

    void set_view_projection(const glm::mat4& view_projection) { view_projection_ = view_projection; }
    [[nodiscard]] const glm::mat4& get_view_projection() const { return view_projection_; }

private:
    std::string name_;
    glm::mat4 view_projection_{1.0f};
};

}  // namespace cubiq::rendering
