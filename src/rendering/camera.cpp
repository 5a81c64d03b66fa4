// Cubiq Rendering System
// camera.cpp - Camera implementation

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cmath>
#include <cubiq/rendering/camera.hpp>

namespace cubiq::rendering {

namespace {

const glm::vec3 WORLD_UP(0.0f, 1.0f, 0.0f);

}  // namespace

void Camera::set_rotation(float pitch, float yaw) {
    pitch_ = std::clamp(pitch, -MAX_PITCH, MAX_PITCH);
    yaw_ = yaw;
}

void Camera::look_at(const glm::vec3& target) {
    const glm::vec3 offset = target - position_;
    const float distance = glm::length(offset);
    if (distance < 1e-4f) {
        return;
    }

    const glm::vec3 dir = offset / distance;
    set_rotation(glm::degrees(std::asin(std::clamp(dir.y, -1.0f, 1.0f))), glm::degrees(std::atan2(dir.z, dir.x)));
}

glm::vec3 Camera::get_forward() const {
    const float pitch = glm::radians(pitch_);
    const float yaw = glm::radians(yaw_);
    return glm::normalize(glm::vec3(std::cos(yaw) * std::cos(pitch), std::sin(pitch), std::sin(yaw) * std::cos(pitch)));
}

glm::vec3 Camera::get_right() const {
    return glm::normalize(glm::cross(get_forward(), WORLD_UP));
}

glm::vec3 Camera::get_up() const {
    return glm::cross(get_right(), get_forward());
}

glm::mat4 Camera::get_view_matrix() const {
    return glm::lookAt(position_, position_ + get_forward(), WORLD_UP);
}

glm::mat4 Camera::get_projection_matrix(float aspect_ratio) const {
    return glm::perspective(glm::radians(config_.fov_degrees), aspect_ratio, config_.near_plane, config_.far_plane);
}

glm::mat4 Camera::get_view_projection_matrix(float aspect_ratio) const {
    return get_projection_matrix(aspect_ratio) * get_view_matrix();
}

void Camera::update_frustum(float aspect_ratio) {
    frustum_.extract_from_matrix(get_view_projection_matrix(aspect_ratio));
}

bool Camera::can_see(const AABB& bounds) const {
    return frustum_.is_visible(bounds);
}

}  // namespace cubiq::rendering
