// Cubiq Rendering System
// camera.hpp - Camera and the visibility predicate used for culling

#pragma once

#include "frustum.hpp"

#include <glm/glm.hpp>

namespace cubiq::rendering {

// Visibility predicate consumed by the world renderer
class ICameraView {
public:
    virtual ~ICameraView() = default;

    [[nodiscard]] virtual bool can_see(const AABB& bounds) const = 0;
};

struct CameraConfig {
    float fov_degrees = 70.0f;
    float near_plane = 0.1f;
    float far_plane = 1000.0f;
};

// Perspective camera oriented by pitch/yaw. can_see() answers against the
// frustum captured by the most recent update_frustum(), so a frame culls
// with one consistent view even if the camera moves mid-frame.
class Camera : public ICameraView {
public:
    Camera() = default;
    explicit Camera(const CameraConfig& config) : config_(config) {}

    void set_position(const glm::vec3& position) { position_ = position; }
    [[nodiscard]] const glm::vec3& get_position() const { return position_; }

    // Degrees; yaw 0 faces +X, -90 faces -Z. Pitch is clamped to [-89, 89].
    void set_rotation(float pitch, float yaw);
    [[nodiscard]] float get_pitch() const { return pitch_; }
    [[nodiscard]] float get_yaw() const { return yaw_; }

    // No-op when target coincides with the camera position
    void look_at(const glm::vec3& target);

    [[nodiscard]] glm::vec3 get_forward() const;
    [[nodiscard]] glm::vec3 get_right() const;
    [[nodiscard]] glm::vec3 get_up() const;

    [[nodiscard]] glm::mat4 get_view_matrix() const;
    [[nodiscard]] glm::mat4 get_projection_matrix(float aspect_ratio) const;
    [[nodiscard]] glm::mat4 get_view_projection_matrix(float aspect_ratio) const;

    void update_frustum(float aspect_ratio);
    [[nodiscard]] const Frustum& get_frustum() const { return frustum_; }

    [[nodiscard]] bool can_see(const AABB& bounds) const override;

    [[nodiscard]] const CameraConfig& get_config() const { return config_; }

private:
    static constexpr float MAX_PITCH = 89.0f;

    CameraConfig config_;
    Frustum frustum_;
    glm::vec3 position_{0.0f};
    float pitch_ = 0.0f;
    float yaw_ = -90.0f;
};

}  // namespace cubiq::rendering
