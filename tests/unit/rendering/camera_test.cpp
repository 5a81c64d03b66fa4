// Cubiq Rendering Tests
// camera_test.cpp - Camera orientation and visibility predicate tests

#include <gtest/gtest.h>

#include <cubiq/rendering/camera.hpp>

namespace cubiq::rendering {
namespace {

constexpr float ASPECT = 16.0f / 9.0f;

class CameraTest : public ::testing::Test {
protected:
    Camera camera_;
};

TEST_F(CameraTest, DefaultsFaceNegativeZ) {
    glm::vec3 forward = camera_.get_forward();
    EXPECT_NEAR(forward.x, 0.0f, 1e-5f);
    EXPECT_NEAR(forward.y, 0.0f, 1e-5f);
    EXPECT_NEAR(forward.z, -1.0f, 1e-5f);
}

TEST_F(CameraTest, PitchIsClamped) {
    camera_.set_rotation(120.0f, 0.0f);
    EXPECT_FLOAT_EQ(camera_.get_pitch(), 89.0f);

    camera_.set_rotation(-120.0f, 0.0f);
    EXPECT_FLOAT_EQ(camera_.get_pitch(), -89.0f);
}

TEST_F(CameraTest, BasisIsOrthonormal) {
    camera_.set_rotation(30.0f, 45.0f);

    EXPECT_NEAR(glm::dot(camera_.get_forward(), camera_.get_right()), 0.0f, 1e-5f);
    EXPECT_NEAR(glm::dot(camera_.get_forward(), camera_.get_up()), 0.0f, 1e-5f);
    EXPECT_NEAR(glm::length(camera_.get_right()), 1.0f, 1e-5f);
}

TEST_F(CameraTest, LookAtPointsForward) {
    camera_.set_position(glm::vec3(40.0f, 12.0f, 0.0f));
    camera_.look_at(glm::vec3(0.0f));

    glm::vec3 expected = glm::normalize(glm::vec3(-40.0f, -12.0f, 0.0f));
    glm::vec3 forward = camera_.get_forward();
    EXPECT_NEAR(forward.x, expected.x, 1e-4f);
    EXPECT_NEAR(forward.y, expected.y, 1e-4f);
    EXPECT_NEAR(forward.z, expected.z, 1e-4f);
}

TEST_F(CameraTest, LookAtOwnPositionIsIgnored) {
    camera_.set_rotation(10.0f, 20.0f);
    camera_.look_at(camera_.get_position());

    EXPECT_FLOAT_EQ(camera_.get_pitch(), 10.0f);
    EXPECT_FLOAT_EQ(camera_.get_yaw(), 20.0f);
}

TEST_F(CameraTest, CanSeeUsesUpdatedFrustum) {
    camera_.set_position(glm::vec3(0.0f, 0.0f, 40.0f));
    camera_.look_at(glm::vec3(0.0f));
    camera_.update_frustum(ASPECT);

    EXPECT_TRUE(camera_.can_see(AABB::from_cube(glm::vec3(-4.0f), 8.0f)));
    EXPECT_FALSE(camera_.can_see(AABB::from_cube(glm::vec3(-4.0f, -4.0f, 60.0f), 8.0f)));

    // Turning around without refreshing keeps the old frustum
    camera_.set_rotation(0.0f, 90.0f);
    EXPECT_TRUE(camera_.can_see(AABB::from_cube(glm::vec3(-4.0f), 8.0f)));

    camera_.update_frustum(ASPECT);
    EXPECT_FALSE(camera_.can_see(AABB::from_cube(glm::vec3(-4.0f), 8.0f)));
}

TEST_F(CameraTest, CanSeeThroughInterface) {
    camera_.update_frustum(ASPECT);
    const ICameraView& view = camera_;

    EXPECT_TRUE(view.can_see(AABB::from_cube(glm::vec3(-4.0f, -4.0f, -30.0f), 8.0f)));
    EXPECT_FALSE(view.can_see(AABB::from_cube(glm::vec3(-4.0f, -4.0f, 30.0f), 8.0f)));
}

}  // namespace
}  // namespace cubiq::rendering
