// Cubiq Rendering System
// render_device.hpp - Rendering backend interface

#pragma once

#include "effect.hpp"
#include "frustum.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <span>

namespace cubiq::rendering {

// One textured face of a block
struct MeshQuad {
    glm::vec3 origin{0.0f};  // Minimum corner of the owning block, world space
    uint8_t face = 0;        // Direction index, see world::Direction
    glm::vec4 uv{0.0f};
};

struct ChunkDrawCall {
    glm::vec3 origin{0.0f};
    AABB bounds;
    std::span<const MeshQuad> quads;
};

// Rendering backend. The world hands it to chunks and never calls it directly.
class RenderDevice {
public:
    virtual ~RenderDevice() = default;

    virtual void draw_chunk(const Effect& effect, const ChunkDrawCall& call) = 0;
};

// Backend without a GPU: records what would have been submitted
class HeadlessRenderDevice : public RenderDevice {
public:
    void draw_chunk(const Effect& effect, const ChunkDrawCall& call) override;

    [[nodiscard]] uint64_t get_draw_call_count() const { return draw_calls_; }
    [[nodiscard]] uint64_t get_quad_count() const { return quads_; }
    void reset_counters();

private:
    uint64_t draw_calls_ = 0;
    uint64_t quads_ = 0;
};

}  // namespace cubiq::rendering
