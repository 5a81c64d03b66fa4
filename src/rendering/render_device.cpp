// Cubiq Rendering System
// render_device.cpp - Headless backend

#include <cubiq/rendering/render_device.hpp>

namespace cubiq::rendering {

void HeadlessRenderDevice::draw_chunk(const Effect& effect, const ChunkDrawCall& call) {
    (void)effect;
    ++draw_calls_;
    quads_ += call.quads.size();
}

void HeadlessRenderDevice::reset_counters() {
    draw_calls_ = 0;
    quads_ = 0;
}

}  // namespace cubiq::rendering
