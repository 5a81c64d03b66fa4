// Cubiq World System
// world_renderer.cpp - Per-frame culling pass and rolling draw statistics

#include <cubiq/core/logger.hpp>
#include <cubiq/platform/timer.hpp>
#include <cubiq/rendering/camera.hpp>
#include <cubiq/rendering/effect.hpp>
#include <cubiq/world/chunk_store.hpp>
#include <cubiq/world/world_renderer.hpp>
#include <stdexcept>

namespace cubiq::world {

// ============================================================================
// DrawStats
// ============================================================================

DrawStats::DrawStats(double window_seconds) : window_seconds_(window_seconds) {
    if (!(window_seconds_ > 0.0)) {
        throw std::invalid_argument("Statistics window must be positive");
    }
}

std::optional<DrawStatsReport> DrawStats::record_frame(uint32_t chunks_drawn, double frame_seconds, double draw_ms) {
    ++frame_count_;
    chunk_total_ += chunks_drawn;
    game_time_ += frame_seconds;
    draw_time_ms_ += draw_ms;

    if (game_time_ < window_seconds_) {
        return std::nullopt;
    }

    DrawStatsReport report;
    report.frames = frame_count_;
    report.average_chunks = static_cast<double>(chunk_total_) / frame_count_;
    report.average_draw_ms = draw_time_ms_ / frame_count_;

    frame_count_ = 0;
    chunk_total_ = 0;
    game_time_ -= window_seconds_;
    draw_time_ms_ = 0.0;

    return report;
}

void DrawStats::reset() {
    frame_count_ = 0;
    chunk_total_ = 0;
    game_time_ = 0.0;
    draw_time_ms_ = 0.0;
}

// ============================================================================
// WorldRenderer
// ============================================================================

WorldRenderer::WorldRenderer(double stats_window_seconds) : stats_(stats_window_seconds) {}

uint32_t WorldRenderer::draw(ChunkStore& store, const rendering::Effect& effect, const rendering::ICameraView& camera,
                             double frame_seconds) {
    platform::Timer timer;
    uint32_t count = 0;

    store.for_each([&](const ChunkIndex&, Chunk& chunk) {
        if (!camera.can_see(chunk.get_bounds())) {
            return;
        }
        chunk.draw(effect);
        ++count;
    });

    double draw_ms = timer.elapsed_milliseconds();
    last_drawn_ = count;

    if (auto report = stats_.record_frame(count, frame_seconds, draw_ms)) {
        CUBIQ_LOG_INFO(core::log_category::RENDER, "{:.2f} chunks in {:.2f}ms", report->average_chunks,
                       report->average_draw_ms);
        last_report_ = report;
    }

    return count;
}

}  // namespace cubiq::world
