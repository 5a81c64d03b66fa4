// Cubiq World System
// world_renderer.hpp - Per-frame culling pass and rolling draw statistics

#pragma once

#include <cstdint>
#include <optional>

namespace cubiq::rendering {
class Effect;
class ICameraView;
}  // namespace cubiq::rendering

namespace cubiq::world {

class ChunkStore;

// Averages over one closed statistics window
struct DrawStatsReport {
    uint32_t frames = 0;
    double average_chunks = 0.0;   // Chunks drawn per frame
    double average_draw_ms = 0.0;  // Draw pass time per frame
};

// Rolling accumulators owned by the render thread. When the summed game time
// reaches the window, a report is produced and the counters restart; the
// game time beyond the window is carried into the next one.
class DrawStats {
public:
    // Throws std::invalid_argument for a non-positive window
    explicit DrawStats(double window_seconds = 1.0);

    [[nodiscard]] std::optional<DrawStatsReport> record_frame(uint32_t chunks_drawn, double frame_seconds,
                                                              double draw_ms);

    [[nodiscard]] double get_window() const { return window_seconds_; }
    [[nodiscard]] uint32_t get_frame_count() const { return frame_count_; }
    [[nodiscard]] uint64_t get_chunk_total() const { return chunk_total_; }
    [[nodiscard]] double get_game_time() const { return game_time_; }
    [[nodiscard]] double get_draw_time_ms() const { return draw_time_ms_; }

    void reset();

private:
    double window_seconds_;
    uint32_t frame_count_ = 0;
    uint64_t chunk_total_ = 0;
    double game_time_ = 0.0;
    double draw_time_ms_ = 0.0;
};

class WorldRenderer {
public:
    explicit WorldRenderer(double stats_window_seconds = 1.0);

    // Draws every chunk the camera can see, holding the store lock for the
    // whole pass. Returns the number of chunks drawn by this call.
    uint32_t draw(ChunkStore& store, const rendering::Effect& effect, const rendering::ICameraView& camera,
                  double frame_seconds);

    [[nodiscard]] uint32_t get_last_drawn() const { return last_drawn_; }
    [[nodiscard]] const std::optional<DrawStatsReport>& get_last_report() const { return last_report_; }
    [[nodiscard]] const DrawStats& get_stats() const { return stats_; }

private:
    DrawStats stats_;
    uint32_t last_drawn_ = 0;
    std::optional<DrawStatsReport> last_report_;
};

}  // namespace cubiq::world
