// Cubiq Platform Abstraction Layer
// timer.hpp - Stopwatch and frame pacing over steady_clock

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace cubiq::platform {

// Stopwatch that starts running on construction. Time spent paused is not
// counted.
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::nanoseconds;

    Timer();

    void reset();
    void pause();
    void resume();
    [[nodiscard]] bool is_paused() const { return !running_; }

    [[nodiscard]] Duration elapsed() const;
    [[nodiscard]] double elapsed_seconds() const;
    [[nodiscard]] double elapsed_milliseconds() const;
    [[nodiscard]] double elapsed_microseconds() const;

private:
    Duration banked_{0};  // Sum of completed running segments
    TimePoint segment_start_;
    bool running_ = true;
};

// Per-frame timing for the host loop:
//   begin_frame(); ...work...; wait_for_target_frame_time(); end_frame();
class FrameTimer {
public:
    static constexpr std::size_t HISTORY_SIZE = 120;

    FrameTimer();

    void begin_frame();
    void end_frame();

    // Last completed frame
    [[nodiscard]] double get_delta_time() const;
    [[nodiscard]] double get_delta_time_ms() const;

    // Mean over the most recent HISTORY_SIZE frames, in milliseconds
    [[nodiscard]] double get_average_frame_time() const;

    // Non-positive rates are ignored
    void set_target_fps(double fps);
    [[nodiscard]] double get_target_fps() const;
    void set_frame_limiting_enabled(bool enabled) { limit_ = enabled; }
    [[nodiscard]] bool is_frame_limiting_enabled() const { return limit_; }

    // Sleeps until the current frame has lasted the target frame time
    void wait_for_target_frame_time() const;

    [[nodiscard]] double get_total_time() const { return lifetime_.elapsed_seconds(); }
    [[nodiscard]] uint64_t get_frame_count() const { return frame_count_; }

private:
    Timer lifetime_;
    Timer::TimePoint frame_start_;
    Timer::Duration last_frame_{0};
    Timer::Duration target_frame_{std::chrono::microseconds(16667)};
    bool limit_ = false;

    std::array<Timer::Duration, HISTORY_SIZE> history_{};
    Timer::Duration history_sum_{0};
    uint64_t frame_count_ = 0;
};

}  // namespace cubiq::platform
