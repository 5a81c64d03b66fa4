// Cubiq Platform Abstraction Layer
// timer.cpp - Timer implementation

#include <cubiq/platform/timer.hpp>

#include <algorithm>
#include <thread>

namespace cubiq::platform {

namespace {

double to_seconds(Timer::Duration d) {
    return std::chrono::duration<double>(d).count();
}

}  // namespace

Timer::Timer() : segment_start_(Clock::now()) {}

void Timer::reset() {
    banked_ = Duration{0};
    segment_start_ = Clock::now();
    running_ = true;
}

void Timer::pause() {
    if (running_) {
        banked_ += Clock::now() - segment_start_;
        running_ = false;
    }
}

void Timer::resume() {
    if (!running_) {
        segment_start_ = Clock::now();
        running_ = true;
    }
}

Timer::Duration Timer::elapsed() const {
    return running_ ? banked_ + (Clock::now() - segment_start_) : banked_;
}

double Timer::elapsed_seconds() const {
    return to_seconds(elapsed());
}

double Timer::elapsed_milliseconds() const {
    return std::chrono::duration<double, std::milli>(elapsed()).count();
}

double Timer::elapsed_microseconds() const {
    return std::chrono::duration<double, std::micro>(elapsed()).count();
}

FrameTimer::FrameTimer() : frame_start_(Timer::Clock::now()) {}

void FrameTimer::begin_frame() {
    frame_start_ = Timer::Clock::now();
}

void FrameTimer::end_frame() {
    last_frame_ = Timer::Clock::now() - frame_start_;

    auto& slot = history_[frame_count_ % HISTORY_SIZE];
    history_sum_ += last_frame_ - slot;
    slot = last_frame_;
    ++frame_count_;
}

double FrameTimer::get_delta_time() const {
    return to_seconds(last_frame_);
}

double FrameTimer::get_delta_time_ms() const {
    return get_delta_time() * 1000.0;
}

double FrameTimer::get_average_frame_time() const {
    auto samples = std::min<uint64_t>(frame_count_, HISTORY_SIZE);
    if (samples == 0) {
        return 0.0;
    }
    return to_seconds(history_sum_) * 1000.0 / static_cast<double>(samples);
}

void FrameTimer::set_target_fps(double fps) {
    if (fps <= 0.0) {
        return;
    }
    target_frame_ = std::chrono::duration_cast<Timer::Duration>(std::chrono::duration<double>(1.0 / fps));
}

double FrameTimer::get_target_fps() const {
    return 1.0 / to_seconds(target_frame_);
}

void FrameTimer::wait_for_target_frame_time() const {
    if (limit_) {
        std::this_thread::sleep_until(frame_start_ + target_frame_);
    }
}

}  // namespace cubiq::platform
