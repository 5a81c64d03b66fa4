// Cubiq World System
// population_worker.hpp - One-shot background fill of the region around the origin

#pragma once

#include "types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace cubiq::world {

// Largest accepted radius: 129^3 candidate chunks
inline constexpr int32_t MAX_POPULATION_RADIUS = 64;

// Visits every index in [-radius, radius] on all three axes on its own thread,
// x outermost, z innermost, and hands each to the creation callback. The
// callback must tolerate indices that already exist.
class PopulationWorker {
public:
    using CreateCallback = std::function<void(const ChunkIndex&)>;

    // Throws std::invalid_argument for a radius outside [0, MAX_POPULATION_RADIUS]
    PopulationWorker(int32_t radius, CreateCallback create);

    // Requests stop and blocks until the thread has exited
    ~PopulationWorker();

    PopulationWorker(const PopulationWorker&) = delete;
    PopulationWorker& operator=(const PopulationWorker&) = delete;

    void start();

    // Checked between two callback invocations
    void request_stop();

    // True once the thread has finished (completed, cancelled or failed).
    // False means the timeout elapsed with the thread still running.
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout);

    // Blocks until the thread has finished
    void join();

    [[nodiscard]] bool is_started() const { return started_; }
    [[nodiscard]] bool is_finished() const;
    [[nodiscard]] bool was_cancelled() const { return cancelled_; }
    [[nodiscard]] bool has_failed() const { return failed_; }
    [[nodiscard]] std::string failure_message() const;

    [[nodiscard]] uint64_t processed_count() const { return processed_; }
    [[nodiscard]] uint64_t candidate_count() const;

private:
    void run();
    void finish();

    int32_t radius_;
    CreateCallback create_;

    std::thread thread_;
    bool started_ = false;
    std::atomic<bool> should_stop_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> failed_{false};
    std::atomic<uint64_t> processed_{0};

    mutable std::mutex state_mutex_;
    std::condition_variable finished_cv_;
    bool finished_ = false;
    std::string failure_message_;
};

}  // namespace cubiq::world
