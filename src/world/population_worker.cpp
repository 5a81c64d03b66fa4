// Cubiq World System
// population_worker.cpp - One-shot background fill of the region around the origin

#include <cubiq/core/logger.hpp>
#include <cubiq/platform/timer.hpp>
#include <cubiq/world/population_worker.hpp>
#include <exception>
#include <fmt/format.h>
#include <stdexcept>

namespace cubiq::world {

PopulationWorker::PopulationWorker(int32_t radius, CreateCallback create) : radius_(radius), create_(std::move(create)) {
    if (radius_ < 0 || radius_ > MAX_POPULATION_RADIUS) {
        throw std::invalid_argument(fmt::format("Population radius {} outside [0, {}]", radius_, MAX_POPULATION_RADIUS));
    }
    if (!create_) {
        throw std::invalid_argument("Population worker needs a create callback");
    }
}

PopulationWorker::~PopulationWorker() {
    request_stop();
    join();
}

void PopulationWorker::start() {
    if (started_) {
        return;
    }
    started_ = true;
    thread_ = std::thread([this] { run(); });
}

void PopulationWorker::request_stop() {
    should_stop_ = true;
}

bool PopulationWorker::wait_for(std::chrono::milliseconds timeout) {
    if (!started_) {
        return true;
    }

    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (!finished_cv_.wait_for(lock, timeout, [this] { return finished_; })) {
            return false;
        }
    }

    // The thread is past its last use of shared state, so this join is short
    if (thread_.joinable()) {
        thread_.join();
    }
    return true;
}

void PopulationWorker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool PopulationWorker::is_finished() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return finished_;
}

std::string PopulationWorker::failure_message() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return failure_message_;
}

uint64_t PopulationWorker::candidate_count() const {
    auto side = static_cast<uint64_t>(radius_) * 2 + 1;
    return side * side * side;
}

void PopulationWorker::run() {
    platform::Timer timer;

    try {
        for (int32_t x = -radius_; x <= radius_; ++x) {
            for (int32_t y = -radius_; y <= radius_; ++y) {
                for (int32_t z = -radius_; z <= radius_; ++z) {
                    if (should_stop_) {
                        cancelled_ = true;
                        CUBIQ_LOG_INFO(core::log_category::WORLD, "World population cancelled after {} of {} chunks",
                                       processed_.load(), candidate_count());
                        finish();
                        return;
                    }
                    create_(ChunkIndex(x, y, z));
                    ++processed_;
                }
            }
        }
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            failure_message_ = e.what();
        }
        failed_ = true;
        CUBIQ_LOG_CRITICAL(core::log_category::WORLD, "World population failed after {} chunks: {}",
                           processed_.load(), e.what());
        finish();
        return;
    }

    CUBIQ_LOG_INFO(core::log_category::WORLD, "World creation complete: {} chunks in {:.2f}ms", processed_.load(),
                   timer.elapsed_milliseconds());
    finish();
}

void PopulationWorker::finish() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        finished_ = true;
    }
    finished_cv_.notify_all();
}

}  // namespace cubiq::world
