// Cubiq World System
// chunk_store.cpp - Chunk map guarded by a single lock

#include <cubiq/world/chunk_store.hpp>

namespace cubiq::world {

bool ChunkStore::insert_if_absent(const ChunkIndex& index, const ChunkFactory& factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunks_.contains(index)) {
        return false;
    }

    auto chunk = factory();
    if (!chunk) {
        return false;
    }
    chunks_.emplace(index, std::move(chunk));
    return true;
}

bool ChunkStore::insert(const ChunkIndex& index, std::unique_ptr<Chunk>& chunk) {
    if (!chunk) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (chunks_.contains(index)) {
        return false;
    }
    chunks_.emplace(index, std::move(chunk));
    return true;
}

bool ChunkStore::contains(const ChunkIndex& index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.contains(index);
}

Chunk* ChunkStore::find(const ChunkIndex& index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find(index);
    return it != chunks_.end() ? it->second.get() : nullptr;
}

const Chunk* ChunkStore::find(const ChunkIndex& index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find(index);
    return it != chunks_.end() ? it->second.get() : nullptr;
}

size_t ChunkStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

std::vector<ChunkIndex> ChunkStore::indices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkIndex> result;
    result.reserve(chunks_.size());
    for (const auto& [index, chunk] : chunks_) {
        result.push_back(index);
    }
    return result;
}

void ChunkStore::for_each(const Visitor& visitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [index, chunk] : chunks_) {
        visitor(index, *chunk);
    }
}

void ChunkStore::for_each(const ConstVisitor& visitor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [index, chunk] : chunks_) {
        visitor(index, *chunk);
    }
}

void ChunkStore::dispose_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [index, chunk] : chunks_) {
        chunk->dispose();
    }
    chunks_.clear();
}

}  // namespace cubiq::world
