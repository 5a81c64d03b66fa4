// Cubiq World System
// chunk_store.hpp - Chunk map guarded by a single lock

#pragma once

#include "chunk.hpp"
#include "types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace cubiq::world {

// Every insert and every full iteration take the same mutex, and iteration
// holds it until the visitor has seen all entries.
class ChunkStore {
public:
    using ChunkFactory = std::function<std::unique_ptr<Chunk>()>;
    using Visitor = std::function<void(const ChunkIndex&, Chunk&)>;
    using ConstVisitor = std::function<void(const ChunkIndex&, const Chunk&)>;

    ChunkStore() = default;
    ~ChunkStore() = default;

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    /// Runs factory under the lock only if index is absent.
    /// Returns true if a chunk was inserted. A null factory result inserts nothing.
    bool insert_if_absent(const ChunkIndex& index, const ChunkFactory& factory);

    /// Returns false (and leaves chunk untouched in the caller's hands) if index exists
    bool insert(const ChunkIndex& index, std::unique_ptr<Chunk>& chunk);

    [[nodiscard]] bool contains(const ChunkIndex& index) const;

    // Chunks are never removed before dispose_all(), so the pointer stays valid until then
    [[nodiscard]] Chunk* find(const ChunkIndex& index);
    [[nodiscard]] const Chunk* find(const ChunkIndex& index) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<ChunkIndex> indices() const;

    void for_each(const Visitor& visitor);
    void for_each(const ConstVisitor& visitor) const;

    /// Disposes and destroys every chunk
    void dispose_all();

private:
    std::unordered_map<ChunkIndex, std::unique_ptr<Chunk>> chunks_;
    mutable std::mutex mutex_;
};

}  // namespace cubiq::world
