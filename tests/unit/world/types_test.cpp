// Cubiq World System Tests
// types_test.cpp - Chunk index and block layout tests

#include <gtest/gtest.h>

#include <cubiq/world/types.hpp>

#include <unordered_map>
#include <unordered_set>

namespace cubiq::world {
namespace {

TEST(ChunkIndexTest, EqualTriplesAreSameKey) {
    std::unordered_map<ChunkIndex, int> map;
    map[ChunkIndex(1, -2, 3)] = 7;

    ChunkIndex other(1, -2, 3);
    ASSERT_TRUE(map.contains(other));
    EXPECT_EQ(map[other], 7);
    EXPECT_EQ(map.size(), 1u);
}

TEST(ChunkIndexTest, HashMatchesForEqualValues) {
    std::hash<ChunkIndex> hasher;
    EXPECT_EQ(hasher(ChunkIndex(-3, 0, 3)), hasher(ChunkIndex(-3, 0, 3)));
}

TEST(ChunkIndexTest, PermutationsAreDistinct) {
    std::unordered_set<ChunkIndex> set;
    set.insert(ChunkIndex(1, 2, 3));
    set.insert(ChunkIndex(3, 2, 1));
    set.insert(ChunkIndex(2, 1, 3));
    set.insert(ChunkIndex(1, 2, 3));

    EXPECT_EQ(set.size(), 3u);
}

TEST(ChunkIndexTest, CubeAroundOriginHasNoCollisionsInSet) {
    std::unordered_set<ChunkIndex> set;
    for (int x = -3; x <= 3; ++x) {
        for (int y = -3; y <= 3; ++y) {
            for (int z = -3; z <= 3; ++z) {
                set.insert(ChunkIndex(x, y, z));
            }
        }
    }
    EXPECT_EQ(set.size(), 343u);
}

TEST(ChunkIndexTest, WorldPositionScalesByChunkSize) {
    EXPECT_EQ(chunk_index_to_world(ChunkIndex(0, 0, 0)), glm::vec3(0.0f));
    EXPECT_EQ(chunk_index_to_world(ChunkIndex(1, -2, 3)), glm::vec3(8.0f, -16.0f, 24.0f));
    EXPECT_EQ(chunk_index_to_world(ChunkIndex(-1000, 0, 1000)), glm::vec3(-8000.0f, 0.0f, 8000.0f));
}

TEST(BlockLayoutTest, LocalIndexCoversVolume) {
    EXPECT_EQ(local_to_index(LocalBlockPos(0, 0, 0)), 0u);
    EXPECT_EQ(local_to_index(LocalBlockPos(1, 0, 0)), 1u);
    EXPECT_EQ(local_to_index(LocalBlockPos(0, 0, 1)), static_cast<size_t>(CHUNK_SIZE));
    EXPECT_EQ(local_to_index(LocalBlockPos(0, 1, 0)), static_cast<size_t>(CHUNK_SIZE * CHUNK_SIZE));
    EXPECT_EQ(local_to_index(LocalBlockPos(7, 7, 7)), static_cast<size_t>(CHUNK_VOLUME - 1));
}

TEST(BlockLayoutTest, LocalBounds) {
    EXPECT_TRUE(is_valid_local(LocalBlockPos(0, 7, 3)));
    EXPECT_FALSE(is_valid_local(LocalBlockPos(-1, 0, 0)));
    EXPECT_FALSE(is_valid_local(LocalBlockPos(0, 8, 0)));
}

TEST(BlockLayoutTest, BlockValidity) {
    EXPECT_TRUE(is_valid_block(static_cast<uint8_t>(BlockType::Air)));
    EXPECT_TRUE(is_valid_block(static_cast<uint8_t>(BlockType::Grass)));
    EXPECT_FALSE(is_valid_block(static_cast<uint8_t>(BlockType::Count)));
    EXPECT_FALSE(is_valid_block(200));
}

TEST(DirectionTest, OffsetsAreOpposedInPairs) {
    for (uint8_t d = 0; d < static_cast<uint8_t>(Direction::Count); d += 2) {
        EXPECT_EQ(direction_offset(static_cast<Direction>(d)) + direction_offset(static_cast<Direction>(d + 1)),
                  glm::ivec3(0));
    }
}

}  // namespace
}  // namespace cubiq::world
