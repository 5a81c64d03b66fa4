// Cubiq Tests
// dependencies_test.cpp - Checks that the linked third-party libraries behave as the world code expects

#include <FastNoise/FastNoise.h>
#include <glm/glm.hpp>
#include <gtest/gtest.h>
#include <zlib.h>

#include <cstdint>
#include <vector>

namespace {

TEST(DependenciesTest, ExactlyOnePlatformDefined) {
    int defined = 0;
#if defined(CUBIQ_PLATFORM_LINUX)
    ++defined;
#endif
#if defined(CUBIQ_PLATFORM_WINDOWS)
    ++defined;
#endif
#if defined(CUBIQ_PLATFORM_MACOS)
    ++defined;
#endif
    EXPECT_EQ(defined, 1);
}

TEST(DependenciesTest, GlmIntegerVectorsScaleToWorldSpace) {
    glm::ivec3 index(-3, 0, 2);
    glm::vec3 origin = glm::vec3(index) * 8.0f;
    EXPECT_EQ(origin, glm::vec3(-24.0f, 0.0f, 16.0f));
}

TEST(DependenciesTest, FractalNoiseDependsOnSeed) {
    auto fractal = FastNoise::New<FastNoise::FractalFBm>();
    fractal->SetSource(FastNoise::New<FastNoise::Simplex>());
    fractal->SetOctaveCount(4);

    float a = fractal->GenSingle2D(3.7f, -1.2f, 1);
    EXPECT_FLOAT_EQ(a, fractal->GenSingle2D(3.7f, -1.2f, 1));

    bool differs = false;
    for (int seed = 2; seed < 10 && !differs; ++seed) {
        differs = fractal->GenSingle2D(3.7f, -1.2f, seed) != a;
    }
    EXPECT_TRUE(differs);
}

TEST(DependenciesTest, ZlibShrinksLayeredBlockPayload) {
    // Stone, dirt, grass, then air, 64 blocks per layer
    std::vector<Bytef> blocks(512, 0);
    for (std::size_t i = 0; i < 64 * 4; ++i) {
        blocks[i] = i < 64 * 2 ? 1 : (i < 64 * 3 ? 2 : 3);
    }

    uLongf packed_size = compressBound(static_cast<uLong>(blocks.size()));
    std::vector<Bytef> packed(packed_size);
    ASSERT_EQ(compress2(packed.data(), &packed_size, blocks.data(), static_cast<uLong>(blocks.size()),
                        Z_BEST_SPEED),
              Z_OK);
    EXPECT_LT(packed_size, 64u);

    std::vector<Bytef> unpacked(blocks.size());
    uLongf unpacked_size = static_cast<uLongf>(unpacked.size());
    ASSERT_EQ(uncompress(unpacked.data(), &unpacked_size, packed.data(), packed_size), Z_OK);
    EXPECT_EQ(unpacked, blocks);
}

}  // namespace
