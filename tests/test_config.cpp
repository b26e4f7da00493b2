#include <gtest/gtest.h>

#include "config.hpp"
#include "random.hpp"

#include <cstdint>
#include <set>
#include <stdexcept>

TEST(Config, DefaultsAreValid)
{
    const Config cfg;
    EXPECT_NO_THROW(cfg.validate());
    EXPECT_EQ(cfg.graph.vertexCount, 50u);
    EXPECT_EQ(cfg.graph.minConnections, 3u);
    EXPECT_DOUBLE_EQ(cfg.lifecycle.formationDelay, 2.0);
    EXPECT_FLOAT_EQ(cfg.lifecycle.formationDuration, 15.0f);
    EXPECT_EQ(cfg.glow.maxDepth, 2);
    EXPECT_FALSE(cfg.seed.has_value());
}

TEST(Config, StructuralErrorsAreInvalidArgument)
{
    Config a;
    a.graph.vertexCount = 0;
    EXPECT_THROW(a.validate(), std::invalid_argument);

    Config b;
    b.glow.minInterval = 4.0;
    b.glow.maxInterval = 3.0;
    EXPECT_THROW(b.validate(), std::invalid_argument);

    Config c;
    c.glow.minClusterSize = 0;
    EXPECT_THROW(c.validate(), std::invalid_argument);
}

TEST(Config, OutOfRangeValuesAreDomainErrors)
{
    Config a;
    a.glow.includeThreshold = 1.2f;
    EXPECT_THROW(a.validate(), std::domain_error);

    Config b;
    b.camera.farPlane = b.camera.nearPlane;
    EXPECT_THROW(b.validate(), std::domain_error);

    Config c;
    c.lifecycle.formationDuration = 0.0f;
    EXPECT_THROW(c.validate(), std::domain_error);

    Config d;
    d.motion.maxFrameStep = 0.0;
    EXPECT_THROW(d.validate(), std::domain_error);
}

TEST(Random, IndexIsInclusiveAndBounded)
{
    MersenneRandom rng{ 123 };
    std::set<std::size_t> seen;
    for (int i = 0; i < 2000; ++i) {
        const std::size_t v = rng.index(5, 15);
        ASSERT_GE(v, 5u);
        ASSERT_LE(v, 15u);
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 11u);
}

TEST(Random, SeededStreamsRepeat)
{
    MersenneRandom a{ 77 }, b{ 77 };
    for (int i = 0; i < 100; ++i)
        EXPECT_EQ(a.uniform(), b.uniform());
}

TEST(Random, HighSeedBitsChangeTheStream)
{
    MersenneRandom a{ 1 }, b{ 1 + (std::uint64_t{ 1 } << 32) };
    bool differs = false;
    for (int i = 0; i < 16 && !differs; ++i)
        differs = a.uniform() != b.uniform();
    EXPECT_TRUE(differs);
}

TEST(Random, CentredSpansHalfAmplitude)
{
    MersenneRandom rng{ 5 };
    for (int i = 0; i < 1000; ++i) {
        const float v = rng.centred(0.03f);
        ASSERT_GE(v, -0.015f);
        ASSERT_LE(v,  0.015f);
    }
}
