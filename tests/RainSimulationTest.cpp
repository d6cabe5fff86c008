/**
 * @file RainSimulationTest.cpp
 * @brief Whole-tick behavior: clear sky, resize, determinism, idempotent encode.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "RainSimulation.h"
#include "DemoScene.h"
#include "TestScenes.h"

#include <gtest/gtest.h>

#include <memory>
#include <utility>
#include <vector>

namespace {
class StreetTest : public ::testing::Test {
protected:
    void SetUp() override {
        scene = std::make_unique<SceneGeometry>(makeDemoScene(80, 24));
    }

    // Every live entity must sit in a column of the current screen and above its bottom edge.
    static void expectOnScreen(const RainSimulation& sim) {
        const float w = static_cast<float>(sim.width());
        const float h = static_cast<float>(sim.height());
        const Droplets& d = sim.droplets();
        for (size_t i = 0; i < d.count(); ++i) {
            EXPECT_GE(d.x(i), 0.0f);
            EXPECT_LT(d.x(i), w);
            EXPECT_LT(d.y(i), h);
        }
        const Splashes& s = sim.splashPool();
        for (size_t i = 0; i < s.count(); ++i) {
            EXPECT_GE(s.x(i), 0.0f);
            EXPECT_LT(s.x(i), w);
            EXPECT_GE(s.y(i), 0.0f);
            EXPECT_LT(s.y(i), h);
        }
        const Streams& st = sim.streamPool();
        for (size_t i = 0; i < st.count(); ++i) {
            EXPECT_GE(st.x(i), 0.0f);
            EXPECT_LT(st.x(i), w);
            EXPECT_GE(st.y(i), 0.0f);
            EXPECT_LT(st.y(i), h);
        }
    }

    std::unique_ptr<SceneGeometry> scene;
};

// 1000 ticks over a scene with nothing nearer than the sky threshold: droplets only ever
// leave through the bottom edge.
void expectRainFallsThrough(const SceneGeometry& scene) {
    RainSimulation sim(scene, 10, 10);
    size_t dropsSeen = 0, exited = 0;
    for (int t = 0; t < 1000; ++t) {
        sim.tick();
        const TickStats& st = sim.lastTickStats();
        ASSERT_EQ(st.surfaceHits, 0u) << "tick " << t;
        ASSERT_EQ(st.groundHits, 0u) << "tick " << t;
        ASSERT_EQ(st.splashesSpawned, 0u) << "tick " << t;
        ASSERT_EQ(sim.splashPool().count(), 0u) << "tick " << t;
        ASSERT_EQ(sim.streamPool().count(), 0u) << "tick " << t;
        for (uint8_t v : sim.buffer()) ASSERT_LT(v, FrameCodes::SplashBase);
        dropsSeen += sim.droplets().count();
        exited += st.dropsExited;
    }
    EXPECT_GT(dropsSeen, 0u);
    EXPECT_GT(exited, 0u);
}
}

TEST(RainSimulationTest, ClearSkyNeverSplashes) {
    expectRainFallsThrough(skyScene(10, 10));
}

TEST(RainSimulationTest, GroundFlaggedSkyNeverSplashes) {
    const size_t n = 100;
    std::vector<uint8_t> ground(n, 0);
    ground[0] = 1;
    ground[57] = 1;
    SceneGeometry scene(10, 10, std::vector<uint8_t>(n, 20), std::move(ground),
                        std::vector<int8_t>(n, 0), std::vector<int8_t>(n, 0),
                        std::vector<int8_t>(n, 0), std::vector<int8_t>(n, 0));
    ASSERT_TRUE(scene.hasGround());
    expectRainFallsThrough(scene);
}

TEST(RainSimulationTest, ZeroSizedScreenTickIsANoOp) {
    SceneGeometry scene = skyScene(4, 4);
    RainSimulation sim(scene, 0, 0);
    uint64_t gen = sim.generation();
    sim.tick();
    EXPECT_EQ(sim.bufferSize(), 0u);
    EXPECT_EQ(sim.liveEntityCount(), 0u);
    EXPECT_EQ(sim.generation(), gen);
    EXPECT_EQ(sim.ticks(), 0u);
}

TEST(RainSimulationTest, PoolsNeverExceedCapacity) {
    SceneGeometry scene = skyScene(10, 10);
    SimConfig cfg;
    cfg.maxDroplets = 4;
    RainSimulation sim(scene, 640, 10, cfg);
    bool dropped = false;
    for (int t = 0; t < 20; ++t) {
        sim.tick();
        ASSERT_LE(sim.droplets().count(), 4u);
        dropped = dropped || sim.lastTickStats().droppedSpawns > 0;
    }
    EXPECT_TRUE(dropped);
}

TEST(RainSimulationTest, ConfigIsValidatedOnConstruction) {
    SceneGeometry scene = skyScene(4, 4);
    SimConfig cfg;
    cfg.groundSplashChance = 3.0f;
    RainSimulation sim(scene, 4, 4, cfg);
    EXPECT_FLOAT_EQ(sim.config().groundSplashChance, 1.0f);
}

TEST_F(StreetTest, BufferMatchesScreenAndCodesStayInRange) {
    RainSimulation sim(*scene, 80, 24);
    ASSERT_EQ(sim.bufferSize(), 80u * 24u);
    ASSERT_NE(sim.bufferData(), nullptr);
    for (int t = 0; t < 300; ++t) {
        sim.tick();
        for (uint8_t v : sim.buffer()) ASSERT_LE(v, FrameCodes::StreamEnd);
    }
}

TEST_F(StreetTest, RainHitsTheStreet) {
    RainSimulation sim(*scene, 80, 24);
    size_t hits = 0;
    size_t splashes = 0;
    for (int t = 0; t < 300; ++t) {
        sim.tick();
        hits += sim.lastTickStats().surfaceHits + sim.lastTickStats().groundHits;
        splashes += sim.lastTickStats().splashesSpawned;
    }
    EXPECT_GT(hits, 0u);
    EXPECT_GT(splashes, 0u);
}

TEST_F(StreetTest, ShrinkingClearsEntitiesAndKeepsThemOnScreen) {
    RainSimulation sim(*scene, 80, 24);
    for (int t = 0; t < 100; ++t) sim.tick();
    uint64_t gen = sim.generation();

    sim.resize(40, 12);
    EXPECT_EQ(sim.bufferSize(), 480u);
    EXPECT_EQ(sim.width(), 40);
    EXPECT_EQ(sim.height(), 12);
    EXPECT_EQ(sim.liveEntityCount(), 0u);
    EXPECT_GT(sim.generation(), gen);

    for (int t = 0; t < 200; ++t) {
        sim.tick();
        ASSERT_EQ(sim.bufferSize(), 480u);
        expectOnScreen(sim);
    }
}

TEST_F(StreetTest, SameSeedSameFrames) {
    SimConfig cfg;
    cfg.seed = 1234;
    RainSimulation a(*scene, 80, 24, cfg);
    RainSimulation b(*scene, 80, 24, cfg);
    for (int t = 0; t < 250; ++t) {
        a.tick();
        b.tick();
    }
    EXPECT_EQ(a.buffer(), b.buffer());
    EXPECT_EQ(a.liveEntityCount(), b.liveEntityCount());
    EXPECT_EQ(a.generation(), b.generation());
}

TEST_F(StreetTest, ResetReplaysTheSameRain) {
    RainSimulation a(*scene, 80, 24);
    RainSimulation b(*scene, 80, 24);
    for (int t = 0; t < 60; ++t) a.tick();
    a.reset();
    EXPECT_EQ(a.liveEntityCount(), 0u);
    for (int t = 0; t < 60; ++t) {
        a.tick();
        b.tick();
    }
    EXPECT_EQ(a.buffer(), b.buffer());
}

TEST_F(StreetTest, EncodeIsIdempotent) {
    RainSimulation sim(*scene, 80, 24);
    for (int t = 0; t < 120; ++t) sim.tick();
    std::vector<uint8_t> before = sim.buffer();
    sim.encode();
    EXPECT_EQ(sim.buffer(), before);
    sim.encode();
    EXPECT_EQ(sim.buffer(), before);
}

TEST_F(StreetTest, GenerationAdvancesOnEveryMutation) {
    RainSimulation sim(*scene, 80, 24);
    uint64_t g0 = sim.generation();
    sim.tick();
    uint64_t g1 = sim.generation();
    EXPECT_GT(g1, g0);
    sim.resize(60, 20);
    EXPECT_GT(sim.generation(), g1);
}
