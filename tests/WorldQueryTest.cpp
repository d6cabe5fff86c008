/**
 * @file WorldQueryTest.cpp
 * @brief Screen-to-background mapping, neutral out-of-bounds samples, the depth-match rule.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "WorldQuery.h"
#include "TestScenes.h"

#include <gtest/gtest.h>

#include <limits>
#include <vector>

namespace {
// 20x10 scene with one marked cell at (4,2): depth 200, ground, full-right flow, left-leaning normal.
SceneGeometry markedScene() {
    const int w = 20, h = 10;
    size_t n = static_cast<size_t>(w * h);
    std::vector<uint8_t> d(n, 0), g(n, 0);
    std::vector<int8_t> nx(n, 0), ny(n, 0), fx(n, 0), fy(n, 0);
    size_t i = 2 * w + 4;
    d[i] = 200;
    g[i] = 1;
    nx[i] = -127;
    fx[i] = 127;
    fy[i] = 11;
    // (6,2) is ground with weak flow
    d[2 * w + 6] = 200;
    g[2 * w + 6] = 1;
    fx[2 * w + 6] = 10;
    return SceneGeometry(w, h, d, g, nx, ny, fx, fy);
}
}

TEST(WorldQueryTest, ScalesScreenToBackground) {
    SceneGeometry scene = markedScene();
    WorldQuery q(scene, 10, 5);
    EXPECT_FLOAT_EQ(q.scaleX(), 2.0f);
    EXPECT_FLOAT_EQ(q.scaleY(), 2.0f);

    int bx = -1, by = -1;
    ASSERT_TRUE(q.toBackground(2.3f, 1.2f, bx, by));
    EXPECT_EQ(bx, 4);
    EXPECT_EQ(by, 2);

    EXPECT_EQ(q.depthAt(2.3f, 1.2f), 200);
    EXPECT_TRUE(q.isGround(2.3f, 1.2f));
    EXPECT_FLOAT_EQ(q.flowAt(2.3f, 1.2f).x, 1.0f);
    EXPECT_FLOAT_EQ(q.normalAt(2.3f, 1.2f).x, -1.0f);
    EXPECT_TRUE(q.hasFlow(2.3f, 1.2f, 10));
    EXPECT_FALSE(q.hasFlow(3.1f, 1.2f, 10));  // (6,2): |fx| == 10 is not enough
    EXPECT_FLOAT_EQ(q.flowStrength(2.3f, 1.2f), 1.0f);
}

TEST(WorldQueryTest, ResizeRecomputesScale) {
    SceneGeometry scene = markedScene();
    WorldQuery q(scene, 10, 5);
    q.setScreenSize(20, 10);
    EXPECT_FLOAT_EQ(q.scaleX(), 1.0f);
    EXPECT_EQ(q.depthAt(4.5f, 2.5f), 200);
    EXPECT_EQ(q.depthAt(2.3f, 1.2f), 0);
}

TEST(WorldQueryTest, OutOfBoundsReturnsNeutralValues) {
    SceneGeometry scene = markedScene();
    WorldQuery q(scene, 20, 10);
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float probes[][2] = {{-1.0f, 2.0f}, {4.0f, -0.5f}, {20.0f, 2.0f}, {4.0f, 10.0f}, {nan, 2.0f}, {4.0f, nan}};
    for (const auto& p : probes) {
        EXPECT_EQ(q.depthAt(p[0], p[1]), 0);
        EXPECT_FALSE(q.isGround(p[0], p[1]));
        Vec2f f = q.flowAt(p[0], p[1]);
        EXPECT_EQ(f.x, 0.0f);
        EXPECT_EQ(f.y, 0.0f);
        Vec2f nrm = q.normalAt(p[0], p[1]);
        EXPECT_EQ(nrm.x, 0.0f);
        EXPECT_FALSE(q.hasFlow(p[0], p[1], 0));
        EXPECT_FALSE(q.hitsSurface(p[0], p[1], 0.2f, 48, 30));
    }
}

TEST(WorldQueryTest, HitsDepthRule) {
    // At or below the sky threshold nothing is ever hit
    EXPECT_FALSE(WorldQuery::hitsDepth(30, 0.88f, 255, 30));
    EXPECT_FALSE(WorldQuery::hitsDepth(0, 1.0f, 48, 30));

    // z = 0 puts the droplet at depth 255
    EXPECT_TRUE(WorldQuery::hitsDepth(255, 0.0f, 48, 30));
    EXPECT_TRUE(WorldQuery::hitsDepth(208, 0.0f, 48, 30));
    EXPECT_FALSE(WorldQuery::hitsDepth(207, 0.0f, 48, 30));  // |diff| == margin misses
    EXPECT_FALSE(WorldQuery::hitsDepth(100, 0.0f, 48, 30));

    // z = 1 is depth 0, so only shallow surfaces above the threshold are in range
    EXPECT_TRUE(WorldQuery::hitsDepth(31, 1.0f, 48, 30));
    EXPECT_FALSE(WorldQuery::hitsDepth(48, 1.0f, 48, 30));
}

TEST(WorldQueryTest, HitsSurfaceIsDeterministic) {
    SceneGeometry scene = ledgeScene(10, 10, 5, 200);
    WorldQuery q(scene, 10, 10);
    const float z = 55.0f / 255.0f;
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(q.hitsSurface(3.5f, 5.5f, z, 48, 30));
        EXPECT_FALSE(q.hitsSurface(3.5f, 4.5f, z, 48, 30));
        EXPECT_FALSE(q.hitsSurface(3.5f, 5.5f, 0.95f, 48, 30));
    }
}
