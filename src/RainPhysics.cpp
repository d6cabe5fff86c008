/**
 * @file RainPhysics.cpp
 * @brief Droplet spawning, swept surface collision, ground-plane fallback, splash and stream updates.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "RainPhysics.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr float MaxStepLen = 0.5f; // max displacement per collision sub-step in cell units

/** @brief Keep a spawn x inside [0, w); splashes jittered off the edge would encode nothing. */
inline float clampToScreen(float x, int w) {
    float hi = std::nextafter(static_cast<float>(std::max(1, w)), 0.0f);
    return std::max(0.0f, std::min(hi, x));
}
}

RainPhysics::RainPhysics(const SimConfig& cfg_, const WorldQuery& world_, Rng& rng_)
    : cfg(cfg_), world(world_), rng(rng_) {}

size_t RainPhysics::spawnDroplets(Droplets& drops, int screenW, TickStats& stats) {
    if (screenW <= 0) return 0;
    // Whole part of the expected count always spawns; the fraction spawns one more by chance.
    float expected = cfg.dropBase + static_cast<float>(screenW) * cfg.dropsPerColumn;
    int count = static_cast<int>(std::floor(expected));
    if (rng.chance(expected - static_cast<float>(count))) ++count;

    size_t spawned = 0;
    for (int k = 0; k < count; ++k) {
        if (drops.full()) {
            stats.droppedSpawns += static_cast<size_t>(count - k);
            break;
        }
        float z = rng.rand01();
        float x = rng.rand01() * static_cast<float>(screenW);
        float y = -rng.rand01() * cfg.spawnHeadroom;
        float v = (cfg.velNear + (cfg.velFar - cfg.velNear) * z) *
                  (1.0f - cfg.velJitter + 2.0f * cfg.velJitter * rng.rand01());
        if (drops.spawn(x, y, z, v) != PoolFull) ++spawned;
    }
    stats.dropsSpawned += spawned;
    return spawned;
}

void RainPhysics::updateDroplets(Droplets& drops, Splashes& splashes, Streams& streams,
                                 int screenW, int screenH, TickStats& stats) {
    const bool plane = groundPlaneActive();
    const float fw = static_cast<float>(screenW);
    const float fh = static_cast<float>(screenH);

    size_t i = 0;
    while (i < drops.count()) {
        const float x = drops.x(i);
        const float y0 = drops.y(i);
        const float z = drops.z(i);
        const float fall = drops.v(i) * fallScale(z);
        const float y1 = y0 + fall;
        const float ground = groundLine(z, screenH);

        // Sweep the fall so a one-row ledge cannot be skipped.
        bool hit = false;
        float hitY = y1;
        if (x >= 0.0f && x < fw) {
            int substeps = std::max(1, static_cast<int>(std::ceil(fall / MaxStepLen)));
            for (int s = 1; s <= substeps; ++s) {
                float yy = (s == substeps) ? y1 : y0 + fall * static_cast<float>(s) / static_cast<float>(substeps);
                if (plane && yy > ground) break;
                if (yy < 0.0f || yy >= fh) continue;
                if (world.hitsSurface(x, yy, z, cfg.depthMargin, cfg.skyThreshold)) {
                    hit = true;
                    hitY = yy;
                    break;
                }
            }
        }

        if (hit) {
            ++stats.surfaceHits;
            if (world.isGround(x, hitY) && world.hasFlow(x, hitY, cfg.flowMinComponent) &&
                rng.chance(cfg.streamChance)) {
                if (streams.spawn(x, hitY, z, static_cast<uint8_t>(cfg.flowLifetime)) != PoolFull) ++stats.streamsSpawned;
                else ++stats.droppedSpawns;
            }
            if (rng.chance(cfg.surfaceSplashChance)) {
                spawnSurfaceSplash(splashes, x, hitY, z, world.normalAt(x, hitY), screenW, stats);
            }
            drops.remove(i);
            continue;
        }

        if (plane && y1 > ground) {
            ++stats.groundHits;
            if (rng.chance(cfg.groundSplashChance)) {
                SplashType type = static_cast<SplashType>(rng.randInt(0, 3));
                // The nearest plane rows sit on the bottom edge; keep the burst on screen.
                spawnSplash(splashes, x, std::min(ground, fh - 1.0f), z, type, rng.randInt(-2, 2), screenW, stats);
            }
            drops.remove(i);
            continue;
        }

        if (y1 >= fh) {
            ++stats.dropsExited;
            drops.remove(i);
            continue;
        }

        drops.y(i) = y1;
        ++i;
    }
}

void RainPhysics::updateSplashes(Splashes& splashes) {
    size_t i = 0;
    while (i < splashes.count()) {
        int next = splashes.frame(i) + 1;
        if (next >= cfg.splashFrames) {
            splashes.remove(i);
            continue;
        }
        splashes.frame(i) = static_cast<uint8_t>(next);
        ++i;
    }
}

void RainPhysics::updateStreams(Streams& streams, Splashes& splashes, int screenW, int screenH, TickStats& stats) {
    const float fw = static_cast<float>(screenW);
    const float fh = static_cast<float>(screenH);

    size_t i = 0;
    while (i < streams.count()) {
        const uint8_t life = streams.life(i);
        if (life == 0) {
            ++stats.streamsExpired;
            streams.remove(i);
            continue;
        }

        const float z = streams.z(i);
        Vec2f f = world.flowAt(streams.x(i), streams.y(i));
        // Far water crawls; near water runs.
        const float speed = cfg.flowSpeed * (1.0f - z * 0.5f);
        const float x = streams.x(i) + f.x * speed;
        const float y = streams.y(i) + f.y * speed;

        if (x < 0.0f || x >= fw || y < 0.0f || y >= fh) {
            ++stats.streamsExpired;
            streams.remove(i);
            continue;
        }

        // Ran off the wet surface: a young stream drips off the edge.
        if (!world.isGround(x, y) || !world.hitsSurface(x, y, z, cfg.depthMargin, cfg.skyThreshold)) {
            if (life > cfg.dripLifeThreshold) {
                spawnSplash(splashes, x, y, z, SplashType::RightBiased, rng.randInt(-2, 2), screenW, stats);
            }
            ++stats.streamsExpired;
            streams.remove(i);
            continue;
        }

        // Flat ground is a sink: the water pools.
        if (!world.hasFlow(x, y, cfg.flowMinComponent)) {
            spawnSplash(splashes, x, y, z, SplashType::Symmetric, 0, screenW, stats);
            ++stats.streamsExpired;
            streams.remove(i);
            continue;
        }

        streams.x(i) = x;
        streams.y(i) = y;
        streams.life(i) = static_cast<uint8_t>(life - 1);
        ++i;
    }
}

void RainPhysics::spawnSurfaceSplash(Splashes& splashes, float x, float y, float z, Vec2f normal,
                                     int screenW, TickStats& stats) {
    // The steeper the surface, the likelier a one-sided burst toward the side it faces.
    float tilt = std::min(1.0f, std::fabs(normal.x));
    SplashType type;
    if (rng.chance(tilt)) type = normal.x < 0.0f ? SplashType::LeftBiased : SplashType::RightBiased;
    else type = rng.chance(0.5f) ? SplashType::Symmetric : SplashType::Scattered;

    int lean = normal.x < -0.25f ? -1 : normal.x > 0.25f ? 1 : 0;
    spawnSplash(splashes, x, y, z, type, rng.randInt(-2, 2) + lean, screenW, stats);
}

void RainPhysics::spawnSplash(Splashes& splashes, float x, float y, float z, SplashType type, int drift,
                              int screenW, TickStats& stats) {
    float jitter = (rng.rand01() - 0.5f) * cfg.splashJitter;
    if (splashes.spawn(clampToScreen(x + jitter, screenW), y, z, type, drift) != PoolFull) ++stats.splashesSpawned;
    else ++stats.droppedSpawns;
}
