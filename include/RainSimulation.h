/**
 * @file RainSimulation.h
 * @brief Simulation core: owns the pools, the PRNG, and the frame buffer, and runs one tick at a time.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "EntityStores.h"
#include "FrameEncoder.h"
#include "RainPhysics.h"
#include "Rng.h"
#include "SceneGeometry.h"
#include "SimConfig.h"
#include "WorldQuery.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @class RainSimulation
 * @brief Depth-aware rain over a fixed scene, rendered into a one-byte-per-cell frame buffer.
 *
 * tick() runs spawn, integrate and collide, expire, and encode in that order. The buffer
 * reference returned by buffer() stays valid until the next tick() or resize(); generation()
 * changes on each of those so a client can tell a stale view from a fresh one.
 *
 * The scene is held by reference and must outlive the simulation. Resizing clears every
 * entity pool; a 0×0 screen is legal and makes tick() a no-op.
 */
class RainSimulation {
public:
    /** @brief Validates @p cfg (clamping out-of-range values) and sizes the pools from it. */
    RainSimulation(const SceneGeometry& scene, int width, int height, SimConfig cfg = {});

    RainSimulation(const RainSimulation&) = delete;
    RainSimulation& operator=(const RainSimulation&) = delete;

    /** @brief Change the screen size; reallocates the buffer and drops all live entities. */
    void resize(int width, int height);

    /** @brief Advance one frame and repaint the buffer. */
    void tick();

    /** @brief Repaint the buffer from the current pools without advancing the simulation. */
    void encode();

    /** @brief Drop all entities and restart the PRNG from the configured seed. */
    void reset();

    const std::vector<uint8_t>& buffer() const { return encoder.buffer(); }
    const uint8_t* bufferData() const { return encoder.data(); }
    size_t bufferSize() const { return encoder.size(); }
    int width() const { return w; }
    int height() const { return h; }

    /** @brief Live droplets + splashes + streams (diagnostic). */
    size_t liveEntityCount() const { return drops.count() + splashes.count() + streams.count(); }
    uint64_t generation() const { return gen; }

    const Droplets& droplets() const { return drops; }
    const Splashes& splashPool() const { return splashes; }
    const Streams& streamPool() const { return streams; }
    const SimConfig& config() const { return cfg; }
    const WorldQuery& world() const { return query; }
    const TickStats& lastTickStats() const { return stats; }
    uint64_t ticks() const { return tickCount; }

private:
    SimConfig cfg;
    const SceneGeometry& scene;
    int w, h;
    WorldQuery query;
    Rng rng;
    Droplets drops;
    Splashes splashes;
    Streams streams;
    FrameEncoder encoder;
    RainPhysics physics;
    uint64_t gen{0};
    uint64_t tickCount{0};
    TickStats stats;
    bool warnedSaturation{false};
};
