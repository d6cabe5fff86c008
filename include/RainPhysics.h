/**
 * @file RainPhysics.h
 * @brief Per-tick update rules: droplet spawning, integration and collision, splash and stream lifecycles.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "EntityStores.h"
#include "Rng.h"
#include "SimConfig.h"
#include "WorldQuery.h"

#include <cstddef>

/** @brief Counters for one tick; diagnostic only. */
struct TickStats {
    size_t dropsSpawned{0};
    size_t surfaceHits{0};
    size_t groundHits{0};
    size_t dropsExited{0};
    size_t splashesSpawned{0};
    size_t streamsSpawned{0};
    size_t streamsExpired{0};
    size_t droppedSpawns{0};  /**< spawns refused by a full pool */
};

/**
 * @class RainPhysics
 * @brief Stateless rule set bound to a config, a world query, and the simulation PRNG.
 *
 * All update functions iterate a pool front to back and swap-remove in place: after remove(i)
 * slot i holds an entity that has not been visited yet, so the index is not advanced.
 */
class RainPhysics {
public:
    RainPhysics(const SimConfig& cfg, const WorldQuery& world, Rng& rng);

    /** @brief Spawn this tick's droplets along the top edge; returns how many landed in the pool. */
    size_t spawnDroplets(Droplets& drops, int screenW, TickStats& stats);

    /**
     * @brief Move droplets and resolve collisions.
     *
     * Motion is swept in sub-steps of at most half a cell so a fast droplet cannot pass
     * through a one-row surface. A surface hit removes the droplet and may spawn a stream
     * and a splash; crossing the ground-plane line removes it with a chance of a splash;
     * falling past the bottom edge just removes it.
     */
    void updateDroplets(Droplets& drops, Splashes& splashes, Streams& streams,
                        int screenW, int screenH, TickStats& stats);

    /** @brief Advance splash frames and drop finished animations. */
    void updateSplashes(Splashes& splashes);

    /** @brief Slide streams along the flow field; expire them at sinks, edges, and on timeout. */
    void updateStreams(Streams& streams, Splashes& splashes, int screenW, int screenH, TickStats& stats);

    /** @brief Splash whose type and drift lean toward the horizontal component of @p normal. */
    void spawnSurfaceSplash(Splashes& splashes, float x, float y, float z, Vec2f normal,
                            int screenW, TickStats& stats);

    /** @brief Screen row of the ground plane for depth @p z. */
    float groundLine(float z, int screenH) const {
        return static_cast<float>(screenH) * (cfg.groundNear + (cfg.groundFar - cfg.groundNear) * z);
    }
    /** @brief The ground plane only exists when some ground cell lies nearer than the sky threshold. */
    bool groundPlaneActive() const { return world.scene().maxGroundDepth() > cfg.skyThreshold; }

private:
    void spawnSplash(Splashes& splashes, float x, float y, float z, SplashType type, int drift,
                     int screenW, TickStats& stats);
    float fallScale(float z) const { return cfg.fallScaleNear + (cfg.fallScaleFar - cfg.fallScaleNear) * z; }

    const SimConfig& cfg;
    const WorldQuery& world;
    Rng& rng;
};
