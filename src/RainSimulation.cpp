/**
 * @file RainSimulation.cpp
 * @brief Tick sequencing, resize policy, and pool-saturation reporting.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "RainSimulation.h"
#include "Logger.h"

#include <algorithm>
#include <string>
#include <utility>

namespace {
SimConfig validated(SimConfig c) {
    c.validate();
    return c;
}
}

RainSimulation::RainSimulation(const SceneGeometry& scene_, int width, int height, SimConfig cfg_)
    : cfg(validated(std::move(cfg_))),
      scene(scene_),
      w(std::max(0, width)),
      h(std::max(0, height)),
      query(scene_, w, h),
      rng(cfg.seed),
      drops(cfg.maxDroplets),
      splashes(cfg.maxSplashes),
      streams(cfg.maxStreams),
      encoder(w, h),
      physics(cfg, query, rng) {
    Logger::info("rain simulation: screen " + std::to_string(w) + "x" + std::to_string(h) +
                 ", scene " + std::to_string(scene.width()) + "x" + std::to_string(scene.height()) +
                 (physics.groundPlaneActive() ? ", ground plane on" : ", ground plane off") +
                 ", seed " + std::to_string(cfg.seed));
}

void RainSimulation::resize(int width, int height) {
    w = std::max(0, width);
    h = std::max(0, height);
    drops.clear();
    splashes.clear();
    streams.clear();
    query.setScreenSize(w, h);
    encoder.resize(w, h);
    ++gen;
    Logger::info("rain simulation resized to " + std::to_string(w) + "x" + std::to_string(h));
}

void RainSimulation::reset() {
    drops.clear();
    splashes.clear();
    streams.clear();
    rng.reseed(cfg.seed);
    encoder.clear();
    tickCount = 0;
    warnedSaturation = false;
    ++gen;
    Logger::info("rain simulation reset");
}

void RainSimulation::tick() {
    if (w <= 0 || h <= 0) return;

    stats = TickStats{};
    physics.spawnDroplets(drops, w, stats);
    physics.updateDroplets(drops, splashes, streams, w, h, stats);
    physics.updateSplashes(splashes);
    physics.updateStreams(streams, splashes, w, h, stats);
    encode();
    ++tickCount;
    ++gen;

    if (stats.droppedSpawns > 0 && !warnedSaturation) {
        warnedSaturation = true;
        Logger::warn("entity pool saturated: " + std::to_string(stats.droppedSpawns) +
                     " spawns dropped at tick " + std::to_string(tickCount));
    }
    if (Logger::enabled(Logger::Level::Debug)) {
        Logger::debug("tick " + std::to_string(tickCount) +
                      ": drops=" + std::to_string(drops.count()) +
                      " splashes=" + std::to_string(splashes.count()) +
                      " streams=" + std::to_string(streams.count()) +
                      " hits=" + std::to_string(stats.surfaceHits) +
                      " ground=" + std::to_string(stats.groundHits));
    }
}

void RainSimulation::encode() {
    encoder.clear();
    encoder.encodeDroplets(drops);
    encoder.encodeSplashes(splashes, cfg.splashFrameDivisor);
    encoder.encodeStreams(streams);
}
