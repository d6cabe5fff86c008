/**
 * @file EntityStores.cpp
 * @brief Spawn sanitizing and swap-remove for the entity pools.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "EntityStores.h"

#include <algorithm>
#include <cmath>

namespace {
/** @brief Slowest fall speed a droplet may have; keeps every droplet moving off screen. */
constexpr float MinFallSpeed = 0.05f;

inline float finiteOr(float v, float fallback) { return std::isfinite(v) ? v : fallback; }
inline float clampDepth(float z) { return std::isfinite(z) ? std::max(0.0f, std::min(1.0f, z)) : 1.0f; }
}

Droplets::Droplets(size_t capacity)
    : cap(capacity), xs(capacity), ys(capacity), zs(capacity), vs(capacity) {}

int Droplets::spawn(float x, float y, float z, float v) {
    if (n >= cap) return PoolFull;
    size_t i = n++;
    xs[i] = finiteOr(x, 0.0f);
    ys[i] = finiteOr(y, 0.0f);
    zs[i] = clampDepth(z);
    vs[i] = (std::isfinite(v) && v > MinFallSpeed) ? v : MinFallSpeed;
    return static_cast<int>(i);
}

void Droplets::remove(size_t i) {
    if (i >= n) return;
    size_t last = --n;
    if (i != last) {
        xs[i] = xs[last]; ys[i] = ys[last]; zs[i] = zs[last]; vs[i] = vs[last];
    }
}

Splashes::Splashes(size_t capacity)
    : cap(capacity), xs(capacity), ys(capacity), zs(capacity),
      frames(capacity), drifts(capacity), types(capacity, SplashType::Symmetric) {}

int Splashes::spawn(float x, float y, float z, SplashType type, int drift) {
    if (n >= cap) return PoolFull;
    size_t i = n++;
    xs[i] = finiteOr(x, 0.0f);
    ys[i] = finiteOr(y, 0.0f);
    zs[i] = clampDepth(z);
    frames[i] = 0;
    drifts[i] = static_cast<int8_t>(std::max(-2, std::min(2, drift)));
    types[i] = type;
    return static_cast<int>(i);
}

void Splashes::remove(size_t i) {
    if (i >= n) return;
    size_t last = --n;
    if (i != last) {
        xs[i] = xs[last]; ys[i] = ys[last]; zs[i] = zs[last];
        frames[i] = frames[last]; drifts[i] = drifts[last]; types[i] = types[last];
    }
}

Streams::Streams(size_t capacity)
    : cap(capacity), xs(capacity), ys(capacity), zs(capacity), lives(capacity) {}

int Streams::spawn(float x, float y, float z, uint8_t life) {
    if (n >= cap) return PoolFull;
    size_t i = n++;
    xs[i] = finiteOr(x, 0.0f);
    ys[i] = finiteOr(y, 0.0f);
    zs[i] = clampDepth(z);
    lives[i] = life;
    return static_cast<int>(i);
}

void Streams::remove(size_t i) {
    if (i >= n) return;
    size_t last = --n;
    if (i != last) {
        xs[i] = xs[last]; ys[i] = ys[last]; zs[i] = zs[last]; lives[i] = lives[last];
    }
}
