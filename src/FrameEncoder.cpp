/**
 * @file FrameEncoder.cpp
 * @brief Frame-buffer painting: droplet trails, splash burst patterns, stream cells.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "FrameEncoder.h"

#include <algorithm>
#include <cmath>

namespace {
/** @brief Floor a coordinate to a cell index; false for non-finite or far out-of-range values. */
inline bool toCell(float v, int& out) {
    if (!std::isfinite(v) || v < -1.0e6f || v > 1.0e6f) return false;
    out = static_cast<int>(std::floor(v));
    return true;
}

/**
 * Splash burst patterns. A dot lands at (cx + sx*s + dd*drift, gy - sy*s) where s is the
 * depth scale of the splash and gy its impact row.
 */
struct SplashDot {
    int8_t sx;
    int8_t dd;
    int8_t sy;
    SplashGlyph glyph;
};

struct SplashPhase {
    uint8_t count;
    SplashDot dots[5];
};

constexpr int SplashPhases = 8;

constexpr SplashGlyph C = SplashGlyph::Center;
constexpr SplashGlyph SP = SplashGlyph::Spike;
constexpr SplashGlyph FL = SplashGlyph::Flying;
constexpr SplashGlyph LW = SplashGlyph::LeftWing;
constexpr SplashGlyph RW = SplashGlyph::RightWing;
constexpr SplashGlyph FD = SplashGlyph::Fade;

// Indexed by SplashType, then phase (frame / divisor, saturating at the last phase).
const SplashPhase Patterns[4][SplashPhases] = {
    // Symmetric crown
    {
        {1, {{0, 0, 0, C}}},
        {3, {{-1, 1, 0, LW}, {0, 0, 0, C}, {1, 1, 0, RW}}},
        {3, {{0, 1, 1, SP}, {-1, 1, 0, LW}, {1, 1, 0, RW}}},
        {5, {{-2, 1, 1, LW}, {0, 1, 1, SP}, {2, 1, 1, RW}, {-1, 0, 0, LW}, {1, 0, 0, RW}}},
        {5, {{-2, 2, 2, FL}, {0, 1, 2, FL}, {2, 2, 2, FL}, {-2, 1, 1, LW}, {2, 1, 1, RW}}},
        {3, {{-3, 2, 2, FL}, {0, 1, 2, FL}, {3, 2, 2, FL}}},
        {2, {{-2, 1, 1, FL}, {2, 1, 1, FL}}},
        {2, {{-1, 1, 0, FD}, {1, 1, 0, FD}}},
    },
    // Left-biased
    {
        {1, {{0, 0, 0, C}}},
        {2, {{-1, 1, 0, LW}, {0, 0, 0, C}}},
        {3, {{-1, 1, 1, LW}, {0, 1, 1, SP}, {-2, 1, 0, LW}}},
        {4, {{-2, 1, 2, FL}, {-1, 1, 1, LW}, {0, 1, 1, SP}, {-3, 1, 0, LW}}},
        {4, {{-3, 1, 2, FL}, {-1, 1, 2, FL}, {-2, 1, 1, LW}, {0, 1, 1, SP}}},
        {3, {{-4, 1, 2, FL}, {-2, 1, 2, FL}, {-3, 1, 1, LW}}},
        {2, {{-3, 1, 1, FL}, {-1, 1, 1, FL}}},
        {1, {{-2, 1, 0, FD}}},
    },
    // Right-biased
    {
        {1, {{0, 0, 0, C}}},
        {2, {{0, 0, 0, C}, {1, 1, 0, RW}}},
        {3, {{0, 1, 1, SP}, {1, 1, 1, RW}, {2, 1, 0, RW}}},
        {4, {{0, 1, 1, SP}, {1, 1, 1, RW}, {2, 1, 2, FL}, {3, 1, 0, RW}}},
        {4, {{0, 1, 1, SP}, {2, 1, 1, RW}, {1, 1, 2, FL}, {3, 1, 2, FL}}},
        {3, {{3, 1, 1, RW}, {2, 1, 2, FL}, {4, 1, 2, FL}}},
        {2, {{1, 1, 1, FL}, {3, 1, 1, FL}}},
        {1, {{2, 1, 0, FD}}},
    },
    // Scattered spray
    {
        {1, {{0, 0, 0, C}}},
        {3, {{0, 1, 0, C}, {-1, 1, 0, FL}, {1, 1, 0, FL}}},
        {3, {{0, 2, 1, FL}, {-1, 1, 1, FL}, {2, 1, 0, FL}}},
        {4, {{0, 2, 2, FL}, {-2, 1, 1, FL}, {1, 1, 1, FL}, {3, 1, 0, FL}}},
        {4, {{-1, 1, 2, FL}, {2, 1, 2, FL}, {-2, 1, 1, FL}, {3, 1, 1, FL}}},
        {3, {{-2, 1, 2, FL}, {1, 1, 2, FL}, {3, 1, 1, FL}}},
        {2, {{-1, 1, 1, FL}, {2, 1, 1, FL}}},
        {1, {{0, 1, 0, FD}}},
    },
};
}

int depthBucket(float z) {
    if (!std::isfinite(z)) return 0;
    float b = std::floor((1.0f - z) * static_cast<float>(FrameCodes::Buckets));
    if (b < 0.0f) return 0;
    if (b > static_cast<float>(FrameCodes::Buckets - 1)) return FrameCodes::Buckets - 1;
    return static_cast<int>(b);
}

int trailLength(int bucket) {
    bucket = std::max(0, std::min(FrameCodes::Buckets - 1, bucket));
    return 1 + (bucket * 5) / FrameCodes::Buckets;
}

FrameEncoder::FrameEncoder(int width, int height) {
    resize(width, height);
}

void FrameEncoder::resize(int width, int height) {
    w = std::max(0, width);
    h = std::max(0, height);
    out.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0);
}

void FrameEncoder::clear() {
    std::fill(out.begin(), out.end(), static_cast<uint8_t>(0));
}

void FrameEncoder::encodeDroplets(const Droplets& drops) {
    for (size_t i = 0; i < drops.count(); ++i) {
        int x, y;
        if (!toCell(drops.x(i), x) || !toCell(drops.y(i), y)) continue;
        if (x < 0 || x >= w) continue;
        int bucket = depthBucket(drops.z(i));
        int trail = trailLength(bucket);
        for (int k = 0; k < trail; ++k) {
            int pos = std::min(k, FrameCodes::Trails - 1);
            put(x, y - k, static_cast<uint8_t>(FrameCodes::DropletBase + bucket * FrameCodes::Trails + pos));
        }
    }
}

void FrameEncoder::encodeSplashes(const Splashes& splashes, int frameDivisor) {
    if (frameDivisor < 1) frameDivisor = 1;
    for (size_t i = 0; i < splashes.count(); ++i) {
        int cx, gy;
        if (!toCell(splashes.x(i), cx) || !toCell(splashes.y(i), gy)) continue;
        float z = splashes.z(i);
        int bucket = depthBucket(z);
        int scale = static_cast<int>((1.0f - z) * 2.5f);
        int phase = std::min(SplashPhases - 1, splashes.frame(i) / frameDivisor);
        int drift = splashes.drift(i);

        if (scale <= 0) {
            // Too far away for a burst: a single glyph that fades out.
            SplashGlyph g = phase < 3 ? SplashGlyph::Center : phase < 6 ? SplashGlyph::Flying : SplashGlyph::Fade;
            putSplash(cx, gy, bucket, g);
            continue;
        }

        const SplashPhase& p = Patterns[static_cast<int>(splashes.type(i)) & 3][phase];
        for (int k = 0; k < p.count; ++k) {
            const SplashDot& d = p.dots[k];
            putSplash(cx + d.sx * scale + d.dd * drift, gy - d.sy * scale, bucket, d.glyph);
        }
    }
}

void FrameEncoder::encodeStreams(const Streams& streams) {
    for (size_t i = 0; i < streams.count(); ++i) {
        int x, y;
        if (!toCell(streams.x(i), x) || !toCell(streams.y(i), y)) continue;
        int bucket = depthBucket(streams.z(i));
        int life = streams.life(i);
        int size = life > 80 ? 3 : life > 40 ? 2 : life > 10 ? 1 : 0;
        put(x, y, static_cast<uint8_t>(FrameCodes::StreamBase + bucket * FrameCodes::StreamSizes + size));
    }
}

CellCode FrameEncoder::decode(uint8_t v) {
    CellCode c;
    int code = v;
    if (code == 0) return c;
    if (code < FrameCodes::SplashBase) {
        c.kind = CellKind::Droplet;
        c.bucket = (code - FrameCodes::DropletBase) / FrameCodes::Trails;
        c.variant = (code - FrameCodes::DropletBase) % FrameCodes::Trails;
    } else if (code < FrameCodes::StreamBase) {
        c.kind = CellKind::Splash;
        c.bucket = (code - FrameCodes::SplashBase) / FrameCodes::SplashChars;
        c.variant = (code - FrameCodes::SplashBase) % FrameCodes::SplashChars;
    } else if (code <= FrameCodes::StreamEnd) {
        c.kind = CellKind::Stream;
        c.bucket = (code - FrameCodes::StreamBase) / FrameCodes::StreamSizes;
        c.variant = (code - FrameCodes::StreamBase) % FrameCodes::StreamSizes;
    } else {
        c.kind = CellKind::Invalid;
    }
    return c;
}
