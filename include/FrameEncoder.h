/**
 * @file FrameEncoder.h
 * @brief One-byte-per-cell frame encoding shared with the rendering client.
 *
 * Code layout (a versioned contract with the renderer; do not change without bumping
 * FrameCodes::Version):
 *
 *   0                      empty
 *   1  .. 32               droplet  v-1           = bucket*Trails      + trail
 *   33 .. 96               splash   v-SplashBase  = bucket*SplashChars + glyph
 *   97 .. 128              stream   v-StreamBase  = bucket*StreamSizes + size
 *
 * Bucket 7 is nearest. Trail 0 is the droplet head; glyphs are listed in SplashGlyph.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "EntityStores.h"

#include <cstddef>
#include <cstdint>
#include <vector>

struct FrameCodes {
    static constexpr int Version = 1;
    static constexpr int Buckets = 8;
    static constexpr int Trails = 4;
    static constexpr int SplashChars = 8;
    static constexpr int StreamSizes = 4;
    static constexpr int DropletBase = 1;
    static constexpr int SplashBase = DropletBase + Buckets * Trails;        // 33
    static constexpr int StreamBase = SplashBase + Buckets * SplashChars;    // 97
    static constexpr int StreamEnd = StreamBase + Buckets * StreamSizes - 1; // 128
};

static_assert(FrameCodes::SplashBase == 33, "splash codes must start at 33");
static_assert(FrameCodes::StreamBase == 97, "stream codes must start at 97");
static_assert(FrameCodes::StreamEnd <= 255, "codes must fit in a byte");

/** @brief Splash glyph slots within a bucket; 3 and 7 are reserved. */
enum class SplashGlyph : uint8_t {
    Center = 0,
    Spike = 1,
    Flying = 2,
    LeftWing = 4,
    RightWing = 5,
    Fade = 6,
};

enum class CellKind : uint8_t { Empty, Droplet, Splash, Stream, Invalid };

/** @brief A decoded frame-buffer byte. */
struct CellCode {
    CellKind kind{CellKind::Empty};
    int bucket{0};
    int variant{0};  /**< trail position, splash glyph, or stream size */
};

/** @brief floor((1-z)*Buckets) clamped to [0, Buckets-1]; non-finite z maps to the far bucket. */
int depthBucket(float z);

/** @brief Number of cells a droplet in @p bucket paints (head included); grows toward the viewer. */
int trailLength(int bucket);

/**
 * @class FrameEncoder
 * @brief Owns the frame buffer and paints entity pools into it.
 *
 * Paint order is droplets, splashes, streams. A write only lands if its code is larger than
 * the cell's current code; code ranges ascend in paint order, so later entity types always
 * cover earlier ones, and within a type the nearer bucket wins. Writes outside the screen are
 * dropped.
 */
class FrameEncoder {
public:
    FrameEncoder(int width, int height);

    /** @brief Reallocate to width*height cells (zero-filled); negative sizes are treated as 0. */
    void resize(int width, int height);
    /** @brief Reset every cell to empty. */
    void clear();

    void encodeDroplets(const Droplets& drops);
    void encodeSplashes(const Splashes& splashes, int frameDivisor);
    void encodeStreams(const Streams& streams);

    const std::vector<uint8_t>& buffer() const { return out; }
    const uint8_t* data() const { return out.data(); }
    size_t size() const { return out.size(); }
    int width() const { return w; }
    int height() const { return h; }

    static CellCode decode(uint8_t v);

private:
    void put(int x, int y, uint8_t code) {
        if (static_cast<unsigned>(x) >= static_cast<unsigned>(w) ||
            static_cast<unsigned>(y) >= static_cast<unsigned>(h)) return;
        uint8_t& cell = out[static_cast<size_t>(y) * static_cast<size_t>(w) + static_cast<size_t>(x)];
        if (code > cell) cell = code;
    }
    void putSplash(int x, int y, int bucket, SplashGlyph glyph) {
        put(x, y, static_cast<uint8_t>(FrameCodes::SplashBase + bucket * FrameCodes::SplashChars +
                                       static_cast<int>(glyph)));
    }

    int w{0};
    int h{0};
    std::vector<uint8_t> out;
};
