/**
 * @file EntityStores.h
 * @brief Fixed-capacity column-oriented pools for droplets, splashes, and streams.
 *
 * Each pool keeps one vector per attribute and a live count. Slots [0, count()) are always
 * live: remove(i) moves the last live slot into i and shrinks the count, so iteration order
 * is not stable across removals. Storage is reserved once at construction and never grows;
 * spawn() on a full pool is a dropped spawn and returns Full.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/** @brief Splash burst shape, picked from the surface normal at the impact point. */
enum class SplashType : uint8_t { Symmetric = 0, LeftBiased = 1, RightBiased = 2, Scattered = 3 };

/** @brief Returned by spawn() when the pool is at capacity. */
constexpr int PoolFull = -1;

/**
 * @class Droplets
 * @brief Falling rain: screen position, depth z (0 near, 1 far), and fall speed in cells/tick.
 */
class Droplets {
public:
    explicit Droplets(size_t capacity);

    /** @brief Append a droplet; z is clamped to [0,1] and a bad speed is replaced by a small positive one. */
    int spawn(float x, float y, float z, float v);
    void remove(size_t i);
    void clear() { n = 0; }

    size_t count() const { return n; }
    size_t capacity() const { return cap; }
    bool full() const { return n >= cap; }

    float& x(size_t i) { return xs[i]; }
    float& y(size_t i) { return ys[i]; }
    float& z(size_t i) { return zs[i]; }
    float& v(size_t i) { return vs[i]; }
    float x(size_t i) const { return xs[i]; }
    float y(size_t i) const { return ys[i]; }
    float z(size_t i) const { return zs[i]; }
    float v(size_t i) const { return vs[i]; }

private:
    size_t cap;
    size_t n{0};
    std::vector<float> xs, ys, zs, vs;
};

/**
 * @class Splashes
 * @brief Impact animations: position, frame counter, horizontal drift, and burst type.
 */
class Splashes {
public:
    explicit Splashes(size_t capacity);

    /** @brief Append a splash at frame 0; drift is clamped to [-2,2]. */
    int spawn(float x, float y, float z, SplashType type, int drift);
    void remove(size_t i);
    void clear() { n = 0; }

    size_t count() const { return n; }
    size_t capacity() const { return cap; }
    bool full() const { return n >= cap; }

    float& x(size_t i) { return xs[i]; }
    float& y(size_t i) { return ys[i]; }
    float& z(size_t i) { return zs[i]; }
    uint8_t& frame(size_t i) { return frames[i]; }
    float x(size_t i) const { return xs[i]; }
    float y(size_t i) const { return ys[i]; }
    float z(size_t i) const { return zs[i]; }
    uint8_t frame(size_t i) const { return frames[i]; }
    int8_t drift(size_t i) const { return drifts[i]; }
    SplashType type(size_t i) const { return types[i]; }

private:
    size_t cap;
    size_t n{0};
    std::vector<float> xs, ys, zs;
    std::vector<uint8_t> frames;
    std::vector<int8_t> drifts;
    std::vector<SplashType> types;
};

/**
 * @class Streams
 * @brief Water sliding along sloped ground: position and remaining life in ticks.
 */
class Streams {
public:
    explicit Streams(size_t capacity);

    int spawn(float x, float y, float z, uint8_t life);
    void remove(size_t i);
    void clear() { n = 0; }

    size_t count() const { return n; }
    size_t capacity() const { return cap; }
    bool full() const { return n >= cap; }

    float& x(size_t i) { return xs[i]; }
    float& y(size_t i) { return ys[i]; }
    float& z(size_t i) { return zs[i]; }
    uint8_t& life(size_t i) { return lives[i]; }
    float x(size_t i) const { return xs[i]; }
    float y(size_t i) const { return ys[i]; }
    float z(size_t i) const { return zs[i]; }
    uint8_t life(size_t i) const { return lives[i]; }

private:
    size_t cap;
    size_t n{0};
    std::vector<float> xs, ys, zs;
    std::vector<uint8_t> lives;
};
