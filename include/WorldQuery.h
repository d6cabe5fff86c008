/**
 * @file WorldQuery.h
 * @brief Screen-space lookups into the scene maps: depth, ground membership, flow, normals.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "SceneGeometry.h"

#include <cmath>
#include <cstdint>
#include <cstdlib>

/** @brief A 2D vector sample (flow or normal), components roughly in [-1,1]. */
struct Vec2f {
    float x{0.0f};
    float y{0.0f};
};

/**
 * @class WorldQuery
 * @brief Binds a SceneGeometry to a screen size and answers per-entity queries.
 *
 * Every query takes screen coordinates, maps them to the background grid with the cached
 * scale factors, and returns a neutral value (depth 0, not ground, zero vector) outside the
 * grid. Queries never allocate and never throw; they run once per live entity per tick.
 */
class WorldQuery {
public:
    WorldQuery(const SceneGeometry& scene, int screenW, int screenH);

    /** @brief Recompute the screen→background scale factors (call on resize). */
    void setScreenSize(int screenW, int screenH);

    const SceneGeometry& scene() const { return geo; }
    float scaleX() const { return sx; }
    float scaleY() const { return sy; }

    /** @brief Map a screen coordinate to a background cell; false when outside the grid. */
    bool toBackground(float x, float y, int& bx, int& by) const {
        if (!(x >= 0.0f) || !(y >= 0.0f)) return false;
        bx = static_cast<int>(x * sx);
        by = static_cast<int>(y * sy);
        return bx < geo.width() && by < geo.height();
    }

    /** @brief Scene depth 0..255 (0 is sky/far). */
    uint8_t depthAt(float x, float y) const {
        int bx, by;
        return toBackground(x, y, bx, by) ? geo.depth(bx, by) : uint8_t{0};
    }
    bool isGround(float x, float y) const {
        int bx, by;
        return toBackground(x, y, bx, by) && geo.ground(bx, by);
    }
    /** @brief Flow direction, packed values divided by 127. */
    Vec2f flowAt(float x, float y) const {
        int bx, by;
        if (!toBackground(x, y, bx, by)) return Vec2f{};
        return Vec2f{geo.flowX(bx, by) / 127.0f, geo.flowY(bx, by) / 127.0f};
    }
    /** @brief Outward surface normal, packed values divided by 127. */
    Vec2f normalAt(float x, float y) const {
        int bx, by;
        if (!toBackground(x, y, bx, by)) return Vec2f{};
        return Vec2f{geo.normalX(bx, by) / 127.0f, geo.normalY(bx, by) / 127.0f};
    }
    /** @brief True when either packed flow component exceeds @p minComponent in magnitude. */
    bool hasFlow(float x, float y, int minComponent) const {
        int bx, by;
        if (!toBackground(x, y, bx, by)) return false;
        return std::abs(static_cast<int>(geo.flowX(bx, by))) > minComponent ||
               std::abs(static_cast<int>(geo.flowY(bx, by))) > minComponent;
    }
    /** @brief Flow magnitude in [0,1]. */
    float flowStrength(float x, float y) const {
        Vec2f f = flowAt(x, y);
        return std::fmin(1.0f, std::sqrt(f.x * f.x + f.y * f.y));
    }

    /**
     * @brief Whether an entity at depth @p z touches the scene surface at (x,y).
     *
     * True iff the scene depth is above @p skyThreshold and |(1-z)*255 - depth| < @p margin.
     */
    bool hitsSurface(float x, float y, float z, int margin, int skyThreshold) const {
        int bx, by;
        if (!toBackground(x, y, bx, by)) return false;
        return hitsDepth(geo.depth(bx, by), z, margin, skyThreshold);
    }

    /** @brief The depth-match rule on its own, for a known scene depth. */
    static bool hitsDepth(int sceneDepth, float z, int margin, int skyThreshold) {
        if (sceneDepth <= skyThreshold) return false;
        float dropDepth = (1.0f - z) * 255.0f;
        return std::fabs(dropDepth - static_cast<float>(sceneDepth)) < static_cast<float>(margin);
    }

private:
    const SceneGeometry& geo;
    float sx{0.0f};
    float sy{0.0f};
};
