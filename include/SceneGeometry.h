/**
 * @file SceneGeometry.h
 * @brief Immutable pre-baked scene maps (depth, ground mask, normals, flow) that rain collides with.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @class SceneGeometry
 * @brief Read-only W×H background grid; all planes share one row-major layout.
 *
 * Depth 0 is far/sky and 255 is nearest. Normals and flow are packed signed bytes where
 * ±127 means ±1.0. Flow is zero wherever the ground mask is clear; the constructor enforces it.
 * Dimension or shape violations throw std::invalid_argument, so a constructed scene is always
 * consistent and nothing downstream checks again.
 */
class SceneGeometry {
public:
    SceneGeometry(int width, int height,
                  std::vector<uint8_t> depth,
                  std::vector<uint8_t> ground,
                  std::vector<int8_t> normalX,
                  std::vector<int8_t> normalY,
                  std::vector<int8_t> flowX,
                  std::vector<int8_t> flowY);

    /**
     * @brief Build a scene from depth and ground planes, deriving normals and flow.
     *
     * Normals use central differences; flow follows a multi-scale depth gradient with a
     * horizontal boost and a small gravity bias. Cells within 10 of the border get no flow.
     */
    static SceneGeometry fromDepth(int width, int height,
                                   std::vector<uint8_t> depth,
                                   std::vector<uint8_t> ground);

    /** @brief Load a .dscene file; throws std::runtime_error on I/O or format errors. */
    static SceneGeometry loadFile(const std::string& path);
    /** @brief Write this scene as a .dscene file; throws std::runtime_error on I/O errors. */
    void saveFile(const std::string& path) const;

    int width() const { return w; }
    int height() const { return h; }
    /** @brief True if at least one cell belongs to the ground mask. */
    bool hasGround() const { return groundCells > 0; }
    /** @brief Largest depth of any ground cell; 0 when there is no ground. */
    uint8_t maxGroundDepth() const { return groundDepthMax; }

    // Unchecked accessors; callers bounds-check (see WorldQuery).
    uint8_t depth(int x, int y) const { return depthPlane[idx(x, y)]; }
    bool ground(int x, int y) const { return groundPlane[idx(x, y)] != 0; }
    int8_t normalX(int x, int y) const { return normalXPlane[idx(x, y)]; }
    int8_t normalY(int x, int y) const { return normalYPlane[idx(x, y)]; }
    int8_t flowX(int x, int y) const { return flowXPlane[idx(x, y)]; }
    int8_t flowY(int x, int y) const { return flowYPlane[idx(x, y)]; }

    static constexpr uint32_t FileVersion = 1;

private:
    size_t idx(int x, int y) const { return static_cast<size_t>(y) * static_cast<size_t>(w) + static_cast<size_t>(x); }

    int w, h;
    std::vector<uint8_t> depthPlane;
    std::vector<uint8_t> groundPlane;
    std::vector<int8_t> normalXPlane, normalYPlane;
    std::vector<int8_t> flowXPlane, flowYPlane;
    size_t groundCells{0};
    uint8_t groundDepthMax{0};
};
