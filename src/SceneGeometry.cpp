/**
 * @file SceneGeometry.cpp
 * @brief Scene validation, derived-map computation, and .dscene file I/O.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SceneGeometry.h"
#include "Logger.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace {
const char FileMagic[4] = {'D', 'S', 'C', 'N'};
const size_t PlaneCount = 6;

inline int8_t packUnit(float v) {
    return static_cast<int8_t>(std::max(-127.0f, std::min(127.0f, v * 127.0f)));
}

template <typename T>
void requireSize(const std::vector<T>& plane, size_t expected, const char* name) {
    if (plane.size() != expected) {
        throw std::invalid_argument(std::string("scene plane '") + name + "' has " +
                                    std::to_string(plane.size()) + " cells, expected " +
                                    std::to_string(expected));
    }
}

/** @brief Copy the first inner row/column over the border (derived maps are undefined there). */
void fillEdges(std::vector<int8_t>& plane, int w, int h) {
    if (w < 2 || h < 2) return;
    for (int y = 0; y < h; ++y) {
        plane[(size_t)y * w] = plane[(size_t)y * w + 1];
        plane[(size_t)y * w + (w - 1)] = plane[(size_t)y * w + (w - 2)];
    }
    for (int x = 0; x < w; ++x) {
        plane[(size_t)x] = plane[(size_t)w + x];
        plane[(size_t)(h - 1) * w + x] = plane[(size_t)(h - 2) * w + x];
    }
}

void writeU32(std::ostream& os, uint32_t v) {
    char b[4] = {(char)(v & 0xFF), (char)((v >> 8) & 0xFF), (char)((v >> 16) & 0xFF), (char)((v >> 24) & 0xFF)};
    os.write(b, 4);
}

uint32_t readU32(std::istream& is, const std::string& path) {
    unsigned char b[4];
    if (!is.read(reinterpret_cast<char*>(b), 4)) throw std::runtime_error("truncated scene header: " + path);
    return (uint32_t)b[0] | ((uint32_t)b[1] << 8) | ((uint32_t)b[2] << 16) | ((uint32_t)b[3] << 24);
}

template <typename T>
void readPlane(std::istream& is, std::vector<T>& plane, size_t n, const std::string& path) {
    plane.resize(n);
    if (!is.read(reinterpret_cast<char*>(plane.data()), static_cast<std::streamsize>(n)))
        throw std::runtime_error("truncated scene data: " + path);
}

template <typename T>
void writePlane(std::ostream& os, const std::vector<T>& plane) {
    os.write(reinterpret_cast<const char*>(plane.data()), static_cast<std::streamsize>(plane.size()));
}
}

SceneGeometry::SceneGeometry(int width, int height,
                             std::vector<uint8_t> depth,
                             std::vector<uint8_t> ground,
                             std::vector<int8_t> normalX,
                             std::vector<int8_t> normalY,
                             std::vector<int8_t> flowX,
                             std::vector<int8_t> flowY)
    : w(width), h(height),
      depthPlane(std::move(depth)), groundPlane(std::move(ground)),
      normalXPlane(std::move(normalX)), normalYPlane(std::move(normalY)),
      flowXPlane(std::move(flowX)), flowYPlane(std::move(flowY)) {
    if (w <= 0 || h <= 0) {
        throw std::invalid_argument("scene dimensions must be positive, got " +
                                    std::to_string(w) + "x" + std::to_string(h));
    }
    const size_t n = static_cast<size_t>(w) * static_cast<size_t>(h);
    requireSize(depthPlane, n, "depth");
    requireSize(groundPlane, n, "ground");
    requireSize(normalXPlane, n, "normal_x");
    requireSize(normalYPlane, n, "normal_y");
    requireSize(flowXPlane, n, "flow_x");
    requireSize(flowYPlane, n, "flow_y");

    for (size_t i = 0; i < n; ++i) {
        if (groundPlane[i]) {
            groundPlane[i] = 1;
            ++groundCells;
            groundDepthMax = std::max(groundDepthMax, depthPlane[i]);
        } else {
            flowXPlane[i] = 0;
            flowYPlane[i] = 0;
        }
    }
}

SceneGeometry SceneGeometry::fromDepth(int width, int height,
                                       std::vector<uint8_t> depth,
                                       std::vector<uint8_t> ground) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("scene dimensions must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    const size_t n = static_cast<size_t>(width) * static_cast<size_t>(height);
    requireSize(depth, n, "depth");
    requireSize(ground, n, "ground");

    std::vector<float> d(n);
    for (size_t i = 0; i < n; ++i) d[i] = depth[i] / 255.0f;
    auto at = [&](int x, int y) { return d[(size_t)y * width + x]; };

    std::vector<int8_t> nx(n, 0), ny(n, 0);
    const float normalScale = 50.0f;
    for (int y = 1; y < height - 1; ++y) {
        for (int x = 1; x < width - 1; ++x) {
            float dzdx = (at(x + 1, y) - at(x - 1, y)) * normalScale;
            float dzdy = (at(x, y + 1) - at(x, y - 1)) * normalScale;
            float len = std::sqrt(dzdx * dzdx + dzdy * dzdy + 1.0f);
            nx[(size_t)y * width + x] = packUnit(-dzdx / len);
            ny[(size_t)y * width + x] = packUnit(-dzdy / len);
        }
    }
    fillEdges(nx, width, height);
    fillEdges(ny, width, height);

    // Water runs toward larger depth (lower ground); fine/medium/coarse gradient taps.
    std::vector<int8_t> fx(n, 0), fy(n, 0);
    const std::array<std::pair<int, float>, 3> scales{{{2, 0.25f}, {5, 0.40f}, {10, 0.35f}}};
    const float horizontalBoost = 2.5f;
    const int margin = 10;
    for (int y = margin; y < height - margin; ++y) {
        for (int x = margin; x < width - margin; ++x) {
            size_t i = (size_t)y * width + x;
            if (!ground[i]) continue;
            float gx = 0.0f, gy = 0.0f;
            for (const auto& s : scales) {
                gx += (at(x + s.first, y) - at(x - s.first, y)) * s.second * horizontalBoost;
                gy += (at(x, y + s.first) - at(x, y - s.first)) * s.second;
            }
            gy += 0.02f;
            float len = std::sqrt(gx * gx + gy * gy);
            if (len > 0.001f) {
                float strength = std::min(1.0f, len * 8.0f + 0.4f);
                fx[i] = packUnit(gx / len * strength);
                fy[i] = packUnit(gy / len * strength);
            } else {
                fy[i] = 51;
            }
        }
    }

    return SceneGeometry(width, height, std::move(depth), std::move(ground),
                         std::move(nx), std::move(ny), std::move(fx), std::move(fy));
}

SceneGeometry SceneGeometry::loadFile(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) throw std::runtime_error("cannot open scene file: " + path);

    char magic[4];
    if (!in.read(magic, 4)) throw std::runtime_error("truncated scene header: " + path);
    if (!std::equal(magic, magic + 4, FileMagic)) throw std::runtime_error("not a scene file: " + path);
    uint32_t version = readU32(in, path);
    if (version != FileVersion)
        throw std::runtime_error("unsupported scene version " + std::to_string(version) + ": " + path);
    uint32_t sw = readU32(in, path);
    uint32_t sh = readU32(in, path);
    if (sw == 0 || sh == 0 || sw > 16384 || sh > 16384)
        throw std::runtime_error("bad scene dimensions " + std::to_string(sw) + "x" + std::to_string(sh) + ": " + path);

    const size_t n = static_cast<size_t>(sw) * static_cast<size_t>(sh);
    const std::streampos dataStart = in.tellg();
    in.seekg(0, std::ios::end);
    const std::streamoff remaining = in.tellg() - dataStart;
    if (dataStart == std::streampos(-1) || remaining < static_cast<std::streamoff>(n * PlaneCount))
        throw std::runtime_error("truncated scene data: " + path);
    in.seekg(dataStart);

    std::vector<uint8_t> depth, ground;
    std::vector<int8_t> nx, ny, fx, fy;
    readPlane(in, depth, n, path);
    readPlane(in, ground, n, path);
    readPlane(in, nx, n, path);
    readPlane(in, ny, n, path);
    readPlane(in, fx, n, path);
    readPlane(in, fy, n, path);

    Logger::info("scene loaded: " + path + " (" + std::to_string(sw) + "x" + std::to_string(sh) + ")");
    return SceneGeometry((int)sw, (int)sh, std::move(depth), std::move(ground),
                         std::move(nx), std::move(ny), std::move(fx), std::move(fy));
}

void SceneGeometry::saveFile(const std::string& path) const {
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot create scene file: " + path);
    out.write(FileMagic, 4);
    writeU32(out, FileVersion);
    writeU32(out, static_cast<uint32_t>(w));
    writeU32(out, static_cast<uint32_t>(h));
    writePlane(out, depthPlane);
    writePlane(out, groundPlane);
    writePlane(out, normalXPlane);
    writePlane(out, normalYPlane);
    writePlane(out, flowXPlane);
    writePlane(out, flowYPlane);
    out.flush();
    if (!out) throw std::runtime_error("failed writing scene file: " + path);
}
