/**
 * @file DemoScene.cpp
 * @brief Procedural street scene.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "DemoScene.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

SceneGeometry makeDemoScene(int width, int height) {
    const size_t n = static_cast<size_t>(std::max(0, width)) * static_cast<size_t>(std::max(0, height));
    std::vector<uint8_t> depth(n, 0);
    std::vector<uint8_t> ground(n, 0);

    const float fw = static_cast<float>(width);
    const float fh = static_cast<float>(height);
    const int horizon = static_cast<int>(fh * 0.6f);

    // House: walls from 30% to 65% of the width, eaves at 40% of the height, ridge above.
    const float left = fw * 0.30f;
    const float right = fw * 0.65f;
    const float mid = (left + right) * 0.5f;
    const float eaves = fh * 0.40f;
    const float ridge = fh * 0.18f;

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            size_t i = static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x);
            float fx = static_cast<float>(x) + 0.5f;
            float fy = static_cast<float>(y) + 0.5f;

            if (y >= horizon) {
                // Road: nearer (deeper value) toward the bottom, with a gentle crown to the right.
                float t = (fy - static_cast<float>(horizon)) / std::max(1.0f, fh - static_cast<float>(horizon));
                float camber = 12.0f * (fx / std::max(1.0f, fw));
                depth[i] = static_cast<uint8_t>(std::min(255.0f, 90.0f + 150.0f * t + camber));
                ground[i] = 1;
                continue;
            }
            if (fx < left || fx > right) continue;

            float slope = (eaves - ridge) / std::max(1.0f, mid - left);
            float roofTop = ridge + slope * std::fabs(fx - mid);
            if (fy < roofTop) continue;
            if (fy < eaves + 1.0f) {
                // Roof faces lean away from the ridge so rain runs off both sides.
                float lean = 10.0f * (fx - mid) / std::max(1.0f, mid - left);
                depth[i] = static_cast<uint8_t>(std::max(0.0f, std::min(255.0f, 140.0f + lean)));
                ground[i] = 1;
            } else {
                depth[i] = 140;
            }
        }
    }

    return SceneGeometry::fromDepth(width, height, std::move(depth), std::move(ground));
}
