/**
 * @file WorldQuery.cpp
 * @brief Scale-factor maintenance for WorldQuery; the queries themselves are inline.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "WorldQuery.h"

WorldQuery::WorldQuery(const SceneGeometry& scene, int screenW, int screenH)
    : geo(scene) {
    setScreenSize(screenW, screenH);
}

void WorldQuery::setScreenSize(int screenW, int screenH) {
    // A degenerate screen maps everything onto cell 0; the core never queries it anyway.
    sx = screenW > 0 ? static_cast<float>(geo.width()) / static_cast<float>(screenW) : 0.0f;
    sy = screenH > 0 ? static_cast<float>(geo.height()) / static_cast<float>(screenH) : 0.0f;
}
