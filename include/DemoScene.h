/**
 * @file DemoScene.h
 * @brief Built-in procedural scene used when no scene file is given.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "SceneGeometry.h"

/**
 * @brief A street at night: a house with a pitched roof mid-distance and a road that slopes
 * toward the viewer and drains to the right. Roof and road are ground; the sky is depth 0.
 *
 * Throws std::invalid_argument for non-positive dimensions.
 */
SceneGeometry makeDemoScene(int width, int height);
