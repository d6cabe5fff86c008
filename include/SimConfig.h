/**
 * @file SimConfig.h
 * @brief Tunables for the rain simulation plus the environment/command-line layers that override them.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @struct SimConfig
 * @brief Every simulation constant that is not part of the frame-buffer contract.
 *
 * Defaults reproduce the stock look. Values are clamped by validate(); the simulation
 * assumes a validated config.
 */
struct SimConfig {
    // Pool capacities (fixed for the lifetime of a simulation)
    size_t maxDroplets{3000};
    size_t maxSplashes{200};
    size_t maxStreams{500};

    // Droplet spawning: expected count per tick = dropBase + width * dropsPerColumn
    float dropBase{1.0f};
    float dropsPerColumn{1.0f / 64.0f};
    float spawnHeadroom{15.0f};   /**< rows above the top edge a new droplet may start */

    // Fall speed in cells per tick; near drops fall fast, far drops slow
    float velNear{1.7f};
    float velFar{0.35f};
    float velJitter{0.2f};        /**< velocity multiplier is drawn from [1-j, 1+j] */
    float fallScaleNear{1.0f};
    float fallScaleFar{0.85f};

    // Ground-plane fallback as screen-height fractions keyed by z
    float groundNear{1.0f};
    float groundFar{0.4f};

    // Surface collision
    int depthMargin{48};
    int skyThreshold{30};

    // Spawn probabilities
    float surfaceSplashChance{1.0f};
    float groundSplashChance{0.7f};
    float streamChance{1.0f};

    // Splash animation
    int splashFrames{24};
    int splashFrameDivisor{3};
    float splashJitter{4.0f};

    // Streams
    float flowSpeed{0.4f};
    int flowLifetime{120};
    int flowMinComponent{10};     /**< packed |fx| or |fy| above this counts as flowing */
    int dripLifeThreshold{60};

    uint32_t seed{0xDEADBEEFu};

    /** @brief Clamp every field into its legal range; non-finite floats fall back to defaults. */
    void validate();

    /** @brief Apply RAIN_* environment overrides (unparsable values are ignored and logged). */
    void applyEnv();
};

/**
 * @struct HostOptions
 * @brief Options of the rain terminal program that are not simulation tunables.
 */
struct HostOptions {
    std::string scenePath;  /**< empty: use the built-in demo scene */
    int fps{30};
    bool showHelp{false};
};

/** @brief Parse a float; false on empty input, trailing garbage, or range errors. */
bool parseFloat(const char* s, float& out);
/** @brief Parse an unsigned 32-bit integer (decimal or 0x hex). */
bool parseUint32(const char* s, uint32_t& out);

/**
 * @brief Apply command-line flags to @p cfg and @p host.
 *
 * Accepts both "--flag value" and "--flag=value". Throws std::runtime_error naming the flag
 * on unknown arguments, missing values, or values that do not parse.
 */
void parseArgs(int argc, char** argv, SimConfig& cfg, HostOptions& host);

/** @brief Usage text for the rain program. */
std::string usageText(const char* prog);
