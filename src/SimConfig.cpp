/**
 * @file SimConfig.cpp
 * @brief Validation and environment/argument overrides for SimConfig.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SimConfig.h"
#include "Logger.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace {
float clampf(float v, float lo, float hi, float fallback) {
    if (!std::isfinite(v)) return fallback;
    return std::max(lo, std::min(hi, v));
}

int clampi(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }

bool parseInt(const char* s, int& out) {
    float tmp;
    if (!parseFloat(s, tmp)) return false;
    if (tmp != std::floor(tmp) || std::fabs(tmp) > 1.0e9f) return false;
    out = static_cast<int>(tmp);
    return true;
}

void envFloat(const char* name, float& field) {
    const char* v = std::getenv(name);
    if (!v) return;
    float tmp;
    if (parseFloat(v, tmp)) field = tmp;
    else Logger::warn(std::string("ignoring unparsable ") + name + "=" + v);
}
}

bool parseFloat(const char* s, float& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || errno != 0) return false;
    out = static_cast<float>(v);
    return true;
}

bool parseUint32(const char* s, uint32_t& out) {
    if (!s || !*s || *s == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 0);
    if (end == s || *end != '\0' || errno != 0 || v > 0xFFFFFFFFull) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

void SimConfig::validate() {
    const SimConfig d{};
    maxDroplets = std::max<size_t>(1, std::min<size_t>(maxDroplets, 1u << 20));
    maxSplashes = std::max<size_t>(1, std::min<size_t>(maxSplashes, 1u << 20));
    maxStreams  = std::max<size_t>(1, std::min<size_t>(maxStreams, 1u << 20));

    dropBase       = clampf(dropBase, 0.0f, 1000.0f, d.dropBase);
    dropsPerColumn = clampf(dropsPerColumn, 0.0f, 10.0f, d.dropsPerColumn);
    spawnHeadroom  = clampf(spawnHeadroom, 0.0f, 1000.0f, d.spawnHeadroom);

    velNear       = clampf(velNear, 0.01f, 50.0f, d.velNear);
    velFar        = clampf(velFar, 0.01f, 50.0f, d.velFar);
    velJitter     = clampf(velJitter, 0.0f, 0.95f, d.velJitter);
    fallScaleNear = clampf(fallScaleNear, 0.01f, 10.0f, d.fallScaleNear);
    fallScaleFar  = clampf(fallScaleFar, 0.01f, 10.0f, d.fallScaleFar);

    groundNear = clampf(groundNear, 0.0f, 2.0f, d.groundNear);
    groundFar  = clampf(groundFar, 0.0f, 2.0f, d.groundFar);

    depthMargin  = clampi(depthMargin, 0, 256);
    skyThreshold = clampi(skyThreshold, 0, 255);

    surfaceSplashChance = clampf(surfaceSplashChance, 0.0f, 1.0f, d.surfaceSplashChance);
    groundSplashChance  = clampf(groundSplashChance, 0.0f, 1.0f, d.groundSplashChance);
    streamChance        = clampf(streamChance, 0.0f, 1.0f, d.streamChance);

    // Frame counters are stored in a byte
    splashFrames       = clampi(splashFrames, 1, 255);
    splashFrameDivisor = clampi(splashFrameDivisor, 1, 255);
    splashJitter       = clampf(splashJitter, 0.0f, 64.0f, d.splashJitter);

    flowSpeed         = clampf(flowSpeed, 0.0f, 10.0f, d.flowSpeed);
    flowLifetime      = clampi(flowLifetime, 1, 255);
    flowMinComponent  = clampi(flowMinComponent, 0, 126);
    dripLifeThreshold = clampi(dripLifeThreshold, 0, 255);
}

void SimConfig::applyEnv() {
    if (const char* s = std::getenv("RAIN_SEED")) {
        uint32_t tmp;
        if (parseUint32(s, tmp)) seed = tmp;
        else Logger::warn(std::string("ignoring unparsable RAIN_SEED=") + s);
    }
    envFloat("RAIN_DROP_RATE", dropsPerColumn);
    envFloat("RAIN_GROUND_NEAR", groundNear);
    envFloat("RAIN_GROUND_FAR", groundFar);
    envFloat("RAIN_SPLASH_CHANCE", surfaceSplashChance);
    if (const char* s = std::getenv("RAIN_DEPTH_MARGIN")) {
        int tmp;
        if (parseInt(s, tmp)) depthMargin = tmp;
        else Logger::warn(std::string("ignoring unparsable RAIN_DEPTH_MARGIN=") + s);
    }
}

void parseArgs(int argc, char** argv, SimConfig& cfg, HostOptions& host) {
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        std::string name = a;
        std::string inlineValue;
        bool hasInline = false;
        size_t eq = a.find('=');
        if (a.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = a.substr(0, eq);
            inlineValue = a.substr(eq + 1);
            hasInline = true;
        }
        auto value = [&]() -> const char* {
            if (hasInline) return inlineValue.c_str();
            if (i + 1 < argc) return argv[++i];
            throw std::runtime_error("missing value for " + name);
        };
        auto bad = [&](const char* v) {
            std::ostringstream oss;
            oss << "invalid value for " << name << ": '" << (v ? v : "") << "'";
            return std::runtime_error(oss.str());
        };
        float f;
        if (name == "-h" || name == "--help") {
            host.showHelp = true;
        } else if (name == "--seed") {
            const char* v = value(); uint32_t s; if (!parseUint32(v, s)) throw bad(v); cfg.seed = s;
        } else if (name == "--drop-rate") {
            const char* v = value(); if (!parseFloat(v, f)) throw bad(v); cfg.dropsPerColumn = f;
        } else if (name == "--margin") {
            const char* v = value(); int m; if (!parseInt(v, m)) throw bad(v); cfg.depthMargin = m;
        } else if (name == "--ground-near") {
            const char* v = value(); if (!parseFloat(v, f)) throw bad(v); cfg.groundNear = f;
        } else if (name == "--ground-far") {
            const char* v = value(); if (!parseFloat(v, f)) throw bad(v); cfg.groundFar = f;
        } else if (name == "--splash-chance") {
            const char* v = value(); if (!parseFloat(v, f)) throw bad(v); cfg.surfaceSplashChance = f;
        } else if (name == "--scene") {
            host.scenePath = value();
        } else if (name == "--fps") {
            const char* v = value(); int fps; if (!parseInt(v, fps) || fps < 1 || fps > 240) throw bad(v); host.fps = fps;
        } else {
            throw std::runtime_error("unknown argument: " + a);
        }
    }
}

std::string usageText(const char* prog) {
    std::ostringstream oss;
    oss << "Usage: " << (prog ? prog : "rain")
        << " [--scene FILE] [--fps N] [--seed S] [--drop-rate R] [--margin M]"
           " [--ground-near F] [--ground-far F] [--splash-chance P]\n"
        << "Environment: RAIN_SEED RAIN_DROP_RATE RAIN_DEPTH_MARGIN RAIN_GROUND_NEAR"
           " RAIN_GROUND_FAR RAIN_SPLASH_CHANCE LOG_LEVEL\n";
    return oss.str();
}
