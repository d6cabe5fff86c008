/**
 * @file SimConfigTest.cpp
 * @brief Config validation plus environment and command-line layers.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SimConfig.h"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
// Owns argv storage for parseArgs.
class Argv {
public:
    Argv(std::initializer_list<const char*> args) {
        store.emplace_back("rain");
        for (const char* a : args) store.emplace_back(a);
        for (std::string& s : store) ptrs.push_back(&s[0]);
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(store.size()); }
    char** argv() { return ptrs.data(); }

private:
    std::vector<std::string> store;
    std::vector<char*> ptrs;
};

class SimConfigEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"RAIN_SEED", "RAIN_DROP_RATE", "RAIN_DEPTH_MARGIN",
                                 "RAIN_GROUND_NEAR", "RAIN_GROUND_FAR", "RAIN_SPLASH_CHANCE"}) {
            unsetenv(name);
        }
    }
};
}

TEST(SimConfigTest, DefaultsMatchTheStockLook) {
    SimConfig cfg;
    EXPECT_EQ(cfg.maxDroplets, 3000u);
    EXPECT_EQ(cfg.maxSplashes, 200u);
    EXPECT_EQ(cfg.maxStreams, 500u);
    EXPECT_EQ(cfg.depthMargin, 48);
    EXPECT_EQ(cfg.skyThreshold, 30);
    EXPECT_FLOAT_EQ(cfg.groundNear, 1.0f);
    EXPECT_FLOAT_EQ(cfg.groundFar, 0.4f);
    EXPECT_EQ(cfg.splashFrames, 24);
    EXPECT_EQ(cfg.flowLifetime, 120);
    EXPECT_EQ(cfg.seed, 0xDEADBEEFu);
}

TEST(SimConfigTest, ValidateClampsAndRepairs) {
    SimConfig cfg;
    cfg.maxDroplets = 0;
    cfg.surfaceSplashChance = 5.0f;
    cfg.groundSplashChance = -1.0f;
    cfg.velNear = std::numeric_limits<float>::quiet_NaN();
    cfg.splashFrames = 1000;
    cfg.flowLifetime = -3;
    cfg.depthMargin = -10;
    cfg.validate();

    EXPECT_EQ(cfg.maxDroplets, 1u);
    EXPECT_FLOAT_EQ(cfg.surfaceSplashChance, 1.0f);
    EXPECT_FLOAT_EQ(cfg.groundSplashChance, 0.0f);
    EXPECT_FLOAT_EQ(cfg.velNear, SimConfig{}.velNear);
    EXPECT_EQ(cfg.splashFrames, 255);
    EXPECT_EQ(cfg.flowLifetime, 1);
    EXPECT_EQ(cfg.depthMargin, 0);
}

TEST(SimConfigTest, ValidateLeavesDefaultsAlone) {
    SimConfig cfg;
    cfg.validate();
    SimConfig d;
    EXPECT_EQ(cfg.maxDroplets, d.maxDroplets);
    EXPECT_FLOAT_EQ(cfg.dropsPerColumn, d.dropsPerColumn);
    EXPECT_FLOAT_EQ(cfg.velFar, d.velFar);
    EXPECT_EQ(cfg.dripLifeThreshold, d.dripLifeThreshold);
}

TEST(SimConfigTest, ParseFloatRejectsGarbage) {
    float f = 0.0f;
    EXPECT_TRUE(parseFloat("1.5", f));
    EXPECT_FLOAT_EQ(f, 1.5f);
    EXPECT_FALSE(parseFloat("1.5x", f));
    EXPECT_FALSE(parseFloat("", f));
    EXPECT_FALSE(parseFloat(nullptr, f));
    EXPECT_FLOAT_EQ(f, 1.5f);
}

TEST(SimConfigTest, ParseUint32AcceptsHexAndRejectsOverflow) {
    uint32_t v = 0;
    EXPECT_TRUE(parseUint32("0x10", v));
    EXPECT_EQ(v, 16u);
    EXPECT_TRUE(parseUint32("4294967295", v));
    EXPECT_EQ(v, 0xFFFFFFFFu);
    EXPECT_FALSE(parseUint32("4294967296", v));
    EXPECT_FALSE(parseUint32("-1", v));
    EXPECT_FALSE(parseUint32("12abc", v));
}

TEST(SimConfigTest, ParseArgsAcceptsBothFlagForms) {
    Argv args{"--seed", "42", "--margin=30", "--ground-near", "0.9", "--ground-far=0.5",
              "--drop-rate", "0.25", "--splash-chance=0.5", "--scene", "street.dscene", "--fps=60"};
    SimConfig cfg;
    HostOptions host;
    parseArgs(args.argc(), args.argv(), cfg, host);

    EXPECT_EQ(cfg.seed, 42u);
    EXPECT_EQ(cfg.depthMargin, 30);
    EXPECT_FLOAT_EQ(cfg.groundNear, 0.9f);
    EXPECT_FLOAT_EQ(cfg.groundFar, 0.5f);
    EXPECT_FLOAT_EQ(cfg.dropsPerColumn, 0.25f);
    EXPECT_FLOAT_EQ(cfg.surfaceSplashChance, 0.5f);
    EXPECT_EQ(host.scenePath, "street.dscene");
    EXPECT_EQ(host.fps, 60);
    EXPECT_FALSE(host.showHelp);
}

TEST(SimConfigTest, ParseArgsHelp) {
    Argv args{"--help"};
    SimConfig cfg;
    HostOptions host;
    parseArgs(args.argc(), args.argv(), cfg, host);
    EXPECT_TRUE(host.showHelp);
    EXPECT_NE(usageText("rain").find("--scene"), std::string::npos);
}

TEST(SimConfigTest, ParseArgsReportsBadInput) {
    SimConfig cfg;
    HostOptions host;
    {
        Argv args{"--bogus"};
        EXPECT_THROW(parseArgs(args.argc(), args.argv(), cfg, host), std::runtime_error);
    }
    {
        Argv args{"--seed"};
        EXPECT_THROW(parseArgs(args.argc(), args.argv(), cfg, host), std::runtime_error);
    }
    {
        Argv args{"--drop-rate", "lots"};
        EXPECT_THROW(parseArgs(args.argc(), args.argv(), cfg, host), std::runtime_error);
    }
    {
        Argv args{"--fps=0"};
        EXPECT_THROW(parseArgs(args.argc(), args.argv(), cfg, host), std::runtime_error);
    }
    {
        Argv args{"--margin", "2.5"};
        EXPECT_THROW(parseArgs(args.argc(), args.argv(), cfg, host), std::runtime_error);
    }

    Argv args{"--seed", "nope"};
    try {
        parseArgs(args.argc(), args.argv(), cfg, host);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("--seed"), std::string::npos);
    }
}

TEST_F(SimConfigEnvTest, EnvironmentOverridesDefaults) {
    setenv("RAIN_SEED", "7", 1);
    setenv("RAIN_GROUND_FAR", "0.3", 1);
    setenv("RAIN_DEPTH_MARGIN", "abc", 1);
    SimConfig cfg;
    cfg.applyEnv();
    EXPECT_EQ(cfg.seed, 7u);
    EXPECT_FLOAT_EQ(cfg.groundFar, 0.3f);
    EXPECT_EQ(cfg.depthMargin, 48);  // unparsable value is ignored
}

TEST_F(SimConfigEnvTest, FlagsWinOverEnvironment) {
    setenv("RAIN_SEED", "7", 1);
    Argv args{"--seed=9"};
    SimConfig cfg;
    HostOptions host;
    cfg.applyEnv();
    parseArgs(args.argc(), args.argv(), cfg, host);
    EXPECT_EQ(cfg.seed, 9u);
}
