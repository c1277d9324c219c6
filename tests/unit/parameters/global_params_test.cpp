// ==============================================================================
// Global Parameters Unit Tests
// ==============================================================================

#include "parameters/global_params.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <limits>
#include <string>

using Catch::Approx;
using namespace Chordpad;

TEST_CASE("Velocity normalization", "[params][global]") {
    SECTION("normalized 0.0 -> 1") {
        REQUIRE(velocityFromNormalized(0.0) == 1);
    }
    SECTION("normalized 1.0 -> 127") {
        REQUIRE(velocityFromNormalized(1.0) == 127);
    }
    SECTION("normalized 0.5 -> 64") {
        REQUIRE(velocityFromNormalized(0.5) == 64);
    }
    SECTION("out of range clamps") {
        REQUIRE(velocityFromNormalized(-2.0) == 1);
        REQUIRE(velocityFromNormalized(3.0) == 127);
        REQUIRE(velocityFromNormalized(std::numeric_limits<double>::quiet_NaN()) == 1);
    }
}

TEST_CASE("Global parameter changes", "[params][global]") {
    GlobalParams params;
    REQUIRE(params.masterVolume.load() == Approx(DSP::kDefaultMasterVolume));
    REQUIRE(params.velocity.load() == kDefaultControllerVelocity);

    SECTION("master volume is stored clamped") {
        REQUIRE(handleGlobalParamChange(params, kMasterVolumeId, 0.25));
        REQUIRE(params.masterVolume.load() == Approx(0.25f));

        REQUIRE(handleGlobalParamChange(params, kMasterVolumeId, 4.0));
        REQUIRE(params.masterVolume.load() == 1.0f);

        REQUIRE(handleGlobalParamChange(params, kMasterVolumeId,
                                        std::numeric_limits<double>::quiet_NaN()));
        REQUIRE(params.masterVolume.load() == 0.0f);
    }

    SECTION("velocity") {
        REQUIRE(handleGlobalParamChange(params, kVelocityId, 1.0));
        REQUIRE(params.velocity.load() == 127);
    }

    SECTION("other ids are not global") {
        REQUIRE_FALSE(handleGlobalParamChange(params, kOsc1LevelId, 0.5));
        REQUIRE_FALSE(handleGlobalParamChange(params, 2, 0.5));
    }
}

TEST_CASE("Global parameter display", "[params][global]") {
    char text[32] = {};

    REQUIRE(formatGlobalParam(kMasterVolumeId, 0.5, text, sizeof(text)));
    REQUIRE(std::string(text) == "50%");

    REQUIRE(formatGlobalParam(kMasterVolumeId, std::numeric_limits<double>::quiet_NaN(),
                              text, sizeof(text)));
    REQUIRE(std::string(text) == "0%");

    REQUIRE(formatGlobalParam(kVelocityId, 1.0, text, sizeof(text)));
    REQUIRE(std::string(text) == "127");

    REQUIRE_FALSE(formatGlobalParam(kFilterCutoffId, 0.5, text, sizeof(text)));
    REQUIRE(std::string(text) == "127");
}
