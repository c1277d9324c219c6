// ==============================================================================
// Float Classification and dB Conversion - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
// ==============================================================================

#include <chordpad/dsp/core/db_utils.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>

using namespace Chordpad::DSP;
using Catch::Approx;

TEST_CASE("isNaN and isFinite classify by bit pattern", "[core][db_utils]") {
    constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();
    constexpr float kInf = std::numeric_limits<float>::infinity();

    REQUIRE(detail::isNaN(kNaN));
    REQUIRE_FALSE(detail::isNaN(kInf));
    REQUIRE_FALSE(detail::isNaN(0.0f));

    REQUIRE(detail::isFinite(1.0f));
    REQUIRE(detail::isFinite(-0.0f));
    REQUIRE_FALSE(detail::isFinite(kNaN));
    REQUIRE_FALSE(detail::isFinite(kInf));
    REQUIRE_FALSE(detail::isFinite(-kInf));

    static_assert(!detail::isNaN(1.0f));
}

TEST_CASE("flushDenormal zeroes tiny values only", "[core][db_utils]") {
    REQUIRE(detail::flushDenormal(1e-20f) == 0.0f);
    REQUIRE(detail::flushDenormal(-1e-20f) == 0.0f);
    REQUIRE(detail::flushDenormal(1e-6f) == 1e-6f);
}

TEST_CASE("constexprExp tracks std::exp", "[core][db_utils]") {
    for (float x : {-10.0f, -1.0f, -0.25f, 0.0f, 0.5f, 1.0f, 3.0f, 8.0f}) {
        INFO("x = " << x);
        REQUIRE(detail::constexprExp(x) == Approx(std::exp(x)).epsilon(1e-5));
    }
    REQUIRE(detail::constexprExp(100.0f) == std::numeric_limits<float>::infinity());
    REQUIRE(detail::constexprExp(-100.0f) == 0.0f);
}

TEST_CASE("gainToDb converts linear gain to decibels", "[core][db_utils]") {
    SECTION("unity gain is 0 dB") {
        REQUIRE(gainToDb(1.0f) == Approx(0.0f).margin(1e-5f));
    }

    SECTION("half gain is about -6 dB") {
        REQUIRE(gainToDb(0.5f) == Approx(-6.0206f).margin(0.001f));
    }

    SECTION("silence and invalid input hit the floor") {
        REQUIRE(gainToDb(0.0f) == kSilenceFloorDb);
        REQUIRE(gainToDb(-1.0f) == kSilenceFloorDb);
        REQUIRE(gainToDb(std::numeric_limits<float>::quiet_NaN()) == kSilenceFloorDb);
        REQUIRE(gainToDb(1e-10f) == kSilenceFloorDb);
    }
}
