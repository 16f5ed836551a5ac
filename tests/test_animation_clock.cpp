// Unit tests for the animation clock: analysis rotation, demo hold + half
// turn, the decoupled pose phase, and clock origin handling
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <string>

#include "motion/AnimationClock.h"

using namespace BioSkel;
using Catch::Approx;

// ---- Test cases ----

TEST_CASE("Analysis mode: one revolution per 6000 ms", "[clock][analysis]") {
    CHECK(analysisViewAngle(0.0) == 0.0);
    CHECK(analysisViewAngle(1500.0) == Approx(kPi / 2.0));
    CHECK(analysisViewAngle(3000.0) == Approx(kPi));
    CHECK(analysisViewAngle(4500.0) == Approx(kPi * 1.5));
    // wraps instead of growing
    CHECK(analysisViewAngle(6000.0) == Approx(0.0).margin(1e-12));
    CHECK(analysisViewAngle(7500.0) == Approx(kPi / 2.0));

    ClockSample s = sampleClock(1500.0, OperatingMode::Analysis);
    CHECK(s.viewAngle == Approx(kPi / 2.0));
    CHECK(s.posePhase == 0.0);
}

TEST_CASE("Demo mode faces forward for the first 7000 ms of every cycle", "[clock][demo]") {
    const double cycleStarts[] = {0.0, 9000.0, 18000.0, 9000.0 * 12345.0, 9000.0 * 1.0e9};

    for (double start : cycleStarts) {
        for (double offset = 0.0; offset < 7000.0; offset += 250.0) {
            INFO("t = " << start + offset);
            CHECK(demoViewAngle(start + offset) == 0.0);
        }
        CHECK(demoViewAngle(start + 6999.0) == 0.0);
    }
}

TEST_CASE("Demo mode half turn over the last 2000 ms", "[clock][demo]") {
    CHECK(demoViewAngle(7000.0) == Approx(0.0).margin(1e-12));
    CHECK(demoViewAngle(7500.0) == Approx(kPi / 4.0));
    CHECK(demoViewAngle(8000.0) == Approx(kPi / 2.0));
    CHECK(demoViewAngle(8999.0) == Approx(kPi * 1999.0 / 2000.0));
    CHECK(demoViewAngle(9000.0) == 0.0);

    // same shape in a later cycle
    CHECK(demoViewAngle(9000.0 * 40.0 + 8000.0) == Approx(kPi / 2.0));

    // monotonic ramp inside the window
    double prev = -1.0;
    for (double t = 7000.0; t < 9000.0; t += 100.0) {
        double a = demoViewAngle(t);
        CHECK(a > prev);
        CHECK(a <= kPi);
        prev = a;
    }
}

TEST_CASE("Pose phase runs continuously and ignores the rotation cycle", "[clock][demo]") {
    CHECK(drillPosePhase(0.0) == 0.0);
    CHECK(drillPosePhase(2000.0) == 1.0);
    CHECK(drillPosePhase(4000.0) == 2.0);
    CHECK(drillPosePhase(9000.0) == 4.5);
    CHECK(drillPosePhase(18000.0) == 9.0);

    ClockSample s = sampleClock(9000.0, OperatingMode::Demo);
    CHECK(s.viewAngle == 0.0);
    CHECK(s.posePhase == 4.5);
    CHECK(s.timeMs == 9000.0);
}

TEST_CASE("Clock tolerates degenerate times", "[clock][edge]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    SECTION("t = 0") {
        ClockSample a = sampleClock(0.0, OperatingMode::Analysis);
        ClockSample d = sampleClock(0.0, OperatingMode::Demo);
        CHECK(a.viewAngle == 0.0);
        CHECK(d.viewAngle == 0.0);
        CHECK(d.posePhase == 0.0);
    }

    SECTION("negative and non-finite read as 0") {
        CHECK(sanitizeClockTime(-5.0) == 0.0);
        CHECK(sanitizeClockTime(nan) == 0.0);
        CHECK(sanitizeClockTime(inf) == 0.0);
        CHECK(demoViewAngle(nan) == 0.0);
        CHECK(drillPosePhase(-100.0) == 0.0);
    }

    SECTION("very large t stays in range") {
        const double big = 1.0e15 + 1234.5;
        double a = analysisViewAngle(big);
        double d = demoViewAngle(big);
        CHECK(std::isfinite(a));
        CHECK(a >= 0.0);
        CHECK(a < kTwoPi);
        CHECK(std::isfinite(d));
        CHECK(d >= 0.0);
        CHECK(d <= kPi);
        CHECK(std::isfinite(drillPosePhase(big)));
    }
}

TEST_CASE("AnimationClock measures from its origin", "[clock][object]") {
    AnimationClock clock(OperatingMode::Demo, 1000.0);
    CHECK(clock.mode() == OperatingMode::Demo);
    CHECK(clock.origin() == 1000.0);

    CHECK(clock.elapsed(3000.0) == 2000.0);
    CHECK(clock.sample(3000.0).posePhase == 1.0);

    // host time before the origin
    CHECK(clock.elapsed(500.0) == 0.0);
    CHECK(clock.sample(500.0).posePhase == 0.0);

    SECTION("mode switch is a fresh clock at the new time") {
        clock = AnimationClock(OperatingMode::Analysis, 5000.0);
        ClockSample s = clock.sample(6500.0);
        CHECK(s.timeMs == 1500.0);
        CHECK(s.viewAngle == Approx(kPi / 2.0));
        CHECK(s.posePhase == 0.0);
    }

    SECTION("sampling does not change the clock") {
        ClockSample first = clock.sample(4321.0);
        clock.sample(100000.0);
        ClockSample again = clock.sample(4321.0);
        CHECK(first.viewAngle == again.viewAngle);
        CHECK(first.posePhase == again.posePhase);
    }
}

TEST_CASE("Mode names", "[clock][mode]") {
    CHECK(std::string(modeName(OperatingMode::Analysis)) == "analysis");
    CHECK(std::string(modeName(OperatingMode::Demo)) == "demo");
    REQUIRE(parseMode("demo").has_value());
    CHECK(*parseMode("demo") == OperatingMode::Demo);
    CHECK_FALSE(parseMode("Demo").has_value());
    CHECK_FALSE(parseMode("").has_value());
}
