// Unit tests for keyframe sampling: keyframe lookup, exactness at integer
// phases, continuity towards the next keyframe, and partial keyframes
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <limits>

#include "PoseLibrary.h"
#include "motion/PoseInterpolator.h"

using namespace BioSkel;
using Catch::Approx;

static const Drill kAllDrills[] = {
    Drill::HipDrive, Drill::LowContact, Drill::ArmExtension, Drill::AthleticStance
};

static void checkPosesClose(const Pose &a, const Pose &b, double margin) {
    for (size_t j = 0; j < kJointCount; ++j) {
        JointId joint = static_cast<JointId>(j);
        INFO("joint " << jointName(joint));
        REQUIRE(a.has(joint) == b.has(joint));
        if (!a.has(joint))
            continue;
        CHECK(a.get(joint).x == Approx(b.get(joint).x).margin(margin));
        CHECK(a.get(joint).y == Approx(b.get(joint).y).margin(margin));
        CHECK(a.get(joint).z == Approx(b.get(joint).z).margin(margin));
    }
}

// ---- Test cases ----

TEST_CASE("Keyframe lookup", "[interp][cursor]") {
    KeyframeCursor c = locateKeyframes(4, 1.5);
    CHECK(c.from == 1);
    CHECK(c.to == 2);
    CHECK(c.frameT == Approx(0.5));

    // period is N-1 = 3
    c = locateKeyframes(4, 3.25);
    CHECK(c.from == 0);
    CHECK(c.to == 1);
    CHECK(c.frameT == Approx(0.25));

    c = locateKeyframes(4, 2.999);
    CHECK(c.from == 2);
    CHECK(c.to == 3);

    SECTION("degenerate input") {
        CHECK(locateKeyframes(0, 1.0).from == 0);
        CHECK(locateKeyframes(1, 1.0).to == 0);
        c = locateKeyframes(3, -4.0);
        CHECK(c.from == 0);
        CHECK(c.frameT == 0.0);
        c = locateKeyframes(3, std::numeric_limits<double>::quiet_NaN());
        CHECK(c.from == 0);
        CHECK(c.frameT == 0.0);
    }
}

TEST_CASE("Interpolation is exact at integer phases", "[interp][exact]") {
    const PoseLibrary &lib = PoseLibrary::instance();

    for (Drill drill : kAllDrills) {
        const PoseSequence &seq = lib.sequence(drill);
        const size_t n = seq.size();
        INFO("drill " << drillName(drill));

        for (size_t i = 0; i < 25; ++i) {
            INFO("phase " << i);
            Pose p = interpolatePose(seq, static_cast<double>(i));
            CHECK(p == seq[i % (n - 1)]);
            if (i < n)
                CHECK(p == seq[i % n]);
        }
    }
}

TEST_CASE("Interpolation converges to the next keyframe", "[interp][continuity]") {
    const PoseSequence &seq = PoseLibrary::instance().sequence(Drill::HipDrive);

    for (size_t i = 0; i + 1 < seq.size(); ++i) {
        INFO("segment " << i);
        Pose nearEnd = interpolatePose(seq, static_cast<double>(i) + 1.0 - 1.0e-6);
        checkPosesClose(nearEnd, seq[i + 1], 1.0e-3);

        Pose nearStart = interpolatePose(seq, static_cast<double>(i) + 1.0e-6);
        checkPosesClose(nearStart, seq[i], 1.0e-3);
    }
}

TEST_CASE("Midpoint blends componentwise", "[interp][lerp]") {
    const PoseSequence &seq = PoseLibrary::instance().sequence(Drill::HipDrive);
    Pose mid = interpolatePose(seq, 1.5);

    for (size_t j = 0; j < kJointCount; ++j) {
        JointId joint = static_cast<JointId>(j);
        Vector3 expected = (seq[1].get(joint) + seq[2].get(joint)) * 0.5f;
        CHECK(mid.get(joint).x == Approx(expected.x));
        CHECK(mid.get(joint).y == Approx(expected.y));
        CHECK(mid.get(joint).z == Approx(expected.z));
    }
}

TEST_CASE("Joints missing from one keyframe hold the other", "[interp][partial]") {
    Pose a;
    Pose b;
    a.set(JointId::Head, Vector3(0.0f, -40.0f, 0.0f));
    b.set(JointId::Head, Vector3(0.0f, -50.0f, 0.0f));
    a.set(JointId::LeftHand, Vector3(-10.0f, 0.0f, 0.0f));   // earlier only
    b.set(JointId::RightHand, Vector3(10.0f, 0.0f, 0.0f));   // later only

    Pose out = lerpPose(a, b, 0.5f);

    CHECK(out.get(JointId::Head).y == Approx(-45.0f));
    REQUIRE(out.has(JointId::LeftHand));
    CHECK(out.get(JointId::LeftHand) == a.get(JointId::LeftHand));
    REQUIRE(out.has(JointId::RightHand));
    CHECK(out.get(JointId::RightHand) == b.get(JointId::RightHand));
    CHECK_FALSE(out.has(JointId::LeftKnee));
    CHECK(out.size() == 3);

    SECTION("through interpolatePose") {
        PoseSequence seq = {a, b, a};
        Pose p = interpolatePose(seq, 0.25);
        CHECK(p.get(JointId::LeftHand) == a.get(JointId::LeftHand));
        CHECK(p.get(JointId::Head).y == Approx(-42.5f));
    }
}

TEST_CASE("Short sequences", "[interp][edge]") {
    CHECK(interpolatePose(PoseSequence(), 3.0).size() == 0);

    const Pose &base = PoseLibrary::instance().basePose();
    PoseSequence one = {base};
    CHECK(interpolatePose(one, 7.3) == base);
}
