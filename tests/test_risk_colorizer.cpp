// Unit tests for risk tiers, per-joint colouring in both modes, bone colour
// tie-break and CSS colour parsing
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <limits>
#include <string>

#include "render/Color.h"
#include "render/RiskColorizer.h"

using namespace BioSkel;
using Catch::Approx;

static const Color kRed(0xef, 0x44, 0x44);
static const Color kAmber(0xf5, 0x9e, 0x0b);
static const Color kEmerald(0x10, 0xb9, 0x81);
static const Color kIdeal(0x22, 0xc5, 0x5e);
static const Color kBone(0xff, 0xff, 0xff, 0.4f);

// ---- Risk tiers ----

TEST_CASE("Tier thresholds are strict", "[risk][tier]") {
    CHECK(riskTier(0.0f) == RiskTier::Safe);
    CHECK(riskTier(33.0f) == RiskTier::Safe);
    CHECK(riskTier(33.01f) == RiskTier::Caution);
    CHECK(riskTier(66.0f) == RiskTier::Caution);
    CHECK(riskTier(66.01f) == RiskTier::HighAlert);
    CHECK(riskTier(100.0f) == RiskTier::HighAlert);
    CHECK(riskTier(std::numeric_limits<float>::quiet_NaN()) == RiskTier::Safe);

    CHECK(std::string(riskTierName(RiskTier::HighAlert)) == "high_alert");
    CHECK(std::string(riskTierName(RiskTier::Caution)) == "caution");
    CHECK(std::string(riskTierName(RiskTier::Safe)) == "safe");
}

TEST_CASE("Every score lands in exactly one tier", "[risk][tier]") {
    Palette palette;
    for (int s = 0; s <= 100; ++s) {
        RiskTier tier = riskTier(static_cast<float>(s));
        const Color &c = palette.tierColor(tier);
        int matches = (c == kRed) + (c == kAmber) + (c == kEmerald);
        CHECK(matches == 1);
    }
}

TEST_CASE("Risk vector sanitizing", "[risk]") {
    RiskVector r;
    r.shoulderOveruse = 140.0f;
    r.poorKineticChain = -5.0f;
    r.kneeStress = std::numeric_limits<float>::infinity();

    RiskVector clean = r.sanitized();
    CHECK(clean.shoulderOveruse == 100.0f);
    CHECK(clean.poorKineticChain == 0.0f);
    CHECK(clean.kneeStress == 0.0f);

    CHECK(clean.score(RiskCategory::Shoulder) == 100.0f);
    CHECK(clean.score(RiskCategory::Neutral) == 0.0f);
}

// ---- Colorizer ----

TEST_CASE("Analysis colours follow the joint category", "[risk][analysis]") {
    RiskVector r;
    r.shoulderOveruse = 80.0f;
    r.poorKineticChain = 10.0f;
    r.kneeStress = 40.0f;

    RiskColorizer colors(r, OperatingMode::Analysis);

    CHECK(colors.jointColor(JointId::LeftShoulder) == kRed);
    CHECK(colors.jointColor(JointId::RightShoulder) == kRed);
    CHECK(colors.jointColor(JointId::ShoulderCenter) == kRed);

    CHECK(colors.jointColor(JointId::SpineMid) == kEmerald);
    CHECK(colors.jointColor(JointId::SpineBase) == kEmerald);
    CHECK(colors.jointColor(JointId::HipCenter) == kEmerald);
    CHECK(colors.jointColor(JointId::LeftHip) == kEmerald);

    CHECK(colors.jointColor(JointId::LeftKnee) == kAmber);
    CHECK(colors.jointColor(JointId::RightKnee) == kAmber);

    CHECK(colors.jointColor(JointId::Head) == kBone);
    CHECK(colors.jointColor(JointId::LeftElbow) == kBone);
    CHECK(colors.jointColor(JointId::RightFoot) == kBone);

    SECTION("glow marks everything but the bone colour") {
        CHECK(colors.isHighlighted(colors.jointColor(JointId::LeftShoulder)));
        CHECK(colors.isHighlighted(colors.jointColor(JointId::SpineMid)));
        CHECK_FALSE(colors.isHighlighted(colors.jointColor(JointId::Head)));
    }
}

TEST_CASE("Zero risk draws risk joints in the safe colour", "[risk][analysis]") {
    RiskColorizer colors(RiskVector(), OperatingMode::Analysis);
    for (const JointInfo &info : skeletonJoints()) {
        INFO(info.name);
        if (info.category == RiskCategory::Neutral)
            CHECK(colors.jointColor(info.id) == kBone);
        else
            CHECK(colors.jointColor(info.id) == kEmerald);
    }
}

TEST_CASE("Demo mode ignores risk", "[risk][demo]") {
    RiskVector r;
    r.shoulderOveruse = 95.0f;
    r.poorKineticChain = 95.0f;
    r.kneeStress = 95.0f;

    RiskColorizer colors(r, OperatingMode::Demo);
    for (const JointInfo &info : skeletonJoints())
        CHECK(colors.jointColor(info.id) == kIdeal);
    for (const Bone &bone : skeletonBones())
        CHECK(colors.boneColor(bone) == kIdeal);

    CHECK(colors.colorForName("tail") == kIdeal);
    CHECK(colors.mode() == OperatingMode::Demo);
}

TEST_CASE("Bones take the start joint colour", "[risk][bone]") {
    RiskVector r;
    r.shoulderOveruse = 90.0f;
    RiskColorizer colors(r, OperatingMode::Analysis);

    // shoulder (red) -> elbow (bone colour)
    Bone upperArm{JointId::LeftShoulder, JointId::LeftElbow};
    CHECK(colors.boneColor(upperArm) == kRed);

    // neck (bone colour) -> spine_mid (emerald)
    Bone upperSpine{JointId::Neck, JointId::SpineMid};
    CHECK(colors.boneColor(upperSpine) == kBone);

    for (const Bone &bone : skeletonBones())
        CHECK(colors.boneColor(bone) == colors.jointColor(bone.start));
}

TEST_CASE("Name lookup", "[risk][name]") {
    RiskVector r;
    r.kneeStress = 70.0f;
    RiskColorizer colors(r, OperatingMode::Analysis);

    CHECK(colors.colorForName("left_knee") == kRed);
    CHECK(colors.colorForName("head") == kBone);
    CHECK(colors.colorForName("tail") == kBone);
    CHECK(colors.colorForName("") == kBone);
}

TEST_CASE("Custom palettes are honoured", "[risk][palette]") {
    Palette palette;
    palette.highAlert = Color(200, 0, 200);
    RiskVector r;
    r.shoulderOveruse = 99.0f;

    RiskColorizer colors(r, OperatingMode::Analysis, palette);
    CHECK(colors.jointColor(JointId::LeftShoulder) == Color(200, 0, 200));
    CHECK(colors.palette().highAlert == Color(200, 0, 200));
}

// ---- Colour text ----

TEST_CASE("CSS colour parsing", "[color]") {
    Color c;

    REQUIRE(parseColor("#ef4444", c));
    CHECK(c == kRed);

    REQUIRE(parseColor("#fff", c));
    CHECK(c == Color(255, 255, 255));

    REQUIRE(parseColor("rgba(255, 255, 255, 0.4)", c));
    CHECK(c.r == 255);
    CHECK(c.a == Approx(0.4f));

    REQUIRE(parseColor("rgb(16,185,129)", c));
    CHECK(c == kEmerald);

    SECTION("malformed input leaves the colour untouched") {
        Color keep(1, 2, 3);
        Color out = keep;
        CHECK_FALSE(parseColor("", out));
        CHECK_FALSE(parseColor("#12345", out));
        CHECK_FALSE(parseColor("#gggggg", out));
        CHECK_FALSE(parseColor("rgb(1, 2)", out));
        CHECK_FALSE(parseColor("rgb(1, 2, 300)", out));
        CHECK_FALSE(parseColor("rgba(1, 2, 3, 1.5)", out));
        CHECK_FALSE(parseColor("red", out));
        CHECK_FALSE(parseColor("rgb(nan, 0, 0)", out));
        CHECK_FALSE(parseColor("rgb(0, inf, 0)", out));
        CHECK_FALSE(parseColor("rgba(255, 255, 255, nan)", out));
        CHECK(out == keep);
    }
}

TEST_CASE("CSS colour output", "[color]") {
    CHECK(kAmber.toHex() == "#f59e0b");
    CHECK(kAmber.toCss() == "#f59e0b");
    CHECK(kBone.toCss() == "rgba(255, 255, 255, 0.4)");
    CHECK(kBone.toHex() == "#ffffff");
}
