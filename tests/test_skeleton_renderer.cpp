// Unit tests for draw list assembly (ordering, sizing, glow, missing
// joints) and for whole frames through SkeletonEngine
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "PoseLibrary.h"
#include "SkeletonEngine.h"
#include "logger.h"
#include "render/SkeletonRenderer.h"

using namespace BioSkel;
using Catch::Approx;

// Collects every dispatched log line with its level.
struct CaptureLog : public LogListener {
    std::vector<std::pair<int, std::string>> lines;

    void logMessage(int level, const std::string &msg) override {
        lines.emplace_back(level, msg);
    }
};

static RiskVector makeRisk(float shoulder, float kinetic, float knee) {
    RiskVector r;
    r.shoulderOveruse = shoulder;
    r.poorKineticChain = kinetic;
    r.kneeStress = knee;
    return r;
}

static size_t countKind(const DrawList &draws, DrawCommand::Kind kind) {
    return static_cast<size_t>(std::count_if(
        draws.begin(), draws.end(),
        [kind](const DrawCommand &c) { return c.kind == kind; }));
}

static const DrawCommand *findCircle(const DrawList &draws, JointId joint) {
    for (const DrawCommand &c : draws) {
        if (c.kind == DrawCommand::CIRCLE && c.joint == joint)
            return &c;
    }
    return nullptr;
}

// ---- SkeletonRenderer ----

TEST_CASE("Full pose renders every bone then every joint", "[renderer]") {
    const Pose &base = PoseLibrary::instance().basePose();
    ProjectedPose projected = projectPose(base, 0.4);
    RiskColorizer colors(RiskVector(), OperatingMode::Analysis);

    DrawList draws = SkeletonRenderer().render(projected, colors);

    REQUIRE(draws.size() == kBoneCount + kJointCount);
    for (size_t i = 0; i < draws.size(); ++i) {
        if (i < kBoneCount)
            CHECK(draws[i].kind == DrawCommand::LINE);
        else
            CHECK(draws[i].kind == DrawCommand::CIRCLE);
    }

    std::set<JointId> seen;
    for (size_t i = kBoneCount; i < draws.size(); ++i)
        seen.insert(draws[i].joint);
    CHECK(seen.size() == kJointCount);
}

TEST_CASE("Line and circle sizing", "[renderer][style]") {
    Pose pose;
    pose.set(JointId::Head, Vector3(0.0f, -40.0f, -100.0f));    // scale 1.5
    pose.set(JointId::Neck, Vector3(0.0f, -30.0f, 0.0f));       // scale 1
    pose.set(JointId::SpineMid, Vector3(0.0f, -10.0f, 100.0f)); // scale 0.75

    ProjectedPose projected = projectPose(pose, 0.0);
    RiskColorizer colors(RiskVector(), OperatingMode::Analysis);
    DrawList draws = SkeletonRenderer().render(projected, colors);

    REQUIRE(countKind(draws, DrawCommand::LINE) == 2);
    REQUIRE(countKind(draws, DrawCommand::CIRCLE) == 3);

    for (const DrawCommand &c : draws) {
        if (c.kind != DrawCommand::LINE)
            continue;
        if (c.joint == JointId::Head) {
            CHECK(c.jointEnd == JointId::Neck);
            CHECK(c.width == Approx(3.0f * 1.25f));
            CHECK(c.opacity == Approx(0.3f));  // min of 0.3 and 0.5
        }
    }

    const DrawCommand *head = findCircle(draws, JointId::Head);
    const DrawCommand *neck = findCircle(draws, JointId::Neck);
    REQUIRE(head);
    REQUIRE(neck);
    CHECK(head->radius == Approx(6.0f * 1.5f));
    CHECK(neck->radius == Approx(2.5f));
}

TEST_CASE("Bones with a missing endpoint are skipped", "[renderer][partial]") {
    Pose pose = PoseLibrary::instance().basePose();
    pose.erase(JointId::LeftElbow);

    ProjectedPose projected = projectPose(pose, 0.0);
    RiskColorizer colors(RiskVector(), OperatingMode::Analysis);
    DrawList draws = SkeletonRenderer().render(projected, colors);

    CHECK(countKind(draws, DrawCommand::LINE) == kBoneCount - 2);
    CHECK(countKind(draws, DrawCommand::CIRCLE) == kJointCount - 1);
    CHECK(findCircle(draws, JointId::LeftElbow) == nullptr);

    SECTION("empty pose draws nothing") {
        DrawList none = SkeletonRenderer().render(projectPose(Pose(), 0.0), colors);
        CHECK(none.empty());
    }
}

TEST_CASE("Each group is painted back to front", "[renderer][order]") {
    const Pose &base = PoseLibrary::instance().basePose();
    RiskColorizer colors(RiskVector(), OperatingMode::Analysis);

    for (double angle : {0.0, 1.2, 2.6, 4.0, 5.5}) {
        ProjectedPose projected = projectPose(base, angle);
        DrawList draws = SkeletonRenderer().render(projected, colors);
        REQUIRE(draws.size() == kBoneCount + kJointCount);

        float prev = 1.0e9f;
        for (size_t i = kBoneCount; i < draws.size(); ++i) {
            float depth = projected[jointIndex(draws[i].joint)]->depth;
            CHECK(depth <= prev);
            prev = depth;
        }
    }
}

TEST_CASE("Glow flags follow highlighted colours", "[renderer][glow]") {
    const Pose &base = PoseLibrary::instance().basePose();
    RiskColorizer colors(makeRisk(80.0f, 10.0f, 40.0f), OperatingMode::Analysis);
    DrawList draws = SkeletonRenderer().render(projectPose(base, 0.0), colors);

    for (const DrawCommand &c : draws)
        CHECK(c.glow == (c.color != colors.palette().neutral));

    CHECK(findCircle(draws, JointId::LeftShoulder)->glow);
    CHECK(findCircle(draws, JointId::LeftKnee)->glow);
    CHECK_FALSE(findCircle(draws, JointId::Head)->glow);
}

// ---- SkeletonEngine ----

TEST_CASE("Analysis frames show the rotating base pose", "[engine][analysis]") {
    SkeletonEngine engine;
    RiskVector risk = makeRisk(80.0f, 10.0f, 40.0f);

    FrameContext ctx = engine.renderFrame(1500.0, risk, OperatingMode::Analysis);
    CHECK(ctx.pose == PoseLibrary::instance().basePose());
    CHECK(ctx.clock.viewAngle == Approx(kPi / 2.0));
    CHECK(ctx.draws.size() == kBoneCount + kJointCount);

    const DrawCommand *shoulder = findCircle(ctx.draws, JointId::RightShoulder);
    REQUIRE(shoulder);
    CHECK(shoulder->color == Palette().highAlert);
    CHECK(findCircle(ctx.draws, JointId::RightKnee)->color == Palette().caution);
    CHECK(findCircle(ctx.draws, JointId::HipCenter)->color == Palette().safe);

    // drill is ignored in analysis
    FrameContext other = engine.renderFrame(1500.0, risk, OperatingMode::Analysis,
                                            Drill::HipDrive);
    CHECK(other.pose == ctx.pose);
}

TEST_CASE("Demo frames walk the hip drive sequence", "[engine][demo]") {
    SkeletonEngine engine;
    const PoseSequence &seq = PoseLibrary::instance().sequence(Drill::HipDrive);
    REQUIRE(seq.size() == 4);

    CHECK(engine.renderFrame(0.0, RiskVector(), OperatingMode::Demo, Drill::HipDrive).pose == seq[0]);
    CHECK(engine.renderFrame(2000.0, RiskVector(), OperatingMode::Demo, Drill::HipDrive).pose == seq[1]);
    CHECK(engine.renderFrame(4000.0, RiskVector(), OperatingMode::Demo, Drill::HipDrive).pose == seq[2]);
    CHECK(engine.renderFrame(6000.0, RiskVector(), OperatingMode::Demo, Drill::HipDrive).pose == seq[0]);

    FrameContext ctx = engine.renderFrame(3000.0, makeRisk(99.0f, 99.0f, 99.0f),
                                          OperatingMode::Demo, Drill::HipDrive);
    for (const DrawCommand &c : ctx.draws) {
        CHECK(c.color == Palette().ideal);
        CHECK(c.glow);
    }
    CHECK(ctx.clock.viewAngle == 0.0);
}

TEST_CASE("Name-based render falls back on unknown names", "[engine][names]") {
    SkeletonEngine engine;
    RiskVector risk = makeRisk(50.0f, 50.0f, 50.0f);

    DrawList unknownDrill = engine.render(2500.0, risk, "demo", "cartwheel");
    DrawList athletic = engine.render(2500.0, risk, "demo", "athletic_stance");
    REQUIRE(unknownDrill.size() == athletic.size());
    for (size_t i = 0; i < athletic.size(); ++i) {
        CHECK(unknownDrill[i].from == athletic[i].from);
        CHECK(unknownDrill[i].joint == athletic[i].joint);
    }

    DrawList unknownMode = engine.render(2500.0, risk, "sideways", "hip_drive");
    DrawList analysis = engine.render(2500.0, risk, "analysis", "hip_drive");
    REQUIRE(unknownMode.size() == analysis.size());
    for (size_t i = 0; i < analysis.size(); ++i) {
        CHECK(unknownMode[i].from == analysis[i].from);
        CHECK(unknownMode[i].color == analysis[i].color);
    }
}

TEST_CASE("Unknown names only log at verbose level", "[engine][names][log]") {
    // build the library before logging starts
    PoseLibrary::instance();
    SkeletonEngine engine;

    Logger logger;
    CaptureLog capture;
    logger.registerLogListener(&capture);

    logger.setLogLevel(Logger::LOG_LEVEL_DEBUG);
    for (int tick = 0; tick < 5; ++tick)
        engine.render(tick * 16.0, RiskVector(), "sideways", "cartwheel");
    CHECK(capture.lines.empty());

    logger.setLogLevel(Logger::LOG_LEVEL_VERBOSE);
    engine.render(100.0, RiskVector(), "sideways", "cartwheel");
    bool sawMode = false;
    bool sawDrill = false;
    for (const auto &line : capture.lines) {
        CHECK(line.first == Logger::LOG_LEVEL_VERBOSE);
        sawMode = sawMode || line.second.find("sideways") != std::string::npos;
        sawDrill = sawDrill || line.second.find("cartwheel") != std::string::npos;
    }
    CHECK(sawMode);
    CHECK(sawDrill);

    logger.unregisterLogListener(&capture);
}
