/******************************************************************************
 *
 *    This file is part of the bioskel project
 *    Copyright (C) 2026 bioskel contributors
 *
 *    This program is free software; you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation; either version 2 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program; if not, write to the Free Software
 *    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 *****************************************************************************/

#include "PoseLibrary.h"

#include "BioSkelException.h"
#include "logger.h"

namespace BioSkel {

namespace {

// Body-local space: +y runs down the figure, -x is the figure's left,
// negative z is towards the viewer. Units fit a 100x120 viewport at scale 1.

// Relaxed ready stance. Elbows and knees sit slightly forward.
const KeyframeOverrides kBaseStance = {
    {JointId::Head,           Vector3(  0.0f, -45.0f,   0.0f)},
    {JointId::Neck,           Vector3(  0.0f, -35.0f,   0.0f)},
    {JointId::ShoulderCenter, Vector3(  0.0f, -33.0f,   0.0f)},
    {JointId::LeftShoulder,   Vector3(-12.0f, -33.0f,   0.0f)},
    {JointId::RightShoulder,  Vector3( 12.0f, -33.0f,   0.0f)},
    {JointId::LeftElbow,      Vector3(-15.0f, -18.0f,  -6.0f)},
    {JointId::RightElbow,     Vector3( 15.0f, -18.0f,  -6.0f)},
    {JointId::LeftHand,       Vector3(-14.0f,  -5.0f, -10.0f)},
    {JointId::RightHand,      Vector3( 14.0f,  -5.0f, -10.0f)},
    {JointId::SpineMid,       Vector3(  0.0f, -18.0f,   0.0f)},
    {JointId::SpineBase,      Vector3(  0.0f,  -3.0f,   0.0f)},
    {JointId::HipCenter,      Vector3(  0.0f,   0.0f,   0.0f)},
    {JointId::LeftHip,        Vector3( -7.0f,   0.0f,   0.0f)},
    {JointId::RightHip,       Vector3(  7.0f,   0.0f,   0.0f)},
    {JointId::LeftKnee,       Vector3( -8.0f,  22.0f,  -5.0f)},
    {JointId::RightKnee,      Vector3(  8.0f,  22.0f,  -5.0f)},
    {JointId::LeftFoot,       Vector3( -9.0f,  45.0f,   0.0f)},
    {JointId::RightFoot,      Vector3(  9.0f,  45.0f,   0.0f)},
};

// ── hip_drive ──
// Load: hips and shoulders coil away from the target, right side back.
const KeyframeOverrides kHipDriveLoad = {
    {JointId::LeftShoulder,   Vector3(-11.0f, -33.0f,  -5.0f)},
    {JointId::RightShoulder,  Vector3( 11.0f, -33.0f,   5.0f)},
    {JointId::LeftElbow,      Vector3(-13.0f, -19.0f, -10.0f)},
    {JointId::RightElbow,     Vector3( 16.0f, -20.0f,   8.0f)},
    {JointId::LeftHand,       Vector3( -8.0f,  -8.0f, -14.0f)},
    {JointId::RightHand,      Vector3( 18.0f,  -8.0f,  12.0f)},
    {JointId::SpineMid,       Vector3(  0.0f, -18.0f,   1.0f)},
    {JointId::LeftHip,        Vector3( -6.5f,   0.0f,  -3.0f)},
    {JointId::RightHip,       Vector3(  6.5f,   0.0f,   3.0f)},
    {JointId::LeftKnee,       Vector3( -8.0f,  22.0f,  -6.0f)},
    {JointId::RightKnee,      Vector3(  9.0f,  23.0f,  -1.0f)},
};

// Drive: hips lead the uncoil, weight moves onto the front leg.
const KeyframeOverrides kHipDriveDrive = {
    {JointId::Head,           Vector3(  0.0f, -45.0f,  -2.0f)},
    {JointId::LeftShoulder,   Vector3(-11.0f, -33.0f,   5.0f)},
    {JointId::RightShoulder,  Vector3( 11.0f, -33.0f,  -5.0f)},
    {JointId::LeftElbow,      Vector3(-16.0f, -20.0f,   4.0f)},
    {JointId::RightElbow,     Vector3( 10.0f, -22.0f, -14.0f)},
    {JointId::LeftHand,       Vector3(-18.0f, -10.0f,   6.0f)},
    {JointId::RightHand,      Vector3(  4.0f, -14.0f, -20.0f)},
    {JointId::SpineMid,       Vector3(  0.0f, -18.0f,  -2.0f)},
    {JointId::LeftHip,        Vector3( -6.5f,   0.0f,   3.0f)},
    {JointId::RightHip,       Vector3(  6.5f,   0.0f,  -3.0f)},
    {JointId::LeftKnee,       Vector3( -8.0f,  22.0f,  -3.0f)},
    {JointId::RightKnee,      Vector3(  6.0f,  23.0f,  -9.0f)},
};

// ── low_contact ──
// Torso lowering shared by both interior keyframes. Overrides are always
// relative to the base pose, so the second keyframe repeats it.
const KeyframeOverrides kLowContactBend = {
    {JointId::Head,           Vector3(  0.0f, -41.0f,  -4.0f)},
    {JointId::Neck,           Vector3(  0.0f, -31.0f,  -3.0f)},
    {JointId::ShoulderCenter, Vector3(  0.0f, -29.0f,  -3.0f)},
    {JointId::LeftShoulder,   Vector3(-12.0f, -29.0f,  -3.0f)},
    {JointId::RightShoulder,  Vector3( 12.0f, -29.0f,  -3.0f)},
    {JointId::LeftElbow,      Vector3(-15.0f, -14.0f,  -8.0f)},
    {JointId::RightElbow,     Vector3( 16.0f, -12.0f,  -4.0f)},
    {JointId::LeftHand,       Vector3(-12.0f,  -2.0f, -12.0f)},
    {JointId::RightHand,      Vector3( 18.0f,   2.0f,  -8.0f)},
    {JointId::SpineMid,       Vector3(  0.0f, -14.0f,  -2.0f)},
    {JointId::SpineBase,      Vector3(  0.0f,   1.0f,   0.0f)},
    {JointId::HipCenter,      Vector3(  0.0f,   4.0f,   0.0f)},
    {JointId::LeftHip,        Vector3( -7.0f,   4.0f,   0.0f)},
    {JointId::RightHip,       Vector3(  7.0f,   4.0f,   0.0f)},
    {JointId::LeftKnee,       Vector3( -9.0f,  24.0f,  -9.0f)},
    {JointId::RightKnee,      Vector3(  9.0f,  24.0f,  -9.0f)},
};

const KeyframeOverrides kLowContactReach = {
    {JointId::Head,           Vector3(  0.0f, -41.0f,  -4.0f)},
    {JointId::Neck,           Vector3(  0.0f, -31.0f,  -3.0f)},
    {JointId::ShoulderCenter, Vector3(  0.0f, -29.0f,  -3.0f)},
    {JointId::LeftShoulder,   Vector3(-12.0f, -29.0f,  -3.0f)},
    {JointId::RightShoulder,  Vector3( 12.0f, -29.0f,  -3.0f)},
    {JointId::LeftElbow,      Vector3(-15.0f, -14.0f,  -6.0f)},
    {JointId::RightElbow,     Vector3( 10.0f, -10.0f, -14.0f)},
    {JointId::LeftHand,       Vector3(-14.0f,  -4.0f,  -6.0f)},
    {JointId::RightHand,      Vector3(  2.0f,   0.0f, -24.0f)},
    {JointId::SpineMid,       Vector3(  0.0f, -14.0f,  -2.0f)},
    {JointId::SpineBase,      Vector3(  0.0f,   1.0f,   0.0f)},
    {JointId::HipCenter,      Vector3(  0.0f,   4.0f,   0.0f)},
    {JointId::LeftHip,        Vector3( -7.0f,   4.0f,   0.0f)},
    {JointId::RightHip,       Vector3(  7.0f,   4.0f,   0.0f)},
    {JointId::LeftKnee,       Vector3( -9.0f,  24.0f,  -9.0f)},
    {JointId::RightKnee,      Vector3(  9.0f,  24.0f,  -9.0f)},
};

// ── arm_extension ──
const KeyframeOverrides kArmExtensionLoad = {
    {JointId::RightShoulder,  Vector3( 12.0f, -33.0f,   2.0f)},
    {JointId::RightElbow,     Vector3( 18.0f, -24.0f,   8.0f)},
    {JointId::RightHand,      Vector3( 16.0f, -30.0f,   2.0f)},
};

const KeyframeOverrides kArmExtensionReach = {
    {JointId::RightShoulder,  Vector3( 12.0f, -34.0f,  -3.0f)},
    {JointId::RightElbow,     Vector3( 14.0f, -28.0f, -12.0f)},
    {JointId::RightHand,      Vector3( 12.0f, -38.0f, -24.0f)},
    {JointId::LeftHand,       Vector3(-16.0f,  -8.0f,  -4.0f)},
};

// ── athletic_stance ──
// Deep ready position: knees flexed and wide, hands out in front.
const KeyframeOverrides kAthleticReady = {
    {JointId::Head,           Vector3(  0.0f, -38.0f,  -6.0f)},
    {JointId::Neck,           Vector3(  0.0f, -28.0f,  -5.0f)},
    {JointId::ShoulderCenter, Vector3(  0.0f, -26.0f,  -5.0f)},
    {JointId::LeftShoulder,   Vector3(-12.0f, -26.0f,  -5.0f)},
    {JointId::RightShoulder,  Vector3( 12.0f, -26.0f,  -5.0f)},
    {JointId::LeftElbow,      Vector3(-14.0f, -12.0f, -12.0f)},
    {JointId::RightElbow,     Vector3( 14.0f, -12.0f, -12.0f)},
    {JointId::LeftHand,       Vector3(-10.0f,  -2.0f, -18.0f)},
    {JointId::RightHand,      Vector3( 10.0f,  -2.0f, -18.0f)},
    {JointId::SpineMid,       Vector3(  0.0f, -12.0f,  -3.0f)},
    {JointId::SpineBase,      Vector3(  0.0f,   3.0f,   0.0f)},
    {JointId::HipCenter,      Vector3(  0.0f,   6.0f,   0.0f)},
    {JointId::LeftHip,        Vector3( -7.0f,   6.0f,   0.0f)},
    {JointId::RightHip,       Vector3(  7.0f,   6.0f,   0.0f)},
    {JointId::LeftKnee,       Vector3(-11.0f,  25.0f, -12.0f)},
    {JointId::RightKnee,      Vector3( 11.0f,  25.0f, -12.0f)},
    {JointId::LeftFoot,       Vector3(-12.0f,  45.0f,   0.0f)},
    {JointId::RightFoot,      Vector3( 12.0f,  45.0f,   0.0f)},
};

struct DrillInfo {
    Drill       drill;
    const char *name;
};

constexpr std::array<DrillInfo, kDrillCount> kDrills = {{
    {Drill::HipDrive,       "hip_drive"},
    {Drill::LowContact,     "low_contact"},
    {Drill::ArmExtension,   "arm_extension"},
    {Drill::AthleticStance, "athletic_stance"},
}};

/// Base pose at both ends, expanded interior keyframes in between.
PoseSequence buildLoop(const Pose &base,
                       std::initializer_list<const KeyframeOverrides *> interior) {
    PoseSequence seq;
    seq.reserve(interior.size() + 2);
    seq.push_back(base);
    for (const KeyframeOverrides *kf : interior)
        seq.push_back(applyOverrides(base, *kf));
    seq.push_back(base);
    return seq;
}

} // namespace

//------------------------------------------------------
Pose applyOverrides(const Pose &base, const KeyframeOverrides &overrides) {
    Pose pose = base;
    for (const JointOverride &ov : overrides)
        pose.set(ov.joint, ov.position);
    return pose;
}

//------------------------------------------------------
const char *drillName(Drill drill) {
    size_t idx = static_cast<size_t>(drill);
    if (idx >= kDrillCount)
        return kDrills[static_cast<size_t>(kDefaultDrill)].name;
    return kDrills[idx].name;
}

//------------------------------------------------------
std::optional<Drill> parseDrill(const std::string &name) {
    for (const DrillInfo &info : kDrills) {
        if (name == info.name)
            return info.drill;
    }
    return std::nullopt;
}

//------------------------------------------------------
Drill drillFromName(const std::string &name) {
    if (std::optional<Drill> drill = parseDrill(name))
        return *drill;

    LOG_VERBOSE("PoseLibrary: Unknown drill '%s', using '%s'", name.c_str(),
                drillName(kDefaultDrill));
    return kDefaultDrill;
}

//------------------------------------------------------
Drill drillForIssue(const std::string &issue) {
    if (issue == "poor_kinetic_chain")
        return Drill::HipDrive;
    if (issue == "shoulder_overuse")
        return Drill::LowContact;
    if (issue == "elbow_strain")
        return Drill::ArmExtension;
    return kDefaultDrill;  // knee_stress and everything else
}

/*----------------------------------------------------*/
/*-------------------- PoseLibrary -------------------*/
/*----------------------------------------------------*/
const PoseLibrary &PoseLibrary::instance() {
    static const PoseLibrary library;
    return library;
}

//------------------------------------------------------
PoseLibrary::PoseLibrary() {
    mBasePose = applyOverrides(Pose(), kBaseStance);
    validatePose(mBasePose, "base pose");

    mSequences[static_cast<size_t>(Drill::HipDrive)] =
        buildLoop(mBasePose, {&kHipDriveLoad, &kHipDriveDrive});
    mSequences[static_cast<size_t>(Drill::LowContact)] =
        buildLoop(mBasePose, {&kLowContactBend, &kLowContactReach});
    mSequences[static_cast<size_t>(Drill::ArmExtension)] =
        buildLoop(mBasePose, {&kArmExtensionLoad, &kArmExtensionReach});
    mSequences[static_cast<size_t>(Drill::AthleticStance)] =
        buildLoop(mBasePose, {&kAthleticReady});

    for (const DrillInfo &info : kDrills)
        validateSequence(mSequences[static_cast<size_t>(info.drill)], info.name);

    LOG_DEBUG("PoseLibrary: Built %u drills over %u joints / %u bones",
              static_cast<unsigned>(kDrillCount),
              static_cast<unsigned>(kJointCount),
              static_cast<unsigned>(kBoneCount));
}

//------------------------------------------------------
const PoseSequence &PoseLibrary::sequence(Drill drill) const {
    size_t idx = static_cast<size_t>(drill);
    if (idx >= kDrillCount)
        idx = static_cast<size_t>(kDefaultDrill);
    return mSequences[idx];
}

//------------------------------------------------------
void PoseLibrary::validatePose(const Pose &pose, const std::string &what) {
    for (const Bone &bone : skeletonBones()) {
        if (!pose.has(bone.start) || !pose.has(bone.end)) {
            BIOSKEL_EXCEPT(what + ": bone " + jointName(bone.start) + "->" +
                               jointName(bone.end) + " has a missing endpoint",
                           "PoseLibrary::validatePose");
        }
    }
}

//------------------------------------------------------
void PoseLibrary::validateSequence(const PoseSequence &seq,
                                   const std::string &name) {
    if (seq.size() < 2) {
        BIOSKEL_EXCEPT("Drill '" + name + "' needs at least 2 keyframes",
                       "PoseLibrary::validateSequence");
    }

    for (size_t i = 0; i < seq.size(); ++i)
        validatePose(seq[i], name + " keyframe " + std::to_string(i));

    if (seq.front() != seq.back()) {
        LOG_ERROR("PoseLibrary: Warning: Drill '%s' does not end on its first "
                  "pose, the loop will jump",
                  name.c_str());
    }
}

} // namespace BioSkel
