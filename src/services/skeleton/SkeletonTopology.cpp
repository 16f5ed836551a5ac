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

#include "SkeletonTopology.h"

namespace BioSkel {

namespace {

// Category column reproduces the dashboard's name rule: "shoulder" ->
// shoulder, "spine"/"hip" -> kinetic chain, "knee" -> knee, rest neutral.
constexpr std::array<JointInfo, kJointCount> kJoints = {{
    {JointId::Head,           "head",            RiskCategory::Neutral},
    {JointId::Neck,           "neck",            RiskCategory::Neutral},
    {JointId::ShoulderCenter, "shoulder_center", RiskCategory::Shoulder},
    {JointId::LeftShoulder,   "left_shoulder",   RiskCategory::Shoulder},
    {JointId::RightShoulder,  "right_shoulder",  RiskCategory::Shoulder},
    {JointId::LeftElbow,      "left_elbow",      RiskCategory::Neutral},
    {JointId::RightElbow,     "right_elbow",     RiskCategory::Neutral},
    {JointId::LeftHand,       "left_hand",       RiskCategory::Neutral},
    {JointId::RightHand,      "right_hand",      RiskCategory::Neutral},
    {JointId::SpineMid,       "spine_mid",       RiskCategory::KineticChain},
    {JointId::SpineBase,      "spine_base",      RiskCategory::KineticChain},
    {JointId::HipCenter,      "hip_center",      RiskCategory::KineticChain},
    {JointId::LeftHip,        "left_hip",        RiskCategory::KineticChain},
    {JointId::RightHip,       "right_hip",       RiskCategory::KineticChain},
    {JointId::LeftKnee,       "left_knee",       RiskCategory::Knee},
    {JointId::RightKnee,      "right_knee",      RiskCategory::Knee},
    {JointId::LeftFoot,       "left_foot",       RiskCategory::Neutral},
    {JointId::RightFoot,      "right_foot",      RiskCategory::Neutral},
}};

constexpr std::array<Bone, kBoneCount> kBones = {{
    // spine column
    {JointId::Head,           JointId::Neck},
    {JointId::Neck,           JointId::SpineMid},
    {JointId::SpineMid,       JointId::SpineBase},
    // shoulder girdle
    {JointId::ShoulderCenter, JointId::LeftShoulder},
    {JointId::ShoulderCenter, JointId::RightShoulder},
    // arms
    {JointId::LeftShoulder,   JointId::LeftElbow},
    {JointId::LeftElbow,      JointId::LeftHand},
    {JointId::RightShoulder,  JointId::RightElbow},
    {JointId::RightElbow,     JointId::RightHand},
    // hip girdle
    {JointId::HipCenter,      JointId::LeftHip},
    {JointId::HipCenter,      JointId::RightHip},
    // legs
    {JointId::LeftHip,        JointId::LeftKnee},
    {JointId::LeftKnee,       JointId::LeftFoot},
    {JointId::RightHip,       JointId::RightKnee},
    {JointId::RightKnee,      JointId::RightFoot},
}};

// Table rows must line up with the enum so jointIndex() can index them.
constexpr bool jointTableOrdered() {
    for (size_t i = 0; i < kJointCount; ++i) {
        if (jointIndex(kJoints[i].id) != i)
            return false;
    }
    return true;
}

static_assert(jointTableOrdered(), "kJoints must follow JointId order");

} // namespace

//------------------------------------------------------
const std::array<JointInfo, kJointCount> &skeletonJoints() { return kJoints; }

//------------------------------------------------------
const std::array<Bone, kBoneCount> &skeletonBones() { return kBones; }

//------------------------------------------------------
const char *jointName(JointId joint) {
    size_t idx = jointIndex(joint);
    if (idx >= kJointCount)
        return "unknown";
    return kJoints[idx].name;
}

//------------------------------------------------------
std::optional<JointId> jointFromName(const std::string &name) {
    for (const JointInfo &info : kJoints) {
        if (name == info.name)
            return info.id;
    }
    return std::nullopt;
}

//------------------------------------------------------
RiskCategory jointRiskCategory(JointId joint) {
    size_t idx = jointIndex(joint);
    if (idx >= kJointCount)
        return RiskCategory::Neutral;
    return kJoints[idx].category;
}

//------------------------------------------------------
const char *riskCategoryName(RiskCategory category) {
    switch (category) {
    case RiskCategory::Shoulder:     return "shoulder";
    case RiskCategory::KineticChain: return "kinetic_chain";
    case RiskCategory::Knee:         return "knee";
    case RiskCategory::Neutral:      break;
    }
    return "neutral";
}

} // namespace BioSkel
