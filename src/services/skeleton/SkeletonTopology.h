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

// SkeletonTopology.h: Fixed joint set and bone list of the abstract figure
//
// The figure is a compact 18-joint humanoid: a head/neck/spine column, a
// shoulder girdle and a hip girdle, each anchored on a virtual centre joint
// (shoulder_center, hip_center) with symmetric left/right limb chains.
//
// Everything here is a compile-time constant. Joint identity is the JointId
// enumerator; the snake_case name is only used at the edges (config files,
// SVG ids, diagnostics).

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace BioSkel {

enum class JointId : uint8_t {
    Head,
    Neck,
    ShoulderCenter,
    LeftShoulder,
    RightShoulder,
    LeftElbow,
    RightElbow,
    LeftHand,
    RightHand,
    SpineMid,
    SpineBase,
    HipCenter,
    LeftHip,
    RightHip,
    LeftKnee,
    RightKnee,
    LeftFoot,
    RightFoot,
    Count
};

inline constexpr size_t kJointCount = static_cast<size_t>(JointId::Count);

inline constexpr size_t jointIndex(JointId joint) {
    return static_cast<size_t>(joint);
}

// ── Risk category ──
// Which component of the risk vector drives a joint's colour.
// Neutral joints always draw in the bone colour.
enum class RiskCategory : uint8_t {
    Neutral,
    Shoulder,      // shoulder_overuse
    KineticChain,  // poor_kinetic_chain (spine + hips)
    Knee           // knee_stress
};

// ── Joint table entry ──
struct JointInfo {
    JointId      id;
    const char  *name;
    RiskCategory category;
};

// ── Bone ──
// Ordered pair of joints. The order matters: a bone takes its start joint's colour.
struct Bone {
    JointId start;
    JointId end;
};

inline constexpr size_t kBoneCount = 15;

/// All joints in JointId order.
const std::array<JointInfo, kJointCount> &skeletonJoints();

/// The fixed bone list, in draw-list order.
const std::array<Bone, kBoneCount> &skeletonBones();

/// Canonical snake_case name ("left_shoulder"); "unknown" for out-of-range ids.
const char *jointName(JointId joint);

/// Reverse lookup of jointName(). Exact match only.
std::optional<JointId> jointFromName(const std::string &name);

/// Explicit joint -> risk category table lookup.
RiskCategory jointRiskCategory(JointId joint);

/// "shoulder", "kinetic_chain", "knee" or "neutral"
const char *riskCategoryName(RiskCategory category);

} // namespace BioSkel
