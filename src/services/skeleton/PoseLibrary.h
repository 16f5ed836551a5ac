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

// PoseLibrary.h: Base pose and drill keyframe sequences
//
// Architecture (mirrors the clip database / playback split):
//   PoseLibrary: process-wide constant data, built once (this file)
//   PoseInterpolator: samples a sequence at a phase (motion/)
//   AnimationClock: turns frame time into phase + view angle (motion/)
//
// Drill keyframes are authored as partial override lists against the base
// pose. The library expands them into complete poses when it is built and
// validates that every bone endpoint is present in every pose, so the
// per-frame path never has to check.

#pragma once

#include <array>
#include <bitset>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "BioSkelMath.h"
#include "SkeletonTopology.h"

namespace BioSkel {

// ════════════════════════════════════════════════════════════════════
// Pose: joint -> body-local position, with per-joint presence
// ════════════════════════════════════════════════════════════════════
class Pose {
public:
    Pose() = default;

    bool has(JointId joint) const { return mPresent.test(jointIndex(joint)); }

    /// Position of a joint. Only meaningful when has(joint).
    const Vector3 &get(JointId joint) const { return mPositions[jointIndex(joint)]; }

    std::optional<Vector3> find(JointId joint) const {
        if (!has(joint))
            return std::nullopt;
        return get(joint);
    }

    void set(JointId joint, const Vector3 &pos) {
        mPositions[jointIndex(joint)] = pos;
        mPresent.set(jointIndex(joint));
    }

    void erase(JointId joint) {
        mPositions[jointIndex(joint)] = Vector3(0.0f);
        mPresent.reset(jointIndex(joint));
    }

    /// Number of joints present
    size_t size() const { return mPresent.count(); }

    /// True when every joint of the topology is present
    bool isComplete() const { return mPresent.all(); }

    bool operator==(const Pose &rhs) const {
        return mPresent == rhs.mPresent && mPositions == rhs.mPositions;
    }

    bool operator!=(const Pose &rhs) const { return !(*this == rhs); }

private:
    std::array<Vector3, kJointCount> mPositions{};
    std::bitset<kJointCount> mPresent;
};

using PoseSequence = std::vector<Pose>;

// ── Keyframe authoring ──
struct JointOverride {
    JointId joint;
    Vector3 position;
};

using KeyframeOverrides = std::vector<JointOverride>;

/// Base pose with the given joints replaced. Joints not listed keep their
/// base position.
Pose applyOverrides(const Pose &base, const KeyframeOverrides &overrides);

// ── Drill selector ──
enum class Drill : uint8_t {
    HipDrive,
    LowContact,
    ArmExtension,
    AthleticStance,
    Count
};

inline constexpr size_t kDrillCount = static_cast<size_t>(Drill::Count);
inline constexpr Drill kDefaultDrill = Drill::AthleticStance;

/// "hip_drive", "low_contact", "arm_extension", "athletic_stance"
const char *drillName(Drill drill);

/// Exact-match lookup; nullopt for unknown names.
std::optional<Drill> parseDrill(const std::string &name);

/// Lenient lookup used by hosts: unknown names fall back to kDefaultDrill.
Drill drillFromName(const std::string &name);

/// Drill demonstrating the correction for a detected issue
/// (poor_kinetic_chain, shoulder_overuse, elbow_strain; anything else ->
/// athletic_stance).
Drill drillForIssue(const std::string &issue);

// ════════════════════════════════════════════════════════════════════
// PoseLibrary: immutable after construction
// ════════════════════════════════════════════════════════════════════
class PoseLibrary {
public:
    /// Process-wide library, built on first use.
    static const PoseLibrary &instance();

    /// Relaxed ready stance, complete.
    const Pose &basePose() const { return mBasePose; }

    /// Effective (default-filled) keyframes of a drill. Out-of-range values
    /// resolve to the default drill.
    const PoseSequence &sequence(Drill drill) const;

    /// Throws BasicException when the sequence is shorter than 2 or any pose
    /// lacks a bone endpoint. A seam mismatch (first != last) is only logged.
    static void validateSequence(const PoseSequence &seq, const std::string &name);

    /// Throws BasicException when a bone endpoint is missing from the pose.
    static void validatePose(const Pose &pose, const std::string &what);

private:
    PoseLibrary();

    Pose mBasePose;
    std::array<PoseSequence, kDrillCount> mSequences;
};

} // namespace BioSkel
