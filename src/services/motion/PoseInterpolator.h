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

// PoseInterpolator.h: Keyframe sampling of a looping drill sequence
//
// A sequence of N keyframes loops with period N-1 phase units; keyframe
// N-1 is expected to equal keyframe 0 so the wrap has no seam.
//
//   cyclePhase = phase mod (N-1)
//   i          = floor(cyclePhase),  frameT = cyclePhase - i
//   result[j]  = mix(seq[i][j], seq[i+1][j], frameT)
//
// Joints missing from one side hold the other side's value; joints missing
// from both stay missing and are skipped by the renderer.

#pragma once

#include <cmath>
#include <cstddef>

#include "PoseLibrary.h"

namespace BioSkel {

struct KeyframeCursor {
    size_t from   = 0;
    size_t to     = 0;
    double frameT = 0.0;  // [0, 1)
};

/// Locate the keyframe pair for a phase in a sequence of n keyframes.
/// n < 2 yields {0, 0, 0}.
inline KeyframeCursor locateKeyframes(size_t n, double posePhase) {
    KeyframeCursor cur;
    if (n < 2)
        return cur;

    if (!std::isfinite(posePhase) || posePhase < 0.0)
        posePhase = 0.0;

    const double period = static_cast<double>(n - 1);
    double cyclePhase = std::fmod(posePhase, period);
    double whole = std::floor(cyclePhase);

    cur.from = static_cast<size_t>(whole);
    if (cur.from > n - 2)
        cur.from = n - 2;
    cur.frameT = cyclePhase - static_cast<double>(cur.from);
    cur.to = (cur.from + 1) % n;
    return cur;
}

/// Per-joint linear blend. t = 0 returns a's positions exactly.
inline Pose lerpPose(const Pose &a, const Pose &b, float t) {
    Pose out;
    for (size_t j = 0; j < kJointCount; ++j) {
        JointId joint = static_cast<JointId>(j);
        bool inA = a.has(joint);
        bool inB = b.has(joint);

        if (inA && inB)
            out.set(joint, glm::mix(a.get(joint), b.get(joint), t));
        else if (inA)
            out.set(joint, a.get(joint));
        else if (inB)
            out.set(joint, b.get(joint));
    }
    return out;
}

/// Pose of a looping sequence at the given phase. An empty sequence yields
/// an empty pose; a single keyframe is returned as-is.
inline Pose interpolatePose(const PoseSequence &seq, double posePhase) {
    if (seq.empty())
        return Pose();
    if (seq.size() == 1)
        return seq.front();

    KeyframeCursor cur = locateKeyframes(seq.size(), posePhase);
    if (cur.frameT == 0.0)
        return seq[cur.from];
    return lerpPose(seq[cur.from], seq[cur.to], static_cast<float>(cur.frameT));
}

} // namespace BioSkel
