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

// AnimationClock.h: Frame time -> view angle + pose phase
//
// Two clocks share one time source and are evaluated as pure functions of
// the elapsed time t (milliseconds):
//   viewAngle: rotation of the figure about its vertical axis
//   posePhase: keyframe position within a drill (1.0 per keyframe)
//
// analysis: one full revolution every 6000 ms, pose phase unused.
// demo:     9000 ms cycle; facing forward for 7000 ms, then a half turn
//           over the last 2000 ms. posePhase = t / 2000 runs on regardless
//           of the rotation cycle.
//
// Nothing accumulates between ticks, so skipped or late frames cannot drift.
// The only state is the clock origin; a host that switches mode builds a
// new AnimationClock.

#pragma once

#include <cmath>

#include "BioSkelMath.h"
#include "OperatingMode.h"

namespace BioSkel {

// ── Timing constants (milliseconds) ──
inline constexpr double kAnalysisRevolutionMs = 6000.0;
inline constexpr double kDemoCycleMs          = 9000.0;
inline constexpr double kDemoHoldMs           = 7000.0;
inline constexpr double kDemoTurnMs           = kDemoCycleMs - kDemoHoldMs;
inline constexpr double kPoseStepMs           = 2000.0;

struct ClockSample {
    double timeMs    = 0.0;  // elapsed time the sample was taken at
    double viewAngle = 0.0;  // radians about the vertical axis
    double posePhase = 0.0;  // keyframe phase; 0 in analysis mode
};

/// Non-finite or negative times evaluate as 0.
inline double sanitizeClockTime(double t) {
    if (!std::isfinite(t) || t < 0.0)
        return 0.0;
    return t;
}

/// (t / 6000) * 2pi, wrapped into [0, 2pi) so large t keeps its precision.
inline double analysisViewAngle(double t) {
    t = sanitizeClockTime(t);
    return (std::fmod(t, kAnalysisRevolutionMs) / kAnalysisRevolutionMs) * kTwoPi;
}

/// 0 for the first 7000 ms of every 9000 ms cycle, then a linear ramp 0 -> pi.
inline double demoViewAngle(double t) {
    t = sanitizeClockTime(t);
    double inCycle = std::fmod(t, kDemoCycleMs);
    if (inCycle < kDemoHoldMs)
        return 0.0;
    return ((inCycle - kDemoHoldMs) / kDemoTurnMs) * kPi;
}

/// t / 2000. Never reset by the rotation cycle.
inline double drillPosePhase(double t) {
    return sanitizeClockTime(t) / kPoseStepMs;
}

inline ClockSample sampleClock(double t, OperatingMode mode) {
    ClockSample s;
    s.timeMs = sanitizeClockTime(t);
    if (mode == OperatingMode::Demo) {
        s.viewAngle = demoViewAngle(s.timeMs);
        s.posePhase = drillPosePhase(s.timeMs);
    } else {
        s.viewAngle = analysisViewAngle(s.timeMs);
        s.posePhase = 0.0;
    }
    return s;
}

// ════════════════════════════════════════════════════════════════════
// AnimationClock: mode + origin, sampled against the host frame time
// ════════════════════════════════════════════════════════════════════
//
// Usage:
//   AnimationClock clock(OperatingMode::Demo, nowMs);
//   ...each frame...
//   ClockSample s = clock.sample(frameTimeMs);
//   ...mode switch...
//   clock = AnimationClock(OperatingMode::Analysis, frameTimeMs);

class AnimationClock {
public:
    explicit AnimationClock(OperatingMode mode = OperatingMode::Analysis,
                            double originMs = 0.0)
        : mMode(mode), mOriginMs(sanitizeClockTime(originMs)) {}

    /// Time since the clock was created. Host times before the origin read as 0.
    double elapsed(double nowMs) const {
        return sanitizeClockTime(nowMs - mOriginMs);
    }

    ClockSample sample(double nowMs) const {
        return sampleClock(elapsed(nowMs), mMode);
    }

    OperatingMode mode() const { return mMode; }
    double origin() const { return mOriginMs; }

private:
    OperatingMode mMode;
    double mOriginMs;
};

} // namespace BioSkel
