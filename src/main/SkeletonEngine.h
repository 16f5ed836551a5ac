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

// SkeletonEngine.h: One animation tick, start to finish
//
// Per tick:
//   AnimationClock sample -> pose (base, or interpolated drill) ->
//   projection per joint -> draw list (colours from RiskColorizer)
//
// FrameContext: every intermediate result of one tick, kept for
//                diagnostics, the headless dump and tests
// SkeletonEngine: palette + render style; stateless across ticks
//
// Nothing here throws on the per-frame path. The pose library is built
// (and validated) the first time an engine is constructed.

#pragma once

#include <string>

#include "DrawList.h"
#include "PoseLibrary.h"
#include "Projector.h"
#include "RiskColorizer.h"
#include "SkeletonRenderer.h"
#include "motion/AnimationClock.h"

namespace BioSkel {

struct FrameContext {
    ClockSample   clock;
    OperatingMode mode  = OperatingMode::Analysis;
    Drill         drill = kDefaultDrill;  // meaningful in demo mode only
    Pose          pose;
    ProjectedPose projected;
    DrawList      draws;
};

class SkeletonEngine {
public:
    explicit SkeletonEngine(const Palette &palette = Palette(),
                            const RenderStyle &style = RenderStyle());

    /// render(time, riskVector, mode, drill) -> drawCommands, with every stage kept.
    /// timeMs is the elapsed time of the animation clock.
    FrameContext renderFrame(double timeMs, const RiskVector &risk,
                             OperatingMode mode, Drill drill = kDefaultDrill) const;

    /// Same, for an already sampled clock (hosts driving an AnimationClock).
    FrameContext renderFrame(const ClockSample &clock, const RiskVector &risk,
                             OperatingMode mode, Drill drill = kDefaultDrill) const;

    /// Name-based entry point. Unknown drill names use the default drill;
    /// unknown mode names render in analysis mode.
    DrawList render(double timeMs, const RiskVector &risk,
                    const std::string &mode, const std::string &drill) const;

    /// Pose shown for a mode at a phase: base pose in analysis, drill
    /// interpolation in demo.
    Pose poseFor(OperatingMode mode, Drill drill, double posePhase) const;

    const Palette &palette() const { return mPalette; }
    const SkeletonRenderer &renderer() const { return mRenderer; }

private:
    const PoseLibrary &mLibrary;
    Palette mPalette;
    SkeletonRenderer mRenderer;
};

} // namespace BioSkel
