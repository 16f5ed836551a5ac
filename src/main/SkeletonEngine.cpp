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

#include "SkeletonEngine.h"

#include "logger.h"
#include "motion/PoseInterpolator.h"

namespace BioSkel {

/*----------------------------------------------------*/
/*------------------- SkeletonEngine -----------------*/
/*----------------------------------------------------*/
SkeletonEngine::SkeletonEngine(const Palette &palette, const RenderStyle &style)
    : mLibrary(PoseLibrary::instance()), mPalette(palette), mRenderer(style) {}

//------------------------------------------------------
Pose SkeletonEngine::poseFor(OperatingMode mode, Drill drill,
                             double posePhase) const {
    if (mode == OperatingMode::Analysis)
        return mLibrary.basePose();
    return interpolatePose(mLibrary.sequence(drill), posePhase);
}

//------------------------------------------------------
FrameContext SkeletonEngine::renderFrame(double timeMs, const RiskVector &risk,
                                         OperatingMode mode, Drill drill) const {
    return renderFrame(sampleClock(timeMs, mode), risk, mode, drill);
}

//------------------------------------------------------
FrameContext SkeletonEngine::renderFrame(const ClockSample &clock,
                                         const RiskVector &risk,
                                         OperatingMode mode, Drill drill) const {
    FrameContext ctx;
    ctx.clock = clock;
    ctx.mode = mode;
    ctx.drill = drill;

    // Computed
    ctx.pose = poseFor(mode, drill, clock.posePhase);

    // Projected
    ctx.projected = projectPose(ctx.pose, clock.viewAngle);

    // Rendered
    RiskColorizer colors(risk, mode, mPalette);
    ctx.draws = mRenderer.render(ctx.projected, colors);

    LOG_VERBOSE("SkeletonEngine: t=%.1f mode=%s drill=%s angle=%.4f phase=%.4f "
                "commands=%u",
                clock.timeMs, modeName(mode), drillName(drill), clock.viewAngle,
                clock.posePhase, static_cast<unsigned>(ctx.draws.size()));
    return ctx;
}

//------------------------------------------------------
DrawList SkeletonEngine::render(double timeMs, const RiskVector &risk,
                                const std::string &mode,
                                const std::string &drill) const {
    std::optional<OperatingMode> parsed = parseMode(mode);
    if (!parsed)
        LOG_VERBOSE("SkeletonEngine: Unknown mode '%s', using analysis", mode.c_str());

    OperatingMode m = parsed.value_or(OperatingMode::Analysis);
    return renderFrame(timeMs, risk, m, drillFromName(drill)).draws;
}

} // namespace BioSkel
