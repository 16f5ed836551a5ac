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

// SkeletonRenderer.h: Projected pose + colours -> draw list
//
// Bones become lines: width = base width x average endpoint scale,
// opacity = min of the endpoint opacities. Joints become circles with
// radius = base radius x own scale, opacity = own opacity. Anything not in
// the neutral bone colour gets the glow flag.
//
// Order: all bones, then all joints; each group back to front by rotated
// depth (stable). A bone with an endpoint missing from the projected pose is
// skipped, as is a missing joint.

#pragma once

#include "DrawList.h"
#include "Projector.h"
#include "RiskColorizer.h"

namespace BioSkel {

struct RenderStyle {
    float boneWidth   = 3.0f;  // at scale 1
    float jointRadius = 2.5f;  // at scale 1
    float headRadius  = 6.0f;  // at scale 1
};

class SkeletonRenderer {
public:
    explicit SkeletonRenderer(const RenderStyle &style = RenderStyle())
        : mStyle(style) {}

    DrawList render(const ProjectedPose &projected,
                    const RiskColorizer &colors) const;

    const RenderStyle &style() const { return mStyle; }

private:
    float baseRadius(JointId joint) const {
        return joint == JointId::Head ? mStyle.headRadius : mStyle.jointRadius;
    }

    RenderStyle mStyle;
};

} // namespace BioSkel
