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

// DrawList.h: Backend-neutral draw commands in viewport units (100 x 120)
//
// The renderer's only output. Sinks (SVG writer, SDL viewer) replay the
// commands in order; the list is already sorted for painter's algorithm.

#pragma once

#include <cstdint>
#include <vector>

#include "BioSkelMath.h"
#include "Color.h"
#include "SkeletonTopology.h"

namespace BioSkel {

/// Standard deviation of the glow blur, viewport units
inline constexpr float kGlowBlurStdDev = 3.0f;

struct DrawCommand {
    enum Kind : uint8_t {
        LINE,    // bone: from -> to, stroke width
        CIRCLE   // joint: centre = from, radius
    };

    Kind    kind    = LINE;
    Vector2 from{0.0f};
    Vector2 to{0.0f};
    float   width   = 0.0f;   // LINE only
    float   radius  = 0.0f;   // CIRCLE only
    Color   color;
    float   opacity = 1.0f;
    bool    glow    = false;  // elevated-risk highlight
    JointId joint   = JointId::Head;  // circle joint, or bone start
    JointId jointEnd = JointId::Head; // bone end (LINE only)
};

using DrawList = std::vector<DrawCommand>;

} // namespace BioSkel
