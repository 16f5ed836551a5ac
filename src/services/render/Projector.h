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

// Projector.h: Body-local 3D joint -> viewport 2D position, scale, opacity
//
// Fixed camera, no camera model:
//   1. rotate about the vertical (y) axis by viewAngle
//        xr = x cos a - z sin a
//        zr = x sin a + z cos a
//   2. perspective divide with focal length 300: scale = FL / (FL + zr)
//   3. screen = (xr * scale + cx, y * scale + cy), (cx, cy) = viewport centre
//   4. opacity = clamp((zr + 50) / 100, 0.3, 1.0)
//
// Pure function of point + angle.

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <optional>

#include "BioSkelMath.h"
#include "PoseLibrary.h"

namespace BioSkel {

inline constexpr float kFocalLength     = 300.0f;
inline constexpr float kViewportWidth   = 100.0f;
inline constexpr float kViewportHeight  = 120.0f;
inline constexpr float kViewportCenterX = kViewportWidth * 0.5f;
inline constexpr float kViewportCenterY = kViewportHeight * 0.5f;

inline constexpr float kMinDepthOpacity = 0.3f;
inline constexpr float kMaxDepthOpacity = 1.0f;

struct Projection {
    Vector2 screen{0.0f};   // viewport units
    float   scale   = 1.0f; // perspective scale, sizes lines and circles
    float   opacity = 1.0f; // depth cue in [0.3, 1]
    float   depth   = 0.0f; // rotated z, used for draw ordering
};

/// Project one point. nullopt when the point sits on or behind the focal
/// plane (FL + zr <= 0); callers skip it.
inline std::optional<Projection> projectPoint(const Vector3 &p, double viewAngle) {
    const double c = std::cos(viewAngle);
    const double s = std::sin(viewAngle);

    const double xr = static_cast<double>(p.x) * c - static_cast<double>(p.z) * s;
    const double zr = static_cast<double>(p.x) * s + static_cast<double>(p.z) * c;

    const double denom = static_cast<double>(kFocalLength) + zr;
    if (!(denom > 0.0))
        return std::nullopt;

    const double scale = static_cast<double>(kFocalLength) / denom;

    Projection out;
    out.scale = static_cast<float>(scale);
    out.depth = static_cast<float>(zr);
    out.screen.x = static_cast<float>(xr * scale) + kViewportCenterX;
    out.screen.y = static_cast<float>(static_cast<double>(p.y) * scale) + kViewportCenterY;
    out.opacity = std::clamp(static_cast<float>((zr + 50.0) / 100.0),
                             kMinDepthOpacity, kMaxDepthOpacity);
    return out;
}

using ProjectedPose = std::array<std::optional<Projection>, kJointCount>;

/// Project every joint present in the pose; absent joints stay empty.
inline ProjectedPose projectPose(const Pose &pose, double viewAngle) {
    ProjectedPose out;
    for (size_t j = 0; j < kJointCount; ++j) {
        JointId joint = static_cast<JointId>(j);
        if (pose.has(joint))
            out[j] = projectPoint(pose.get(joint), viewAngle);
    }
    return out;
}

} // namespace BioSkel
