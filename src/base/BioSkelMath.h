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

/// @file BioSkelMath.h
/// @brief Central math header: GLM-backed type aliases for bioskel.
///
/// All engine code includes this header for Vector2 and Vector3 and the
/// angle constants. The underlying implementation is GLM 1.0 (MIT license).

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

namespace BioSkel {

using Vector2 = glm::vec2;
using Vector3 = glm::vec3;

/// Full turn in radians, double precision (clock math runs in double).
inline const double kTwoPi = glm::two_pi<double>();
/// Half turn in radians.
inline const double kPi    = glm::pi<double>();

} // namespace BioSkel
