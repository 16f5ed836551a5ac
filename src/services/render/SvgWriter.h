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

// SvgWriter.h: DrawList -> standalone SVG document
//
// The document keeps the 100 x 120 viewport as its viewBox; pixelScale only
// sets the width/height attributes. Glowing commands reference a single
// Gaussian-blur filter merged over the source graphic.

#pragma once

#include <string>

#include "DrawList.h"

namespace BioSkel {

struct SvgOptions {
    float       pixelScale = 4.0f;     // output size = viewport x pixelScale
    std::string background;            // CSS colour; empty or unparseable = transparent
    float       glowStdDev = kGlowBlurStdDev;
};

std::string writeSvg(const DrawList &draws, const SvgOptions &opts = SvgOptions());

/// Write the document to a file. Logs and returns false on I/O failure.
bool saveSvg(const std::string &path, const DrawList &draws,
             const SvgOptions &opts = SvgOptions());

} // namespace BioSkel
