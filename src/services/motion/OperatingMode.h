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

// OperatingMode.h: analysis / demo behaviour selector

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace BioSkel {

enum class OperatingMode : uint8_t {
    Analysis,  // live data review, continuous slow rotation, base pose, risk colours
    Demo       // drill playback, front-facing with rotation pulses, ideal-form colour
};

inline const char *modeName(OperatingMode mode) {
    return mode == OperatingMode::Demo ? "demo" : "analysis";
}

inline std::optional<OperatingMode> parseMode(const std::string &name) {
    if (name == "analysis") return OperatingMode::Analysis;
    if (name == "demo")     return OperatingMode::Demo;
    return std::nullopt;
}

} // namespace BioSkel
