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
/** @file Color.h
 * @brief 8-bit RGB colour with float alpha, CSS-style text form.
 */

#pragma once

#include <cstdint>
#include <string>

namespace BioSkel {

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    float   a = 1.0f;

    Color() = default;
    Color(uint8_t r_, uint8_t g_, uint8_t b_, float a_ = 1.0f)
        : r(r_), g(g_), b(b_), a(a_) {}

    bool operator==(const Color &rhs) const {
        return r == rhs.r && g == rhs.g && b == rhs.b && a == rhs.a;
    }

    bool operator!=(const Color &rhs) const { return !(*this == rhs); }

    /// "#rrggbb" when opaque, "rgba(r, g, b, a)" otherwise
    std::string toCss() const;

    /// "#rrggbb", ignoring alpha
    std::string toHex() const;
};

/// Parses "#rgb", "#rrggbb", "rgb(r, g, b)" and "rgba(r, g, b, a)".
/// Returns false and leaves out untouched on malformed input.
bool parseColor(const std::string &text, Color &out);

} // namespace BioSkel
