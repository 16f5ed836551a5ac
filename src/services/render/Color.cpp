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

#include "Color.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace BioSkel {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parseHex(const std::string &s, Color &out) {
    // s has the leading '#' stripped
    int digits[6];
    if (s.size() != 3 && s.size() != 6)
        return false;
    for (size_t i = 0; i < s.size(); ++i) {
        digits[i] = hexDigit(s[i]);
        if (digits[i] < 0)
            return false;
    }

    if (s.size() == 3) {
        out = Color(static_cast<uint8_t>(digits[0] * 17),
                    static_cast<uint8_t>(digits[1] * 17),
                    static_cast<uint8_t>(digits[2] * 17));
    } else {
        out = Color(static_cast<uint8_t>(digits[0] * 16 + digits[1]),
                    static_cast<uint8_t>(digits[2] * 16 + digits[3]),
                    static_cast<uint8_t>(digits[4] * 16 + digits[5]));
    }
    return true;
}

bool parseFunctional(const std::string &text, Color &out) {
    bool hasAlpha = text.compare(0, 5, "rgba(") == 0;
    size_t open = text.find('(');
    size_t close = text.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open)
        return false;

    const std::string args = text.substr(open + 1, close - open - 1);
    const char *p = args.c_str();

    double values[4] = {0.0, 0.0, 0.0, 1.0};
    int wanted = hasAlpha ? 4 : 3;

    for (int i = 0; i < wanted; ++i) {
        while (*p == ' ' || *p == '\t') ++p;
        char *end = nullptr;
        values[i] = std::strtod(p, &end);
        if (end == p)
            return false;
        p = end;
        while (*p == ' ' || *p == '\t') ++p;
        if (i + 1 < wanted) {
            if (*p != ',')
                return false;
            ++p;
        }
    }
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != '\0')
        return false;

    for (int i = 0; i < 4; ++i) {
        if (!std::isfinite(values[i]))
            return false;
    }
    for (int i = 0; i < 3; ++i) {
        if (values[i] < 0.0 || values[i] > 255.0)
            return false;
    }
    if (values[3] < 0.0 || values[3] > 1.0)
        return false;

    out = Color(static_cast<uint8_t>(values[0]), static_cast<uint8_t>(values[1]),
                static_cast<uint8_t>(values[2]), static_cast<float>(values[3]));
    return true;
}

} // namespace

//------------------------------------------------------
std::string Color::toHex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    return buf;
}

//------------------------------------------------------
std::string Color::toCss() const {
    if (a >= 1.0f)
        return toHex();

    char buf[48];
    std::snprintf(buf, sizeof(buf), "rgba(%u, %u, %u, %g)", r, g, b,
                  static_cast<double>(a));
    return buf;
}

//------------------------------------------------------
bool parseColor(const std::string &text, Color &out) {
    if (text.empty())
        return false;

    if (text[0] == '#')
        return parseHex(text.substr(1), out);

    if (text.compare(0, 4, "rgb(") == 0 || text.compare(0, 5, "rgba(") == 0)
        return parseFunctional(text, out);

    return false;
}

} // namespace BioSkel
