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

#include "SvgWriter.h"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "Projector.h"
#include "logger.h"

namespace BioSkel {

namespace {

const char *kGlowFilterId = "bioskel-glow";

void writeNumber(std::ostringstream &os, float v) {
    // fixed 3 decimals
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", static_cast<double>(v));
    os << buf;
}

void writeColorAttr(std::ostringstream &os, const char *attr, const Color &c) {
    os << ' ' << attr << "=\"" << c.toHex() << '"';
    if (c.a < 1.0f) {
        os << ' ' << attr << "-opacity=\"";
        writeNumber(os, c.a);
        os << '"';
    }
}

} // namespace

//------------------------------------------------------
std::string writeSvg(const DrawList &draws, const SvgOptions &opts) {
    std::ostringstream os;

    os << "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 "
       << static_cast<int>(kViewportWidth) << ' '
       << static_cast<int>(kViewportHeight) << "\" width=\"";
    writeNumber(os, kViewportWidth * opts.pixelScale);
    os << "\" height=\"";
    writeNumber(os, kViewportHeight * opts.pixelScale);
    os << "\" fill=\"none\" stroke-linecap=\"round\" stroke-linejoin=\"round\">\n";

    os << "  <defs>\n"
       << "    <filter id=\"" << kGlowFilterId
       << "\" x=\"-50%\" y=\"-50%\" width=\"200%\" height=\"200%\">\n"
       << "      <feGaussianBlur stdDeviation=\"";
    writeNumber(os, opts.glowStdDev);
    os << "\" result=\"coloredBlur\"/>\n"
       << "      <feMerge>\n"
       << "        <feMergeNode in=\"coloredBlur\"/>\n"
       << "        <feMergeNode in=\"SourceGraphic\"/>\n"
       << "      </feMerge>\n"
       << "    </filter>\n"
       << "  </defs>\n";

    if (!opts.background.empty()) {
        Color bg;
        if (parseColor(opts.background, bg)) {
            os << "  <rect x=\"0\" y=\"0\" width=\"100%\" height=\"100%\"";
            writeColorAttr(os, "fill", bg);
            os << "/>\n";
        } else {
            LOG_ERROR("SvgWriter: Unusable background colour '%s', leaving it transparent",
                      opts.background.c_str());
        }
    }

    for (const DrawCommand &cmd : draws) {
        if (cmd.kind == DrawCommand::LINE) {
            os << "  <line data-bone=\"" << jointName(cmd.joint) << '-'
               << jointName(cmd.jointEnd) << "\" x1=\"";
            writeNumber(os, cmd.from.x);
            os << "\" y1=\"";
            writeNumber(os, cmd.from.y);
            os << "\" x2=\"";
            writeNumber(os, cmd.to.x);
            os << "\" y2=\"";
            writeNumber(os, cmd.to.y);
            os << '"';
            writeColorAttr(os, "stroke", cmd.color);
            os << " stroke-width=\"";
            writeNumber(os, cmd.width);
            os << '"';
        } else {
            os << "  <circle data-joint=\"" << jointName(cmd.joint) << "\" cx=\"";
            writeNumber(os, cmd.from.x);
            os << "\" cy=\"";
            writeNumber(os, cmd.from.y);
            os << "\" r=\"";
            writeNumber(os, cmd.radius);
            os << '"';
            writeColorAttr(os, "fill", cmd.color);
        }

        os << " opacity=\"";
        writeNumber(os, cmd.opacity);
        os << '"';
        if (cmd.glow)
            os << " filter=\"url(#" << kGlowFilterId << ")\"";
        os << "/>\n";
    }

    os << "</svg>\n";
    return os.str();
}

//------------------------------------------------------
bool saveSvg(const std::string &path, const DrawList &draws,
             const SvgOptions &opts) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("SvgWriter: Could not open '%s' for writing", path.c_str());
        return false;
    }

    out << writeSvg(draws, opts);
    if (!out.good()) {
        LOG_ERROR("SvgWriter: Write to '%s' failed", path.c_str());
        return false;
    }
    return true;
}

} // namespace BioSkel
