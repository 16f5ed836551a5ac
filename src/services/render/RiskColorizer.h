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

// RiskColorizer.h: Risk vector -> per-joint / per-bone colour
//
// analysis mode: each joint's risk category (explicit table in
//   SkeletonTopology) picks one score of the risk vector, which maps to a
//   three-tier colour: > 66 high alert, > 33 caution, else safe. Neutral
//   joints use the bone colour.
// demo mode: every joint and bone uses the ideal-form colour.
//
// A bone always takes its start joint's colour, even when the end joint
// computes a different one.

#pragma once

#include <array>
#include <string>

#include "Color.h"
#include "OperatingMode.h"
#include "SkeletonTopology.h"

namespace BioSkel {

// ── Risk vector ──
// Scores in [0, 100]; anything missing stays 0 (safe).
struct RiskVector {
    float shoulderOveruse  = 0.0f;
    float poorKineticChain = 0.0f;
    float kneeStress       = 0.0f;

    /// Score driving a category. Neutral has no score (0).
    float score(RiskCategory category) const;

    /// Copy with non-finite values replaced by 0 and the rest clamped to [0, 100].
    RiskVector sanitized() const;
};

enum class RiskTier : uint8_t {
    Safe,
    Caution,
    HighAlert
};

inline constexpr float kCautionThreshold   = 33.0f;
inline constexpr float kHighAlertThreshold = 66.0f;

/// > 66 HighAlert, > 33 Caution, otherwise Safe (NaN included).
RiskTier riskTier(float score);

const char *riskTierName(RiskTier tier);

// ── Palette ──
// Defaults follow the dashboard skeleton widget.
struct Palette {
    Color highAlert{0xef, 0x44, 0x44};        // red-500
    Color caution{0xf5, 0x9e, 0x0b};          // amber-500
    Color safe{0x10, 0xb9, 0x81};             // emerald-500
    Color neutral{0xff, 0xff, 0xff, 0.4f};    // bone colour
    Color ideal{0x22, 0xc5, 0x5e};            // demo "correct form"

    const Color &tierColor(RiskTier tier) const;
};

// ════════════════════════════════════════════════════════════════════
// RiskColorizer: colours for one render, precomputed per joint
// ════════════════════════════════════════════════════════════════════
class RiskColorizer {
public:
    RiskColorizer(const RiskVector &risk, OperatingMode mode,
                  const Palette &palette = Palette());

    const Color &jointColor(JointId joint) const;

    /// Start joint wins.
    const Color &boneColor(const Bone &bone) const { return jointColor(bone.start); }

    /// Name-based lookup for hosts that address joints by name. Unknown
    /// names get the neutral colour.
    const Color &colorForName(const std::string &jointName) const;

    /// Anything not drawn in the neutral bone colour gets the glow treatment.
    bool isHighlighted(const Color &color) const { return color != mPalette.neutral; }

    const Palette &palette() const { return mPalette; }
    OperatingMode mode() const { return mMode; }

private:
    Palette mPalette;
    OperatingMode mMode;
    std::array<Color, kJointCount> mJointColors;
};

} // namespace BioSkel
