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

#include "RiskColorizer.h"

#include <algorithm>
#include <cmath>

namespace BioSkel {

namespace {

float sanitizeScore(float s) {
    if (!std::isfinite(s))
        return 0.0f;
    return std::clamp(s, 0.0f, 100.0f);
}

} // namespace

//------------------------------------------------------
float RiskVector::score(RiskCategory category) const {
    switch (category) {
    case RiskCategory::Shoulder:     return shoulderOveruse;
    case RiskCategory::KineticChain: return poorKineticChain;
    case RiskCategory::Knee:         return kneeStress;
    case RiskCategory::Neutral:      break;
    }
    return 0.0f;
}

//------------------------------------------------------
RiskVector RiskVector::sanitized() const {
    RiskVector out;
    out.shoulderOveruse  = sanitizeScore(shoulderOveruse);
    out.poorKineticChain = sanitizeScore(poorKineticChain);
    out.kneeStress       = sanitizeScore(kneeStress);
    return out;
}

//------------------------------------------------------
RiskTier riskTier(float score) {
    if (score > kHighAlertThreshold)
        return RiskTier::HighAlert;
    if (score > kCautionThreshold)
        return RiskTier::Caution;
    return RiskTier::Safe;
}

//------------------------------------------------------
const char *riskTierName(RiskTier tier) {
    switch (tier) {
    case RiskTier::HighAlert: return "high_alert";
    case RiskTier::Caution:   return "caution";
    case RiskTier::Safe:      break;
    }
    return "safe";
}

//------------------------------------------------------
const Color &Palette::tierColor(RiskTier tier) const {
    switch (tier) {
    case RiskTier::HighAlert: return highAlert;
    case RiskTier::Caution:   return caution;
    case RiskTier::Safe:      break;
    }
    return safe;
}

/*----------------------------------------------------*/
/*------------------- RiskColorizer ------------------*/
/*----------------------------------------------------*/
RiskColorizer::RiskColorizer(const RiskVector &risk, OperatingMode mode,
                             const Palette &palette)
    : mPalette(palette), mMode(mode) {
    const RiskVector clean = risk.sanitized();

    for (size_t j = 0; j < kJointCount; ++j) {
        JointId joint = static_cast<JointId>(j);

        if (mMode == OperatingMode::Demo) {
            mJointColors[j] = mPalette.ideal;
            continue;
        }

        RiskCategory category = jointRiskCategory(joint);
        if (category == RiskCategory::Neutral)
            mJointColors[j] = mPalette.neutral;
        else
            mJointColors[j] = mPalette.tierColor(riskTier(clean.score(category)));
    }
}

//------------------------------------------------------
const Color &RiskColorizer::jointColor(JointId joint) const {
    size_t idx = jointIndex(joint);
    if (idx >= kJointCount)
        return mPalette.neutral;
    return mJointColors[idx];
}

//------------------------------------------------------
const Color &RiskColorizer::colorForName(const std::string &jointName) const {
    if (std::optional<JointId> joint = jointFromName(jointName))
        return jointColor(*joint);
    if (mMode == OperatingMode::Demo)
        return mPalette.ideal;
    return mPalette.neutral;
}

} // namespace BioSkel
