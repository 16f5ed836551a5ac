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

#include "SkeletonRenderer.h"

#include <algorithm>

#include "logger.h"

namespace BioSkel {

namespace {

struct Sortable {
    float depth;
    DrawCommand cmd;
};

// Farther first: larger rotated z is farther from the viewer.
void appendBackToFront(std::vector<Sortable> &items, DrawList &out) {
    std::stable_sort(items.begin(), items.end(),
                     [](const Sortable &a, const Sortable &b) {
                         return a.depth > b.depth;
                     });
    for (Sortable &item : items)
        out.push_back(item.cmd);
}

} // namespace

//------------------------------------------------------
DrawList SkeletonRenderer::render(const ProjectedPose &projected,
                                  const RiskColorizer &colors) const {
    DrawList out;
    out.reserve(kBoneCount + kJointCount);

    std::vector<Sortable> bones;
    bones.reserve(kBoneCount);

    for (const Bone &bone : skeletonBones()) {
        const std::optional<Projection> &a = projected[jointIndex(bone.start)];
        const std::optional<Projection> &b = projected[jointIndex(bone.end)];

        if (!a || !b) {
            LOG_VERBOSE("SkeletonRenderer: Skipping bone %s->%s, endpoint missing",
                        jointName(bone.start), jointName(bone.end));
            continue;
        }

        DrawCommand cmd;
        cmd.kind     = DrawCommand::LINE;
        cmd.from     = a->screen;
        cmd.to       = b->screen;
        cmd.width    = mStyle.boneWidth * (a->scale + b->scale) * 0.5f;
        cmd.color    = colors.boneColor(bone);
        cmd.opacity  = std::min(a->opacity, b->opacity);
        cmd.glow     = colors.isHighlighted(cmd.color);
        cmd.joint    = bone.start;
        cmd.jointEnd = bone.end;

        bones.push_back({(a->depth + b->depth) * 0.5f, cmd});
    }

    std::vector<Sortable> joints;
    joints.reserve(kJointCount);

    for (size_t j = 0; j < kJointCount; ++j) {
        const std::optional<Projection> &p = projected[j];
        if (!p)
            continue;

        JointId joint = static_cast<JointId>(j);

        DrawCommand cmd;
        cmd.kind     = DrawCommand::CIRCLE;
        cmd.from     = p->screen;
        cmd.to       = p->screen;
        cmd.radius   = baseRadius(joint) * p->scale;
        cmd.color    = colors.jointColor(joint);
        cmd.opacity  = p->opacity;
        cmd.glow     = colors.isHighlighted(cmd.color);
        cmd.joint    = joint;
        cmd.jointEnd = joint;

        joints.push_back({p->depth, cmd});
    }

    appendBackToFront(bones, out);
    appendBackToFront(joints, out);
    return out;
}

} // namespace BioSkel
