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

// Headless entry point for bioskel
// Renders a run of animation ticks to numbered SVG files, or dumps the
// draw commands as text, without a window

#include "BioSkelException.h"
#include "EngineConfig.h"
#include "SkeletonEngine.h"
#include "SvgWriter.h"
#include "logger.h"
#include "stdlog.h"

#include <cstdio>
#include <iostream>
#include <string>

using namespace BioSkel;

// ---------- Text dump ----------

static void printFrame(int index, const FrameContext &ctx) {
    std::printf("frame %d t=%.3f mode=%s drill=%s angle=%.6f phase=%.6f\n",
                index, ctx.clock.timeMs, modeName(ctx.mode), drillName(ctx.drill),
                ctx.clock.viewAngle, ctx.clock.posePhase);

    for (const DrawCommand &cmd : ctx.draws) {
        if (cmd.kind == DrawCommand::LINE) {
            std::printf("  line   %-15s -> %-15s (%7.3f,%7.3f)-(%7.3f,%7.3f) "
                        "w=%.3f op=%.3f %s%s\n",
                        jointName(cmd.joint), jointName(cmd.jointEnd),
                        cmd.from.x, cmd.from.y, cmd.to.x, cmd.to.y, cmd.width,
                        cmd.opacity, cmd.color.toCss().c_str(),
                        cmd.glow ? " glow" : "");
        } else {
            std::printf("  circle %-15s (%7.3f,%7.3f) r=%.3f op=%.3f %s%s\n",
                        jointName(cmd.joint), cmd.from.x, cmd.from.y, cmd.radius,
                        cmd.opacity, cmd.color.toCss().c_str(),
                        cmd.glow ? " glow" : "");
        }
    }
}

static std::string framePath(const EngineConfig &cfg, int index) {
    char num[16];
    std::snprintf(num, sizeof(num), "%05d", index);

    std::string dir = cfg.directory.empty() ? std::string(".") : cfg.directory;
    if (dir.back() != '/')
        dir += '/';
    return dir + cfg.prefix + num + ".svg";
}

// ---------- Main ----------

int main(int argc, char *argv[]) {
    Logger logger;
    StdLog stdlog;
    logger.registerLogListener(&stdlog);
    logger.setLogLevel(Logger::LOG_LEVEL_INFO);

    EngineConfig cfg;
    CliResult cli = loadEngineConfig(argc, argv, cfg, "bioskel.yaml");

    if (cli.helpRequested) {
        printUsage(argv[0]);
        return 0;
    }

    for (const std::string &arg : cli.unknownArgs)
        LOG_ERROR("Headless: Ignoring unknown argument '%s'", arg.c_str());

    if (cfg.verbose)
        logger.setLogLevel(Logger::LOG_LEVEL_VERBOSE);

    int failures = 0;

    try {
        SkeletonEngine engine(cfg.palette);
        AnimationClock clock(cfg.mode);
        Drill drill = cfg.resolvedDrill();

        SvgOptions svg;
        svg.pixelScale = cfg.pixelScale;
        svg.background = cfg.background;

        LOG_INFO("Headless: %d frame(s) from t=%.1f step %.3f ms, mode %s, drill %s",
                 cfg.frames, cfg.startMs, cfg.stepMs, modeName(cfg.mode),
                 drillName(drill));

        for (int i = 0; i < cfg.frames; ++i) {
            double now = cfg.startMs + cfg.stepMs * static_cast<double>(i);
            FrameContext ctx = engine.renderFrame(clock.sample(now), cfg.risk,
                                                  clock.mode(), drill);

            if (cfg.dumpCommands) {
                printFrame(i, ctx);
                continue;
            }

            if (!saveSvg(framePath(cfg, i), ctx.draws, svg))
                ++failures;
        }
    } catch (const BasicException &e) {
        std::cerr << "Error: " << e.getDetails() << std::endl;
        logger.unregisterLogListener(&stdlog);
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        logger.unregisterLogListener(&stdlog);
        return 1;
    }

    if (failures > 0)
        LOG_ERROR("Headless: %d frame(s) could not be written", failures);

    logger.unregisterLogListener(&stdlog);
    return failures > 0 ? 1 : 0;
}
