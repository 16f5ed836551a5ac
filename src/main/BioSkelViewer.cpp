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

// Interactive viewer: runs the animation tick every frame into an SDL2 window
//
// Keys: M toggles analysis/demo (restarts the clock), 1-4 select the drill,
// Esc quits. Risk scores and the initial mode/drill come from EngineConfig.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <vector>

#include <SDL.h>

#include "BioSkelException.h"
#include "EngineConfig.h"
#include "SkeletonEngine.h"
#include "logger.h"
#include "stdlog.h"

using namespace BioSkel;

static const int CIRCLE_SEGMENTS = 20;
static const float GLOW_ALPHA = 0.25f;

// ── Geometry helpers ──
// All coordinates arrive in viewport units and are scaled to pixels here.

static SDL_Color toSdl(const Color &c, float opacity) {
    float a = std::clamp(c.a * opacity, 0.0f, 1.0f);
    return SDL_Color{c.r, c.g, c.b, static_cast<Uint8>(a * 255.0f + 0.5f)};
}

static void pushThickLine(std::vector<SDL_Vertex> &verts, Vector2 a, Vector2 b,
                          float width, SDL_Color col, float px) {
    Vector2 d = b - a;
    float len = std::sqrt(d.x * d.x + d.y * d.y);
    if (len <= 0.0001f)
        return;

    Vector2 n(-d.y / len, d.x / len);
    n *= width * 0.5f;

    SDL_FPoint p0{(a.x + n.x) * px, (a.y + n.y) * px};
    SDL_FPoint p1{(b.x + n.x) * px, (b.y + n.y) * px};
    SDL_FPoint p2{(b.x - n.x) * px, (b.y - n.y) * px};
    SDL_FPoint p3{(a.x - n.x) * px, (a.y - n.y) * px};
    SDL_FPoint uv{0.0f, 0.0f};

    verts.push_back({p0, col, uv});
    verts.push_back({p1, col, uv});
    verts.push_back({p2, col, uv});
    verts.push_back({p0, col, uv});
    verts.push_back({p2, col, uv});
    verts.push_back({p3, col, uv});
}

static void pushDisc(std::vector<SDL_Vertex> &verts, Vector2 c, float r,
                     SDL_Color col, float px) {
    const float step = static_cast<float>(kTwoPi) / CIRCLE_SEGMENTS;
    SDL_FPoint centre{c.x * px, c.y * px};
    SDL_FPoint uv{0.0f, 0.0f};

    for (int i = 0; i < CIRCLE_SEGMENTS; ++i) {
        float a0 = step * static_cast<float>(i);
        float a1 = step * static_cast<float>(i + 1);
        SDL_FPoint p0{(c.x + std::cos(a0) * r) * px, (c.y + std::sin(a0) * r) * px};
        SDL_FPoint p1{(c.x + std::cos(a1) * r) * px, (c.y + std::sin(a1) * r) * px};
        verts.push_back({centre, col, uv});
        verts.push_back({p0, col, uv});
        verts.push_back({p1, col, uv});
    }
}

// Replays a draw list. Glowing commands get a wider translucent pass
// underneath as a stand-in for the SVG blur.
static void drawCommands(SDL_Renderer *renderer, const DrawList &draws, float px) {
    std::vector<SDL_Vertex> verts;
    verts.reserve(draws.size() * CIRCLE_SEGMENTS * 3 * 2);

    for (const DrawCommand &cmd : draws) {
        SDL_Color col = toSdl(cmd.color, cmd.opacity);

        if (cmd.glow) {
            SDL_Color halo = toSdl(cmd.color, cmd.opacity * GLOW_ALPHA);
            if (cmd.kind == DrawCommand::LINE)
                pushThickLine(verts, cmd.from, cmd.to, cmd.width + kGlowBlurStdDev * 2.0f, halo, px);
            else
                pushDisc(verts, cmd.from, cmd.radius + kGlowBlurStdDev, halo, px);
        }

        if (cmd.kind == DrawCommand::LINE) {
            pushThickLine(verts, cmd.from, cmd.to, cmd.width, col, px);
            // round caps
            pushDisc(verts, cmd.from, cmd.width * 0.5f, col, px);
            pushDisc(verts, cmd.to, cmd.width * 0.5f, col, px);
        } else {
            pushDisc(verts, cmd.from, cmd.radius, col, px);
        }
    }

    if (!verts.empty() &&
        SDL_RenderGeometry(renderer, nullptr, verts.data(),
                           static_cast<int>(verts.size()), nullptr, 0) != 0) {
        LOG_ERROR("Viewer: SDL_RenderGeometry failed: %s", SDL_GetError());
    }
}

int main(int argc, char *argv[]) {
    Logger logger;
    StdLog stdlog;
    logger.registerLogListener(&stdlog);
    logger.setLogLevel(Logger::LOG_LEVEL_INFO);

    // Parse config: hardcoded defaults → YAML file → CLI overrides
    EngineConfig cfg;
    CliResult cli = loadEngineConfig(argc, argv, cfg, "bioskel.yaml");

    if (cli.helpRequested) {
        printUsage(argv[0]);
        return 0;
    }

    for (const std::string &arg : cli.unknownArgs)
        LOG_ERROR("Viewer: Ignoring unknown argument '%s'", arg.c_str());

    if (cfg.verbose)
        logger.setLogLevel(Logger::LOG_LEVEL_VERBOSE);

    const float px = cfg.pixelScale;
    const int windowW = static_cast<int>(std::lround(kViewportWidth * px));
    const int windowH = static_cast<int>(std::lround(kViewportHeight * px));

    // ── SDL2 init ──

    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_Window *window = SDL_CreateWindow(
        "bioskel",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        windowW, windowH,
        SDL_WINDOW_SHOWN | SDL_WINDOW_ALLOW_HIGHDPI
    );

    if (!window) {
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_Renderer *renderer = SDL_CreateRenderer(
        window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);

    if (!renderer) {
        std::fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    Color background(0x0a, 0x0a, 0x0a);
    if (!cfg.background.empty() && !parseColor(cfg.background, background))
        LOG_ERROR("Viewer: Unusable background colour '%s'", cfg.background.c_str());

    int exitCode = 0;

    try {
        SkeletonEngine engine(cfg.palette);

        auto startTime = std::chrono::steady_clock::now();
        auto nowMs = [&]() {
            return std::chrono::duration<double, std::milli>(
                       std::chrono::steady_clock::now() - startTime).count();
        };

        Drill drill = cfg.resolvedDrill();
        AnimationClock clock(cfg.mode, nowMs());

        auto updateTitle = [&]() {
            char title[128];
            if (clock.mode() == OperatingMode::Demo)
                std::snprintf(title, sizeof(title), "bioskel: demo [%s]", drillName(drill));
            else
                std::snprintf(title, sizeof(title), "bioskel: analysis");
            SDL_SetWindowTitle(window, title);
        };
        updateTitle();

        bool running = true;
        while (running) {
            SDL_Event ev;
            while (SDL_PollEvent(&ev)) {
                if (ev.type == SDL_QUIT) {
                    running = false;
                } else if (ev.type == SDL_KEYDOWN && ev.key.keysym.sym == SDLK_ESCAPE) {
                    running = false;
                } else if (ev.type == SDL_KEYDOWN && ev.key.keysym.sym == SDLK_m) {
                    // Mode switch starts a fresh clock
                    OperatingMode next = clock.mode() == OperatingMode::Demo
                                             ? OperatingMode::Analysis
                                             : OperatingMode::Demo;
                    clock = AnimationClock(next, nowMs());
                    LOG_INFO("Viewer: Mode %s", modeName(next));
                    updateTitle();
                } else if (ev.type == SDL_KEYDOWN &&
                           ev.key.keysym.sym >= SDLK_1 && ev.key.keysym.sym <= SDLK_4) {
                    // Drill change is a parameter change; the clock keeps running
                    drill = static_cast<Drill>(ev.key.keysym.sym - SDLK_1);
                    LOG_INFO("Viewer: Drill %s", drillName(drill));
                    updateTitle();
                }
            }

            FrameContext ctx = engine.renderFrame(clock.sample(nowMs()), cfg.risk,
                                                  clock.mode(), drill);

            SDL_SetRenderDrawColor(renderer, background.r, background.g, background.b, 255);
            SDL_RenderClear(renderer);
            drawCommands(renderer, ctx.draws, px);
            SDL_RenderPresent(renderer);
        }
    } catch (const BasicException &e) {
        std::fprintf(stderr, "Error: %s\n", e.getDetails().c_str());
        exitCode = 1;
    } catch (const std::exception &e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        exitCode = 1;
    }

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();

    logger.unregisterLogListener(&stdlog);
    return exitCode;
}
