// EngineConfig.h: YAML + CLI configuration for the bioskel tools
// Config precedence: CLI flags > YAML config file > hardcoded defaults
#pragma once

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "OperatingMode.h"
#include "PoseLibrary.h"
#include "RiskColorizer.h"
#include "logger.h"

namespace BioSkel {

// All configurable settings for the headless tool and the viewer.
struct EngineConfig {
    // -- engine --
    OperatingMode mode = OperatingMode::Analysis;
    std::string drill;   // drill name; empty = derive from issue, then default
    std::string issue;   // detected issue the drill should correct

    // -- risk --
    RiskVector risk;     // all 0 (safe) unless configured

    // -- output --
    double      startMs    = 0.0;            // clock time of the first frame
    int         frames     = 1;              // number of frames to render
    double      stepMs     = 1000.0 / 30.0;  // clock advance per frame
    std::string directory  = ".";            // where numbered SVGs go
    std::string prefix     = "bioskel_";     // SVG file name prefix
    float       pixelScale = 4.0f;           // SVG / window pixels per viewport unit
    std::string background;                  // SVG background, empty = transparent

    // -- palette --
    Palette palette;

    // -- developer --
    bool verbose      = false;  // log level VERBOSE instead of INFO
    bool dumpCommands = false;  // print draw commands to stdout

    /// Drill to play: explicit name, else the issue's drill, else the default.
    Drill resolvedDrill() const {
        if (!drill.empty())
            return drillFromName(drill);
        if (!issue.empty())
            return drillForIssue(issue);
        return kDefaultDrill;
    }
};

// Result of CLI parsing: values that are CLI-only (not in YAML).
struct CliResult {
    std::string configPath;              // --config <path>
    bool        helpRequested = false;   // --help / -h
    std::vector<std::string> unknownArgs;
};

inline float clampRisk(float v) {
    if (!std::isfinite(v)) return 0.0f;
    return std::clamp(v, 0.0f, 100.0f);
}

inline int clampFrames(int v) { return std::clamp(v, 1, 100000); }

inline double clampStep(double v) {
    if (!std::isfinite(v) || v < 0.0) return 0.0;
    return v;
}

inline double clampStart(double v) {
    if (!std::isfinite(v) || v < 0.0) return 0.0;
    return v;
}

inline float clampPixelScale(float v) {
    if (!std::isfinite(v)) return 4.0f;
    return std::clamp(v, 0.25f, 64.0f);
}

// Replace a palette entry when the text parses; keep the old one otherwise.
inline void applyPaletteColor(const std::string &key, const std::string &text,
                              Color &slot) {
    Color parsed;
    if (parseColor(text, parsed))
        slot = parsed;
    else
        LOG_ERROR("EngineConfig: Warning: Palette entry '%s' has unusable "
                  "colour '%s'",
                  key.c_str(), text.c_str());
}

// Load settings from a YAML config file into cfg.
// Returns true if the file was loaded successfully.
// Returns false (silently) if the file doesn't exist; this is the normal case.
// Logs and returns false on parse errors.
inline bool loadConfigFromYAML(const std::string &path, EngineConfig &cfg) {
    FILE *f = std::fopen(path.c_str(), "r");
    if (!f) return false;
    std::fclose(f);

    try {
        YAML::Node root = YAML::LoadFile(path);

        // engine section
        if (YAML::Node eng = root["engine"]) {
            if (eng["mode"]) {
                std::string val = eng["mode"].as<std::string>();
                if (std::optional<OperatingMode> m = parseMode(val))
                    cfg.mode = *m;
                else
                    LOG_ERROR("EngineConfig: Warning: Unknown mode '%s' in %s",
                              val.c_str(), path.c_str());
            }
            if (eng["drill"]) cfg.drill = eng["drill"].as<std::string>();
            if (eng["issue"]) cfg.issue = eng["issue"].as<std::string>();
        }

        // risk section
        if (YAML::Node risk = root["risk"]) {
            if (risk["shoulder_overuse"])
                cfg.risk.shoulderOveruse = clampRisk(risk["shoulder_overuse"].as<float>());
            if (risk["poor_kinetic_chain"])
                cfg.risk.poorKineticChain = clampRisk(risk["poor_kinetic_chain"].as<float>());
            if (risk["knee_stress"])
                cfg.risk.kneeStress = clampRisk(risk["knee_stress"].as<float>());
        }

        // output section
        if (YAML::Node out = root["output"]) {
            if (out["start_ms"])    cfg.startMs    = clampStart(out["start_ms"].as<double>());
            if (out["frames"])      cfg.frames     = clampFrames(out["frames"].as<int>());
            if (out["step_ms"])     cfg.stepMs     = clampStep(out["step_ms"].as<double>());
            if (out["directory"])   cfg.directory  = out["directory"].as<std::string>();
            if (out["prefix"])      cfg.prefix     = out["prefix"].as<std::string>();
            if (out["pixel_scale"]) cfg.pixelScale = clampPixelScale(out["pixel_scale"].as<float>());
            if (out["background"])  cfg.background = out["background"].as<std::string>();
        }

        // palette section
        if (YAML::Node pal = root["palette"]) {
            if (pal["high_alert"]) applyPaletteColor("high_alert", pal["high_alert"].as<std::string>(), cfg.palette.highAlert);
            if (pal["caution"])    applyPaletteColor("caution",    pal["caution"].as<std::string>(),    cfg.palette.caution);
            if (pal["safe"])       applyPaletteColor("safe",       pal["safe"].as<std::string>(),       cfg.palette.safe);
            if (pal["neutral"])    applyPaletteColor("neutral",    pal["neutral"].as<std::string>(),    cfg.palette.neutral);
            if (pal["ideal"])      applyPaletteColor("ideal",      pal["ideal"].as<std::string>(),      cfg.palette.ideal);
        }

        // developer section
        if (YAML::Node dev = root["developer"]) {
            if (dev["verbose"])       cfg.verbose      = dev["verbose"].as<bool>();
            if (dev["dump_commands"]) cfg.dumpCommands = dev["dump_commands"].as<bool>();
        }

        LOG_INFO("EngineConfig: Loaded config from %s", path.c_str());
        return true;
    } catch (const YAML::Exception &e) {
        LOG_ERROR("EngineConfig: Warning: failed to parse config %s: %s",
                  path.c_str(), e.what());
        return false;
    }
}

// Parse CLI arguments into the config struct and extract CLI-only values.
// Processes all flags in a single pass using else-if chain.
inline CliResult applyCliOverrides(int argc, char *argv[], EngineConfig &cfg) {
    CliResult cli;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            cli.helpRequested = true;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            cli.configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            const char *val = argv[++i];
            if (std::optional<OperatingMode> m = parseMode(val))
                cfg.mode = *m;
            else
                cli.unknownArgs.push_back(std::string("--mode ") + val);
        } else if (std::strcmp(argv[i], "--drill") == 0 && i + 1 < argc) {
            cfg.drill = argv[++i];
        } else if (std::strcmp(argv[i], "--issue") == 0 && i + 1 < argc) {
            cfg.issue = argv[++i];
        } else if (std::strcmp(argv[i], "--shoulder") == 0 && i + 1 < argc) {
            cfg.risk.shoulderOveruse = clampRisk(static_cast<float>(std::atof(argv[++i])));
        } else if (std::strcmp(argv[i], "--kinetic") == 0 && i + 1 < argc) {
            cfg.risk.poorKineticChain = clampRisk(static_cast<float>(std::atof(argv[++i])));
        } else if (std::strcmp(argv[i], "--knee") == 0 && i + 1 < argc) {
            cfg.risk.kneeStress = clampRisk(static_cast<float>(std::atof(argv[++i])));
        } else if (std::strcmp(argv[i], "--start") == 0 && i + 1 < argc) {
            cfg.startMs = clampStart(std::atof(argv[++i]));
        } else if (std::strcmp(argv[i], "--frames") == 0 && i + 1 < argc) {
            cfg.frames = clampFrames(std::atoi(argv[++i]));
        } else if (std::strcmp(argv[i], "--step") == 0 && i + 1 < argc) {
            cfg.stepMs = clampStep(std::atof(argv[++i]));
        } else if (std::strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
            cfg.directory = argv[++i];
        } else if (std::strcmp(argv[i], "--prefix") == 0 && i + 1 < argc) {
            cfg.prefix = argv[++i];
        } else if (std::strcmp(argv[i], "--scale") == 0 && i + 1 < argc) {
            cfg.pixelScale = clampPixelScale(static_cast<float>(std::atof(argv[++i])));
        } else if (std::strcmp(argv[i], "--dump") == 0) {
            cfg.dumpCommands = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            cfg.verbose = true;
        } else {
            cli.unknownArgs.push_back(argv[i]);
        }
    }

    return cli;
}

// Full load sequence shared by the executables: find --config, load the
// YAML file, then re-apply CLI flags so they win.
inline CliResult loadEngineConfig(int argc, char *argv[], EngineConfig &cfg,
                                  const std::string &defaultConfigPath) {
    EngineConfig scratch;
    CliResult cli = applyCliOverrides(argc, argv, scratch);

    std::string configPath = cli.configPath.empty() ? defaultConfigPath : cli.configPath;
    if (!configPath.empty())
        loadConfigFromYAML(configPath, cfg);

    return applyCliOverrides(argc, argv, cfg);
}

inline void printUsage(const char *prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "  --config <path>     YAML config file\n"
        "  --mode <m>          analysis | demo\n"
        "  --drill <name>      hip_drive | low_contact | arm_extension | athletic_stance\n"
        "  --issue <name>      pick the drill for a detected issue\n"
        "  --shoulder <0-100>  shoulder_overuse score\n"
        "  --kinetic <0-100>   poor_kinetic_chain score\n"
        "  --knee <0-100>      knee_stress score\n"
        "  --start <ms>        clock time of the first frame\n"
        "  --frames <n>        frames to render\n"
        "  --step <ms>         clock advance per frame\n"
        "  --out <dir>         output directory\n"
        "  --prefix <text>     output file prefix\n"
        "  --scale <f>         pixels per viewport unit\n"
        "  --dump              print draw commands\n"
        "  --verbose, -v       verbose logging\n"
        "  --help, -h          this text\n",
        prog);
}

} // namespace BioSkel
