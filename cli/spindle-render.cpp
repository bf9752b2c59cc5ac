/*
 * spindle - Turntable render tool (spindle-render)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/orchestrator.hpp"
#include "spindle/logger.hpp"
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace spindle;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_cancel_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_cancel_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "spindle Turntable Renderer v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <model.stl> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  --axis <X|Y|Z>       Rotation axis (with --no-auto)\n";
    std::cout << "  --offset <degrees>   Starting angle, 0-360\n";
    std::cout << "  --no-auto            Disable automatic orientation\n";
    std::cout << "  --quality <q>        fast, standard or ultra\n";
    std::cout << "  --format <f>         mp4 or webm\n";
    std::cout << "  --size <px>          720, 1080, 1440 or 2160\n";
    std::cout << "  --kelvin <k>         Light color temperature, 2000-10000\n";
    std::cout << "  --exposure <ev>      Fixed exposure, -2 to 2 (disables auto brightness)\n";
    std::cout << "  --watermark          Burn in the watermark\n";
    std::cout << "  --owner <id>         Keep a durable copy and record for this owner\n";
    std::cout << "  --out <path>         Where to write the video (default: <model>_turntable.<ext>)\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SPINDLE_RENDERER        Renderer executable\n";
    std::cout << "  SPINDLE_SCRIPT          Renderer scene script\n";
    std::cout << "  SPINDLE_FFMPEG          Encoder used for frame-rate conversion\n";
    std::cout << "  SPINDLE_RENDER_FPS      Base render frame rate\n";
    std::cout << "  SPINDLE_FPS             Output frame rate\n";
    std::cout << "  SPINDLE_STORAGE         Durable storage root\n";
    std::cout << "  SPINDLE_LOG_LEVEL       Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Exit codes: 0 finished, 1 error, 2 cancelled\n";
}

std::string formatEta(const std::optional<double>& eta) {
    if (!eta) {
        return "--:--";
    }
    long total = static_cast<long>(*eta + 0.5);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02ld:%02ld", total / 60, total % 60);
    return buf;
}

bool needsValue(int i, int argc, const std::string& arg) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value\n";
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    // Keep the status line readable; SPINDLE_LOG_LEVEL overrides
    if (!std::getenv("SPINDLE_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::filesystem::path model;
    std::filesystem::path out;
    RenderOptions options;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--axis") {
                if (!needsValue(i, argc, arg)) return 1;
                options.axis = argv[++i];
            } else if (arg == "--offset") {
                if (!needsValue(i, argc, arg)) return 1;
                options.offset = std::stod(argv[++i]);
            } else if (arg == "--no-auto") {
                options.autoOrientation = false;
            } else if (arg == "--quality") {
                if (!needsValue(i, argc, arg)) return 1;
                options.quality = argv[++i];
            } else if (arg == "--format") {
                if (!needsValue(i, argc, arg)) return 1;
                options.format = argv[++i];
            } else if (arg == "--size") {
                if (!needsValue(i, argc, arg)) return 1;
                options.resolution = std::stoi(argv[++i]);
            } else if (arg == "--kelvin") {
                if (!needsValue(i, argc, arg)) return 1;
                options.kelvin = std::stoi(argv[++i]);
            } else if (arg == "--exposure") {
                if (!needsValue(i, argc, arg)) return 1;
                options.exposure = std::stod(argv[++i]);
                options.autoBrightness = false;
            } else if (arg == "--watermark") {
                options.watermark = true;
            } else if (arg == "--owner") {
                if (!needsValue(i, argc, arg)) return 1;
                options.owner = std::string(argv[++i]);
            } else if (arg == "--out") {
                if (!needsValue(i, argc, arg)) return 1;
                out = argv[++i];
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Error: Unknown option " << arg << "\n";
                return 1;
            } else if (model.empty()) {
                model = arg;
            } else {
                std::cerr << "Error: Unexpected argument " << arg << "\n";
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric option: " << e.what() << "\n";
        return 1;
    }

    if (model.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    setThreadName("Main");

    try {
        Orchestrator orchestrator(Config::fromEnv());

        auto submitted = orchestrator.submit(model, options);
        if (!submitted) {
            std::cerr << "Error: " << submitted.message << std::endl;
            return 1;
        }
        const JobId id = submitted.id;
        const bool tty = isatty(fileno(stdout));

        JobView view;
        while (true) {
            if (g_cancel_requested) {
                auto cancelled = orchestrator.cancel(id);
                if (!cancelled && cancelled.error != ErrorCode::InvalidState) {
                    std::cerr << "\nError: " << cancelled.message << std::endl;
                }
                g_cancel_requested = 0;
            }

            auto status = orchestrator.query(id);
            if (!status) {
                std::cerr << "\nError: " << status.message << std::endl;
                return 1;
            }
            view = status.view;

            char pct[16];
            std::snprintf(pct, sizeof(pct), "%5.1f%%", view.progress);
            std::cout << (tty ? "\r\033[K" : "") << "[" << toString(view.state) << "] " << pct
                      << "  ETA " << formatEta(view.etaSeconds) << "  " << view.message;
            std::cout << (tty ? "" : "\n") << std::flush;

            if (isTerminal(view.state)) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        if (tty) {
            std::cout << "\n";
        }

        if (view.state == JobState::Cancelled) {
            return 2;
        }
        if (view.state != JobState::Finished) {
            for (const auto& line : view.diagnostics) {
                std::cerr << "  " << line << "\n";
            }
            return 1;
        }

        auto artifact = orchestrator.fetchArtifact(id);
        if (!artifact) {
            std::cerr << "Error: " << artifact.message << std::endl;
            return 1;
        }
        if (out.empty()) {
            out = artifact.downloadName;
        }

        std::ofstream file(out, std::ios::binary | std::ios::trunc);
        file << artifact.stream->rdbuf();
        file.flush();
        if (!file) {
            std::cerr << "Error: Failed to write " << out.string() << std::endl;
            return 1;
        }
        std::cout << out.string() << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
