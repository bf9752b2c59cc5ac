/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "spindle/types.hpp"

namespace spindle {

// Tuning for the frame-time estimator. Empirical values, not invariants.
struct EtaParams {
    std::size_t window = 20;     // recent inter-frame durations kept
    std::size_t warmup = 5;      // durations required before estimating
    double safety = 1.25;        // multiplier on the raw estimate
    double stallFactor = 1.5;    // query-time refinement kicks in past avg * stallFactor
    double stallWeight = 0.5;    // share of the overrun added to the estimate
};

struct Config {
    // Renderer lookup: rendererPath, then rendererDefault, then rendererName on PATH.
    std::filesystem::path rendererPath;
    std::filesystem::path rendererDefault = "/Applications/Blender.app/Contents/MacOS/Blender";
    std::string rendererName = "blender";
    std::filesystem::path scriptPath;
    std::vector<std::filesystem::path> helperPaths;

    std::string ffmpegBin = "ffmpeg";

    double seconds = 10.0;
    int baseFps = 11;
    int finalFps = 25;
    int renderSize = 1080;
    Axis axis = Axis::Z;
    VideoFormat format = VideoFormat::Mp4;
    Quality quality = Quality::Ultra;

    std::filesystem::path storageRoot;
    std::filesystem::path scratchRoot;

    int maxConcurrentPerOwner = 5;
    std::uintmax_t maxUploadBytes = 100ULL * 1024 * 1024;
    std::chrono::milliseconds cancelGrace{500};
    std::size_t trailingLines = 10;
    // Terminal jobs older than this leave the registry on the next submit. Zero keeps them.
    std::chrono::seconds jobRetention{3600};

    EtaParams eta;

    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] bool needsInterpolation() const noexcept { return baseFps != finalFps; }
    [[nodiscard]] int totalFrames() const noexcept;
};

}
