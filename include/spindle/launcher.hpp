/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "spindle/config.hpp"
#include "spindle/process.hpp"
#include "spindle/types.hpp"

namespace spindle {

struct RenderRequest {
    std::filesystem::path input;
    std::filesystem::path output;
    double seconds = 10.0;
    int fps = 11;
    int size = 1080;
    Axis axis = Axis::Z;
    double offset = 0.0;
    VideoFormat format = VideoFormat::Mp4;
    bool autoOrientation = true;
    Quality quality = Quality::Ultra;
    bool watermark = false;
    int kelvin = 5600;
    bool autoBrightness = true;
    double exposure = 0.0;
};

struct LaunchResult {
    bool ok = false;
    std::unique_ptr<Process> process;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class Launcher final {
public:
    explicit Launcher(const Config& config) noexcept;

    // Configured path, then the well-known install path, then PATH.
    [[nodiscard]] std::optional<std::filesystem::path> resolveRenderer() const;

    [[nodiscard]] std::vector<std::string> buildArguments(const RenderRequest& request) const;
    [[nodiscard]] Environment buildEnvironment() const;

    [[nodiscard]] LaunchResult launch(const RenderRequest& request) const;

private:
    const Config& config_;
};

}
