/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/launcher.hpp"
#include "spindle/logger.hpp"
#include <cstdlib>
#include <sstream>

namespace spindle {

namespace {
std::string formatNumber(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

std::string joinCommand(const std::filesystem::path& exe, const std::vector<std::string>& args) {
    std::string out = exe.string();
    for (const auto& arg : args) {
        out += " " + arg;
    }
    return out;
}
}

Launcher::Launcher(const Config& config) noexcept : config_(config) {
}

std::optional<std::filesystem::path> Launcher::resolveRenderer() const {
    std::error_code ec;
    if (!config_.rendererPath.empty()) {
        if (std::filesystem::is_regular_file(config_.rendererPath, ec)) {
            return config_.rendererPath;
        }
        LOG_WARN("Configured renderer not found: " + config_.rendererPath.string());
    }
    if (!config_.rendererDefault.empty() && std::filesystem::is_regular_file(config_.rendererDefault, ec)) {
        return config_.rendererDefault;
    }
    return findExecutable(config_.rendererName);
}

std::vector<std::string> Launcher::buildArguments(const RenderRequest& request) const {
    std::vector<std::string> args = {
        "-b",
        "-P", config_.scriptPath.string(),
        "--",
        "--input", request.input.string(),
        "--out", request.output.string(),
        "--seconds", formatNumber(request.seconds),
        "--fps", std::to_string(request.fps),
        "--size", std::to_string(request.size),
        "--axis", toString(request.axis),
        "--format", toString(request.format),
        "--offset", formatNumber(request.offset),
    };
    if (request.autoOrientation) {
        args.emplace_back("--auto");
    }
    args.emplace_back("--quality");
    args.emplace_back(toString(request.quality));
    if (request.watermark) {
        args.emplace_back("--watermark");
    }
    args.emplace_back("--kelvin");
    args.emplace_back(std::to_string(request.kelvin));
    if (request.autoBrightness) {
        args.emplace_back("--auto_brightness");
    } else {
        args.emplace_back("--exposure");
        args.emplace_back(formatNumber(request.exposure));
    }
    return args;
}

// The renderer imports helper modules that sit beside the scene script.
Environment Launcher::buildEnvironment() const {
    std::string paths;
    auto append = [&paths](const std::string& p) {
        if (p.empty()) return;
        if (!paths.empty()) paths += ":";
        paths += p;
    };

    if (!config_.scriptPath.empty()) {
        append(config_.scriptPath.parent_path().string());
    }
    for (const auto& helper : config_.helperPaths) {
        append(helper.string());
    }
    if (const char* existing = std::getenv("PYTHONPATH")) {
        append(existing);
    }

    if (paths.empty()) {
        return {};
    }
    return {{"PYTHONPATH", paths}};
}

LaunchResult Launcher::launch(const RenderRequest& request) const {
    auto renderer = resolveRenderer();
    if (!renderer) {
        return {false, nullptr, ErrorCode::ExecutableNotFound,
                "Renderer executable not found. Set SPINDLE_RENDERER."};
    }

    auto args = buildArguments(request);
    LOG_INFO("Launching renderer: " + joinCommand(*renderer, args));

    std::string error;
    auto process = Process::spawn(*renderer, args, buildEnvironment(), error);
    if (!process) {
        LOG_ERROR("Failed to launch renderer: " + error);
        return {false, nullptr, ErrorCode::IoError, "Failed to launch renderer: " + error};
    }
    return {true, std::move(process), ErrorCode::None, ""};
}

}
