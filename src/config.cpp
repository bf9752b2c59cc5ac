/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/config.hpp"
#include "spindle/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace spindle {

namespace {
const char* env_str(const char* name) {
    const char* val = std::getenv(name);
    return (val && *val) ? val : nullptr;
}

std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = env_str(name);
    if (!val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

int env_int(const char* name, int defv) {
    const char* val = env_str(name);
    if (!val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

double env_double(const char* name, double defv) {
    const char* val = env_str(name);
    if (!val) {
        return defv;
    }
    try {
        double parsed = std::stod(val);
        return (std::isfinite(parsed) && parsed > 0.0) ? parsed : defv;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}
}

Config Config::fromEnv() {
    Config config;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);

    if (const char* v = env_str("SPINDLE_RENDERER")) config.rendererPath = v;
    if (const char* v = env_str("SPINDLE_RENDERER_DEFAULT")) config.rendererDefault = v;
    if (const char* v = env_str("SPINDLE_RENDERER_NAME")) config.rendererName = v;
    config.scriptPath = env_str("SPINDLE_SCRIPT") ? std::filesystem::path(env_str("SPINDLE_SCRIPT"))
                                                  : cwd / "turntable.py";
    if (const char* v = env_str("SPINDLE_FFMPEG")) config.ffmpegBin = v;

    config.seconds = env_double("SPINDLE_SECONDS", config.seconds);
    config.baseFps = env_int("SPINDLE_RENDER_FPS", config.baseFps);
    if (config.baseFps < 1) {
        config.baseFps = 11;
    }
    config.finalFps = env_int("SPINDLE_FPS", config.finalFps);
    config.renderSize = env_int("SPINDLE_SIZE", config.renderSize);

    if (const char* v = env_str("SPINDLE_AXIS")) {
        config.axis = parseAxis(v).value_or(Axis::Z);
    }
    if (const char* v = env_str("SPINDLE_FORMAT")) {
        config.format = parseFormat(v).value_or(VideoFormat::Mp4);
    }
    if (const char* v = env_str("SPINDLE_QUALITY")) {
        config.quality = parseQuality(v).value_or(Quality::Ultra);
    }

    config.storageRoot = env_str("SPINDLE_STORAGE") ? std::filesystem::path(env_str("SPINDLE_STORAGE"))
                                                    : cwd / "storage";
    if (const char* v = env_str("SPINDLE_SCRATCH")) {
        config.scratchRoot = v;
    } else {
        config.scratchRoot = std::filesystem::temp_directory_path(ec);
    }

    config.maxConcurrentPerOwner = static_cast<int>(
        env_size("SPINDLE_MAX_CONCURRENT", static_cast<std::size_t>(config.maxConcurrentPerOwner)));
    config.maxUploadBytes = env_size("SPINDLE_MAX_UPLOAD", config.maxUploadBytes);
    config.cancelGrace = std::chrono::milliseconds(
        env_size("SPINDLE_CANCEL_GRACE_MS", static_cast<std::size_t>(config.cancelGrace.count())));
    config.jobRetention = std::chrono::seconds(
        env_size("SPINDLE_JOB_RETENTION", static_cast<std::size_t>(config.jobRetention.count())));

    return config;
}

int Config::totalFrames() const noexcept {
    return std::max(1, static_cast<int>(std::lround(seconds * baseFps)));
}

}
