/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/types.hpp"
#include <algorithm>
#include <cctype>

namespace spindle {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Running: return "running";
        case JobState::Finished: return "finished";
        case JobState::Error: return "error";
        case JobState::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

const char* toString(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::RenderFailure: return "render-failure";
        case FailureKind::PostProcessFailure: return "post-process-failure";
        case FailureKind::StreamReadFailure: return "stream-read-failure";
        default: return "unknown";
    }
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::BadInput: return "BadInput";
        case ErrorCode::ExecutableNotFound: return "ExecutableNotFound";
        case ErrorCode::CapacityExceeded: return "CapacityExceeded";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::NotReady: return "NotReady";
        case ErrorCode::AlreadyConsumed: return "AlreadyConsumed";
        case ErrorCode::IoError: return "IoError";
        default: return "Unknown";
    }
}

const char* toString(Axis axis) noexcept {
    switch (axis) {
        case Axis::X: return "X";
        case Axis::Y: return "Y";
        default: return "Z";
    }
}

const char* toString(Quality quality) noexcept {
    switch (quality) {
        case Quality::Fast: return "fast";
        case Quality::Standard: return "standard";
        default: return "ultra";
    }
}

const char* toString(VideoFormat format) noexcept {
    return format == VideoFormat::Webm ? "webm" : "mp4";
}

std::optional<JobState> parseJobState(const std::string& value) noexcept {
    try {
        std::string v = toLowerCopy(value);
        if (v == "running") return JobState::Running;
        if (v == "finished") return JobState::Finished;
        if (v == "error") return JobState::Error;
        if (v == "cancelled") return JobState::Cancelled;
    } catch (const std::exception&) {
    }
    return std::nullopt;
}

std::optional<Axis> parseAxis(const std::string& value) noexcept {
    try {
        std::string v = toLowerCopy(value);
        if (v == "x") return Axis::X;
        if (v == "y") return Axis::Y;
        if (v == "z") return Axis::Z;
    } catch (const std::exception&) {
    }
    return std::nullopt;
}

std::optional<Quality> parseQuality(const std::string& value) noexcept {
    try {
        std::string v = toLowerCopy(value);
        if (v == "fast") return Quality::Fast;
        if (v == "standard") return Quality::Standard;
        if (v == "ultra") return Quality::Ultra;
    } catch (const std::exception&) {
    }
    return std::nullopt;
}

std::optional<VideoFormat> parseFormat(const std::string& value) noexcept {
    try {
        std::string v = toLowerCopy(value);
        if (v == "mp4") return VideoFormat::Mp4;
        if (v == "webm") return VideoFormat::Webm;
    } catch (const std::exception&) {
    }
    return std::nullopt;
}

const char* extensionFor(VideoFormat format) noexcept {
    return format == VideoFormat::Webm ? ".webm" : ".mp4";
}

const char* mimetypeFor(VideoFormat format) noexcept {
    return format == VideoFormat::Webm ? "video/webm" : "video/mp4";
}

}
