/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "spindle/process.hpp"
#include "spindle/types.hpp"

namespace spindle {

struct InterpolationRequest {
    std::filesystem::path input;
    std::filesystem::path output;
    int fps = 25;
    VideoFormat format = VideoFormat::Mp4;
};

struct InterpolationResult {
    bool ok = false;
    int exitCode = kExitUnknown;
    std::string output;   // encoder diagnostics (tail)
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Called with the encoder process once it is running. Returning false
// means the job is no longer interested and the encoder is stopped.
using ProcessObserver = std::function<bool(const std::shared_ptr<Process>&)>;

// Frame-rate conversion step run after a successful render.
class Interpolator {
public:
    virtual ~Interpolator() = default;

    // Leaves the input in place; the caller removes it on success.
    [[nodiscard]] virtual InterpolationResult convert(const InterpolationRequest& request,
                                                      const ProcessObserver& observer) = 0;
};

class FfmpegInterpolator final : public Interpolator {
public:
    explicit FfmpegInterpolator(std::string binary = "ffmpeg");

    [[nodiscard]] static std::vector<std::string> buildArguments(const InterpolationRequest& request);

    [[nodiscard]] InterpolationResult convert(const InterpolationRequest& request,
                                              const ProcessObserver& observer) override;

private:
    std::string binary_;
};

}
