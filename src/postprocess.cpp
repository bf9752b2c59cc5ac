/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/postprocess.hpp"
#include "spindle/logger.hpp"
#include <system_error>

namespace spindle {

namespace {
constexpr std::size_t kDiagnosticBytes = 4096;
}

FfmpegInterpolator::FfmpegInterpolator(std::string binary)
    : binary_(std::move(binary)) {
}

std::vector<std::string> FfmpegInterpolator::buildArguments(const InterpolationRequest& request) {
    std::vector<std::string> args = {
        "-y",
        "-i", request.input.string(),
        "-vf", "minterpolate=fps=" + std::to_string(request.fps) +
               ":mi_mode=mci:mc_mode=aobmc:me_mode=bidir:vsbmc=1",
        "-an",
    };

    if (request.format == VideoFormat::Webm) {
        // Keep the alpha channel
        args.insert(args.end(), {"-c:v", "libvpx-vp9", "-pix_fmt", "yuva420p", "-b:v", "0", "-crf", "12"});
    } else {
        args.insert(args.end(), {"-c:v", "libx264", "-preset", "medium", "-crf", "18", "-pix_fmt", "yuv420p"});
    }

    args.push_back(request.output.string());
    return args;
}

InterpolationResult FfmpegInterpolator::convert(const InterpolationRequest& request,
                                                const ProcessObserver& observer) {
    InterpolationResult result;

    if (request.fps <= 0) {
        std::error_code ec;
        std::filesystem::rename(request.input, request.output, ec);
        if (ec) {
            result.message = "Failed to move " + request.input.string() + ": " + ec.message();
            return result;
        }
        result.ok = true;
        result.exitCode = 0;
        return result;
    }

    auto exe = findExecutable(binary_);
    if (!exe) {
        result.message = "Encoder not found: " + binary_;
        return result;
    }

    std::string error;
    std::shared_ptr<Process> process = Process::spawn(*exe, buildArguments(request), {}, error);
    if (!process) {
        result.message = "Failed to start encoder: " + error;
        return result;
    }
    LOG_DEBUG("Encoder started (pid " + std::to_string(process->pid()) + ") for " + request.input.string());

    if (observer && !observer(process)) {
        process->terminate(std::chrono::milliseconds(0));
        result.exitCode = process->wait();
        result.message = "Encoder stopped";
        return result;
    }

    try {
        result.output = process->readAll(kDiagnosticBytes);
    } catch (const std::system_error& e) {
        LOG_WARN(std::string("Failed reading encoder output: ") + e.what());
    }
    result.exitCode = process->wait();

    std::error_code ec;
    if (result.exitCode != 0) {
        result.message = "encoder exited with code " + std::to_string(result.exitCode);
    } else if (!std::filesystem::exists(request.output, ec)) {
        result.message = "encoder produced no output";
    } else {
        result.ok = true;
    }
    return result;
}

}
