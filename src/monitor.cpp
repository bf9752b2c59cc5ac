/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/monitor.hpp"
#include "spindle/logger.hpp"
#include <sstream>
#include <system_error>

namespace spindle {

namespace {
constexpr std::size_t kShortIdLength = 8;

std::vector<std::string> lastLines(const std::string& text, std::size_t limit) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        lines.push_back(line);
    }
    if (lines.size() > limit) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return lines;
}
}

Monitor::Monitor(std::shared_ptr<Job> job, std::shared_ptr<Process> process, MonitorContext context)
    : job_(std::move(job)), process_(std::move(process)), context_(context) {
}

Monitor::~Monitor() {
    join();
}

bool Monitor::start() {
    if (thread_.joinable()) {
        LOG_WARN("Monitor for job " + job_->id() + " already started");
        return false;
    }
    try {
        thread_ = std::thread(&Monitor::run, this);
        return true;
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start monitor for job " + job_->id() + ": " + e.what());
        return false;
    }
}

void Monitor::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

std::vector<std::string> Monitor::trailing() const {
    return {trailing_.begin(), trailing_.end()};
}

void Monitor::handleLine(const std::string& line) {
    LineEvent event = classifyLine(line);
    switch (event.kind) {
        case LineKind::Blank:
            break;

        case LineKind::AutoOrientation:
            job_->applyOrientation(event.axis, event.offset, event.text);
            LOG_INFO("Job " + job_->id() + " auto orientation: " + event.text);
            break;

        case LineKind::FrameProgress:
            if (job_->applyFrame(event.frame, Clock::now()) && owned() && context_.records) {
                JobView view = job_->view();
                (void)context_.records->updateProgress(job_->id(), view.progress, view.message);
            }
            break;

        case LineKind::StatusText:
            job_->setMessage(event.text);
            trailing_.push_back(event.text);
            while (trailing_.size() > context_.config.trailingLines) {
                trailing_.pop_front();
            }
            LOG_TRACE("[" + job_->id().substr(0, kShortIdLength) + "] " + event.text);
            break;
    }
}

void Monitor::run() {
    setThreadName("Monitor-" + job_->id().substr(0, kShortIdLength));
    LOG_DEBUG("Monitoring job " + job_->id() + " (pid " + std::to_string(process_->pid()) + ")");

    bool streamFailed = false;
    try {
        std::string line;
        while (process_->readLine(line)) {
            handleLine(line);
        }
    } catch (const std::system_error& e) {
        streamFailed = true;
        handleStreamFailure(e.what());
    }

    int exitCode = process_->wait();
    job_->detachProcess();
    LOG_DEBUG("Renderer for job " + job_->id() + " exited with code " + std::to_string(exitCode));

    if (!streamFailed) {
        settle(exitCode);
    }

    process_.reset();
    clearThreadName();
    done_.store(true);
}

void Monitor::handleStreamFailure(const std::string& what) {
    LOG_ERROR("Lost renderer output for job " + job_->id() + ": " + what);
    std::string message = "Lost contact with renderer: " + what;
    if (!job_->fail(FailureKind::StreamReadFailure, message, trailing())) {
        return;
    }
    process_->terminate(context_.config.cancelGrace);
    job_->releaseWorkspace();
    recordFailure(JobState::Error, message);
}

void Monitor::settle(int exitCode) {
    if (!job_->isRunning()) {
        LOG_DEBUG("Job " + job_->id() + " already " + toString(job_->state()) + ", skipping completion");
        return;
    }

    const JobSettings& settings = job_->settings();
    bool artifactPresent = false;
    job_->withWorkspace([&](const std::filesystem::path&) {
        std::error_code ec;
        artifactPresent = std::filesystem::is_regular_file(settings.primaryArtifact, ec);
    });

    if (exitCode != 0 || !artifactPresent) {
        finalizeFailure(exitCode, artifactPresent);
        return;
    }

    if (!convert()) {
        return;
    }
    finalizeSuccess();
}

// Brings the primary artifact to the final artifact path. False once the
// job has ended, either here or elsewhere.
bool Monitor::convert() {
    const JobSettings& settings = job_->settings();

    // Without interpolation the renderer writes the final artifact itself.
    if (!settings.needsInterpolation) {
        return true;
    }

    job_->setMessage("Converting to " + std::to_string(settings.finalFps) + " fps...");

    InterpolationResult result;
    bool held = job_->withWorkspace([&](const std::filesystem::path&) {
        InterpolationRequest request{settings.primaryArtifact, settings.finalArtifact,
                                     settings.finalFps, settings.format};
        result = context_.interpolator.convert(request, [this](const std::shared_ptr<Process>& encoder) {
            return job_->attachProcess(encoder);
        });
    });
    job_->detachProcess();

    if (!held || !job_->isRunning()) {
        return false;
    }

    if (!result) {
        std::string message = "Post-processing failed: " + result.message;
        LOG_ERROR("Job " + job_->id() + ": " + message);
        LOG_WARN("Job " + job_->id() + ": primary render succeeded, frame-rate conversion did not");
        auto diagnostics = lastLines(result.output, context_.config.trailingLines);
        for (const auto& line : diagnostics) {
            LOG_DEBUG("  encoder: " + line);
        }
        if (job_->fail(FailureKind::PostProcessFailure, message, std::move(diagnostics))) {
            job_->releaseWorkspace();
            recordFailure(JobState::Error, message);
        }
        return false;
    }

    job_->withWorkspace([&](const std::filesystem::path&) {
        std::error_code ec;
        std::filesystem::remove(settings.primaryArtifact, ec);
        if (ec) {
            LOG_WARN("Failed to remove " + settings.primaryArtifact.string() + ": " + ec.message());
        }
    });
    return true;
}

void Monitor::finalizeSuccess() {
    const JobSettings& settings = job_->settings();

    bool present = false;
    std::optional<StoredArtifact> stored;
    bool held = job_->withWorkspace([&](const std::filesystem::path&) {
        std::error_code ec;
        present = std::filesystem::is_regular_file(settings.finalArtifact, ec);
        if (present && owned()) {
            stored = context_.artifacts.store(job_->id(), settings.finalArtifact);
        }
    });
    if (!held) {
        return;
    }
    if (!present) {
        finalizeFailure(0, false);
        return;
    }

    std::string message = std::string("Render complete (axis ") + toString(job_->axis()) + ").";
    std::optional<std::filesystem::path> storedPath;
    if (stored) {
        storedPath = stored->path;
    }
    if (!job_->finish(message, storedPath)) {
        if (stored) {
            context_.artifacts.discard(stored->path);
        }
        return;
    }
    LOG_INFO("Job " + job_->id() + " finished");

    if (!owned()) {
        return;
    }
    if (stored) {
        job_->releaseWorkspace();
    } else {
        LOG_WARN("Job " + job_->id() + " has no durable copy, keeping workspace for download");
    }
    if (context_.records) {
        (void)context_.records->complete(job_->id(), stored ? stored->path : std::filesystem::path(),
                                         stored ? stored->size : 0, message);
    }
}

void Monitor::finalizeFailure(int exitCode, bool artifactPresent) {
    std::string detail = trailing_.empty() ? "No additional output from renderer."
                                           : "Last line: " + trailing_.back();
    std::string message = "Renderer failed (code " + std::to_string(exitCode) +
                          (artifactPresent ? "). " : ", no output). ") + detail;

    auto diagnostics = trailing();
    if (!job_->fail(FailureKind::RenderFailure, message, diagnostics)) {
        return;
    }
    LOG_ERROR("Job " + job_->id() + ": " + message);
    for (const auto& line : diagnostics) {
        LOG_DEBUG("  renderer: " + line);
    }
    job_->releaseWorkspace();
    recordFailure(JobState::Error, message);
}

void Monitor::recordFailure(JobState state, const std::string& message) {
    if (owned() && context_.records) {
        (void)context_.records->fail(job_->id(), state, message);
    }
}

}
