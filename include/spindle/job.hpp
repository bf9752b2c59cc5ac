/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "spindle/config.hpp"
#include "spindle/eta.hpp"
#include "spindle/process.hpp"
#include "spindle/types.hpp"
#include "spindle/workspace.hpp"

namespace spindle {

// Consistent snapshot of a job, taken under its lock.
struct JobView {
    JobId id;
    JobState state = JobState::Running;
    std::string message;
    double progress = 0.0;
    std::optional<double> etaSeconds;
    FailureKind failure = FailureKind::None;
    Axis axis = Axis::Z;
    double offset = 0.0;
    std::vector<std::string> diagnostics;
};

// Fixed at submission.
struct JobSettings {
    std::optional<std::string> owner;
    std::string filename;
    std::string downloadName;
    VideoFormat format = VideoFormat::Mp4;
    Quality quality = Quality::Ultra;
    int renderSize = 1080;
    bool autoOrientation = true;
    int totalFrames = 1;
    bool needsInterpolation = false;
    int finalFps = 25;
    std::filesystem::path primaryArtifact;
    std::filesystem::path finalArtifact;
};

class Job final {
public:
    Job(JobId id, JobSettings settings, Workspace workspace, Axis axis, double offset,
        std::string message, const EtaParams& eta);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    [[nodiscard]] const JobId& id() const noexcept { return id_; }
    [[nodiscard]] const JobSettings& settings() const noexcept { return settings_; }
    [[nodiscard]] const std::optional<std::string>& owner() const noexcept { return settings_.owner; }

    [[nodiscard]] JobView view(Clock::time_point now = Clock::now()) const;
    [[nodiscard]] JobState state() const;
    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] Axis axis() const;
    [[nodiscard]] std::optional<Clock::time_point> endedAt() const;
    [[nodiscard]] std::optional<std::filesystem::path> storedArtifact() const;

    // Monitor-side updates. No-ops once the job is terminal.
    void setMessage(const std::string& message);
    void applyOrientation(std::optional<Axis> axis, std::optional<double> offset, const std::string& message);
    // True when the frame advanced the job; out-of-order frames are dropped.
    bool applyFrame(int frame, Clock::time_point now);

    // The live process handle exists only while the job runs.
    bool attachProcess(std::shared_ptr<Process> process);
    void detachProcess();
    [[nodiscard]] std::shared_ptr<Process> process() const;

    // Terminal transitions. Each is a compare-and-set from Running; only
    // the caller that gets true may perform terminal side effects.
    bool finish(const std::string& message, std::optional<std::filesystem::path> stored);
    bool fail(FailureKind kind, const std::string& message, std::vector<std::string> diagnostics = {});
    // On success returns the process to stop (possibly null); nullopt if the job was not running.
    std::optional<std::shared_ptr<Process>> cancel(const std::string& message);

    // Runs fn with the workspace path while holding it; false if it was released.
    bool withWorkspace(const std::function<void(const std::filesystem::path&)>& fn);
    bool releaseWorkspace();
    [[nodiscard]] bool workspaceReleased() const;

    // Single-use download bookkeeping for anonymous jobs.
    [[nodiscard]] bool consumed() const;
    bool markConsumed();

private:
    bool transitionLocked(JobState to, const std::string& message);

    const JobId id_;
    const JobSettings settings_;
    const EtaParams etaParams_;

    mutable std::mutex mutex_;
    JobState state_ = JobState::Running;
    FailureKind failure_ = FailureKind::None;
    std::string message_;
    double progress_ = 0.0;
    std::optional<double> eta_;
    Axis axis_;
    double offset_;
    FrameTimer timer_;
    std::vector<std::string> diagnostics_;
    std::shared_ptr<Process> process_;
    std::optional<Clock::time_point> endedAt_;
    std::optional<std::filesystem::path> stored_;

    mutable std::mutex workspaceMutex_;
    Workspace workspace_;
    bool consumed_ = false;
};

}
