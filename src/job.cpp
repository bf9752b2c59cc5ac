/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/job.hpp"
#include "spindle/logger.hpp"
#include <algorithm>

namespace spindle {

Job::Job(JobId id, JobSettings settings, Workspace workspace, Axis axis, double offset,
         std::string message, const EtaParams& eta)
    : id_(std::move(id)),
      settings_(std::move(settings)),
      etaParams_(eta),
      message_(std::move(message)),
      axis_(axis),
      offset_(offset),
      timer_(eta),
      workspace_(std::move(workspace)) {
}

JobView Job::view(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    JobView v;
    v.id = id_;
    v.state = state_;
    v.message = message_;
    v.progress = progress_;
    v.etaSeconds = eta_;
    v.failure = failure_;
    v.axis = axis_;
    v.offset = offset_;
    v.diagnostics = diagnostics_;

    if (state_ == JobState::Running) {
        auto average = timer_.average();
        auto lastTs = timer_.lastTimestamp();
        if (average && lastTs && eta_) {
            double current = std::chrono::duration<double>(now - *lastTs).count();
            v.etaSeconds = refineRemaining(*eta_, *average, current, etaParams_);
        }
    }
    return v;
}

JobState Job::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Job::isRunning() const {
    return state() == JobState::Running;
}

Axis Job::axis() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return axis_;
}

std::optional<Clock::time_point> Job::endedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endedAt_;
}

std::optional<std::filesystem::path> Job::storedArtifact() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_;
}

void Job::setMessage(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == JobState::Running) {
        message_ = message;
    }
}

void Job::applyOrientation(std::optional<Axis> axis, std::optional<double> offset, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != JobState::Running) {
        return;
    }
    message_ = message;
    if (axis) {
        axis_ = *axis;
    }
    if (offset) {
        offset_ = *offset;
    }
}

bool Job::applyFrame(int frame, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != JobState::Running) {
        return false;
    }
    if (!timer_.observe(frame, now)) {
        return false;
    }

    const int total = settings_.totalFrames;
    double pct = std::min(100.0, std::max(0.0, 100.0 * static_cast<double>(frame) / total));
    progress_ = std::max(progress_, pct);
    message_ = "Rendering frame " + std::to_string(frame) + " of " + std::to_string(total) +
               " (axis " + toString(axis_) + ")";
    eta_ = timer_.estimate(total, now);
    return true;
}

bool Job::attachProcess(std::shared_ptr<Process> process) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != JobState::Running) {
        return false;
    }
    process_ = std::move(process);
    return true;
}

void Job::detachProcess() {
    std::lock_guard<std::mutex> lock(mutex_);
    process_.reset();
}

std::shared_ptr<Process> Job::process() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_;
}

bool Job::transitionLocked(JobState to, const std::string& message) {
    if (state_ != JobState::Running) {
        LOG_DEBUG("Job " + id_ + " already " + toString(state_) + ", ignoring transition to " + toString(to));
        return false;
    }
    state_ = to;
    message_ = message;
    endedAt_ = Clock::now();
    return true;
}

bool Job::finish(const std::string& message, std::optional<std::filesystem::path> stored) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transitionLocked(JobState::Finished, message)) {
        return false;
    }
    progress_ = 100.0;
    eta_ = 0.0;
    stored_ = std::move(stored);
    process_.reset();
    return true;
}

bool Job::fail(FailureKind kind, const std::string& message, std::vector<std::string> diagnostics) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transitionLocked(JobState::Error, message)) {
        return false;
    }
    failure_ = kind;
    eta_.reset();
    diagnostics_ = std::move(diagnostics);
    return true;
}

std::optional<std::shared_ptr<Process>> Job::cancel(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transitionLocked(JobState::Cancelled, message)) {
        return std::nullopt;
    }
    eta_.reset();
    std::shared_ptr<Process> process;
    process.swap(process_);
    return process;
}

bool Job::withWorkspace(const std::function<void(const std::filesystem::path&)>& fn) {
    std::lock_guard<std::mutex> lock(workspaceMutex_);
    if (workspace_.released()) {
        return false;
    }
    fn(workspace_.path());
    return true;
}

bool Job::releaseWorkspace() {
    std::lock_guard<std::mutex> lock(workspaceMutex_);
    return workspace_.release();
}

bool Job::workspaceReleased() const {
    std::lock_guard<std::mutex> lock(workspaceMutex_);
    return workspace_.released();
}

bool Job::consumed() const {
    std::lock_guard<std::mutex> lock(workspaceMutex_);
    return consumed_;
}

bool Job::markConsumed() {
    std::lock_guard<std::mutex> lock(workspaceMutex_);
    if (consumed_) {
        return false;
    }
    consumed_ = true;
    return true;
}

}
