/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "spindle/config.hpp"
#include "spindle/job.hpp"
#include "spindle/postprocess.hpp"
#include "spindle/process.hpp"
#include "spindle/protocol.hpp"
#include "spindle/records.hpp"
#include "spindle/storage.hpp"

namespace spindle {

// Collaborators shared by every monitor. All outlive the monitors.
struct MonitorContext {
    const Config& config;
    Interpolator& interpolator;
    ArtifactStore& artifacts;
    RecordStore* records = nullptr;
};

// One thread per job: reads the renderer's merged output, keeps the job
// current, and drives it to a terminal state when the stream closes.
class Monitor final {
public:
    Monitor(std::shared_ptr<Job> job, std::shared_ptr<Process> process, MonitorContext context);
    ~Monitor();

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;
    Monitor(Monitor&&) = delete;
    Monitor& operator=(Monitor&&) = delete;

    bool start();
    void join();
    [[nodiscard]] bool done() const noexcept { return done_.load(); }

    // Exposed for tests; run() feeds every line through here.
    void handleLine(const std::string& line);
    [[nodiscard]] std::vector<std::string> trailing() const;
    // Where run() goes when reading the renderer's output throws.
    void handleStreamFailure(const std::string& what);

private:
    void run();
    void settle(int exitCode);
    [[nodiscard]] bool convert();
    void finalizeSuccess();
    void finalizeFailure(int exitCode, bool artifactPresent);

    [[nodiscard]] bool owned() const noexcept { return job_->owner().has_value(); }
    void recordFailure(JobState state, const std::string& message);

    std::shared_ptr<Job> job_;
    std::shared_ptr<Process> process_;
    MonitorContext context_;

    std::deque<std::string> trailing_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

}
