/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "spindle/config.hpp"
#include "spindle/job.hpp"
#include "spindle/launcher.hpp"
#include "spindle/monitor.hpp"
#include "spindle/postprocess.hpp"
#include "spindle/records.hpp"
#include "spindle/registry.hpp"
#include "spindle/storage.hpp"
#include "spindle/types.hpp"

namespace spindle {

// Caller-supplied render options. Out-of-range values are normalized
// to defaults or clamped rather than rejected.
struct RenderOptions {
    std::string axis;             // X|Y|Z, empty for the configured default
    double offset = 0.0;          // degrees, [0, 360]
    bool autoOrientation = true;
    std::string quality;          // fast|standard|ultra
    std::string format;           // mp4|webm
    int resolution = 0;           // 720, 1080, 1440 or 2160
    int kelvin = 5600;
    bool autoBrightness = true;
    double exposure = 0.0;        // [-2, 2], ignored with autoBrightness
    bool watermark = false;
    std::optional<std::string> owner;
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct QueryResult {
    bool ok = false;
    JobView view;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct OpResult {
    bool ok = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct FetchResult {
    bool ok = false;
    std::unique_ptr<std::istream> stream;
    std::string downloadName;
    std::string mimetype;
    std::uintmax_t size = 0;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] RenderRequest normalizeOptions(const RenderOptions& options, const Config& config);
[[nodiscard]] std::string sanitizeFilename(const std::string& name);
// Empty string when the model is acceptable, otherwise the reason.
[[nodiscard]] std::string validateModel(const std::filesystem::path& model, std::uintmax_t maxBytes);

class Orchestrator final {
public:
    explicit Orchestrator(Config config,
                          std::unique_ptr<Interpolator> interpolator = nullptr,
                          std::shared_ptr<RecordStore> records = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    [[nodiscard]] SubmitResult submit(const std::filesystem::path& model, const RenderOptions& options);
    [[nodiscard]] QueryResult query(const JobId& id) const;
    OpResult cancel(const JobId& id);
    [[nodiscard]] FetchResult fetchArtifact(const JobId& id);

    // Drops a terminal job from the registry.
    OpResult remove(const JobId& id);
    // Drops terminal jobs that ended at least maxAge ago. Returns how many.
    // submit() runs this with Config::jobRetention unless that is zero.
    std::size_t reap(std::chrono::seconds maxAge);

    // Cancels running jobs and joins every monitor. Idempotent.
    void shutdown() noexcept;

    [[nodiscard]] std::size_t runningCount(const std::string& owner) const;
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    bool stopJob(const std::shared_ptr<Job>& job, const std::string& message);
    void pruneMonitors(bool all);
    void releaseSlotLocked(const std::string& owner);
    [[nodiscard]] FetchResult fetchFromRecord(const JobId& id) const;

    Config config_;
    Launcher launcher_;
    ArtifactStore artifacts_;
    std::unique_ptr<Interpolator> interpolator_;
    std::shared_ptr<RecordStore> records_;
    Registry registry_;

    std::mutex admissionMutex_;
    // Owned submissions past the capacity check but not yet registered.
    std::unordered_map<std::string, std::size_t> pending_;
    std::mutex monitorsMutex_;
    std::unordered_map<JobId, std::unique_ptr<Monitor>> monitors_;
    std::atomic<bool> shutdown_{false};
};

}
