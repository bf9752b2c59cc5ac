/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "spindle/types.hpp"

namespace spindle {

// Durable record of an owned render; the system of record once the
// in-memory job is gone.
struct RenderRecord {
    JobId jobId;
    std::string owner;
    std::string filename;
    std::string downloadName;
    std::string mimetype;
    std::filesystem::path filePath;
    std::uintmax_t fileSize = 0;
    Quality quality = Quality::Ultra;
    VideoFormat format = VideoFormat::Mp4;
    int renderSize = 1080;
    Axis axis = Axis::Z;
    double offset = 0.0;
    bool autoOrientation = false;
    JobState state = JobState::Running;
    double progress = 0.0;
    std::string message;
    std::chrono::system_clock::time_point startedAt{};
    std::optional<std::chrono::system_clock::time_point> finishedAt;
};

class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual bool create(const RenderRecord& record) = 0;
    virtual bool updateProgress(const JobId& id, double progress, const std::string& message) = 0;
    virtual bool complete(const JobId& id, const std::filesystem::path& filePath,
                          std::uintmax_t fileSize, const std::string& message) = 0;
    virtual bool fail(const JobId& id, JobState state, const std::string& message) = 0;
    [[nodiscard]] virtual std::optional<RenderRecord> find(const JobId& id) const = 0;
};

// One key=value file per record under <root>/records/.
class FileRecordStore final : public RecordStore {
public:
    explicit FileRecordStore(std::filesystem::path root);

    bool create(const RenderRecord& record) override;
    bool updateProgress(const JobId& id, double progress, const std::string& message) override;
    bool complete(const JobId& id, const std::filesystem::path& filePath,
                  std::uintmax_t fileSize, const std::string& message) override;
    bool fail(const JobId& id, JobState state, const std::string& message) override;
    [[nodiscard]] std::optional<RenderRecord> find(const JobId& id) const override;

private:
    std::filesystem::path dir_;
    mutable std::mutex mutex_;

    [[nodiscard]] std::filesystem::path recordPath(const JobId& id) const;
    [[nodiscard]] std::optional<RenderRecord> readLocked(const JobId& id) const;
    [[nodiscard]] bool writeLocked(const RenderRecord& record) const;
};

}
