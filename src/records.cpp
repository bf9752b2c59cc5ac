/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/records.hpp"
#include "spindle/logger.hpp"
#include <algorithm>
#include <fstream>
#include <limits>
#include <map>

namespace spindle {

namespace {

// Values are stored one per line
std::string sanitize(std::string value) {
    std::replace(value.begin(), value.end(), '\n', ' ');
    std::replace(value.begin(), value.end(), '\r', ' ');
    return value;
}

long long toEpoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpoch(long long seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace

FileRecordStore::FileRecordStore(std::filesystem::path root)
    : dir_(std::move(root) / "records") {
}

std::filesystem::path FileRecordStore::recordPath(const JobId& id) const {
    return dir_ / (id + ".rec");
}

bool FileRecordStore::writeLocked(const RenderRecord& r) const {
    try {
        std::filesystem::create_directories(dir_);

        auto path = recordPath(r.jobId);
        auto tmp = path;
        tmp += ".tmp";

        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                LOG_ERROR("Failed to open record file " + tmp.string());
                return false;
            }
            out.precision(std::numeric_limits<double>::max_digits10);
            out << "job_id=" << r.jobId << '\n'
                << "owner=" << sanitize(r.owner) << '\n'
                << "filename=" << sanitize(r.filename) << '\n'
                << "download_name=" << sanitize(r.downloadName) << '\n'
                << "mimetype=" << r.mimetype << '\n'
                << "file_path=" << sanitize(r.filePath.string()) << '\n'
                << "file_size=" << r.fileSize << '\n'
                << "quality=" << toString(r.quality) << '\n'
                << "format=" << toString(r.format) << '\n'
                << "render_size=" << r.renderSize << '\n'
                << "axis=" << toString(r.axis) << '\n'
                << "offset=" << r.offset << '\n'
                << "auto_orientation=" << (r.autoOrientation ? 1 : 0) << '\n'
                << "state=" << toString(r.state) << '\n'
                << "progress=" << r.progress << '\n'
                << "message=" << sanitize(r.message) << '\n'
                << "started_at=" << toEpoch(r.startedAt) << '\n';
            if (r.finishedAt) {
                out << "finished_at=" << toEpoch(*r.finishedAt) << '\n';
            }
            out.flush();
            if (!out) {
                LOG_ERROR("Failed to write record file " + tmp.string());
                return false;
            }
        }

        std::filesystem::rename(tmp, path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Record write failed for job " + r.jobId + ": " + e.what());
        return false;
    }
}

std::optional<RenderRecord> FileRecordStore::readLocked(const JobId& id) const {
    std::ifstream in(recordPath(id));
    if (!in) {
        return std::nullopt;
    }

    std::map<std::string, std::string> fields;
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        fields[line.substr(0, eq)] = line.substr(eq + 1);
    }

    auto get = [&fields](const char* key) -> std::string {
        auto it = fields.find(key);
        return it == fields.end() ? std::string() : it->second;
    };

    try {
        RenderRecord r;
        r.jobId = get("job_id");
        if (r.jobId != id) {
            LOG_WARN("Record file for " + id + " names job " + r.jobId);
            return std::nullopt;
        }
        r.owner = get("owner");
        r.filename = get("filename");
        r.downloadName = get("download_name");
        r.mimetype = get("mimetype");
        r.filePath = get("file_path");
        r.fileSize = std::stoull(get("file_size"));
        r.quality = parseQuality(get("quality")).value_or(Quality::Ultra);
        r.format = parseFormat(get("format")).value_or(VideoFormat::Mp4);
        r.renderSize = std::stoi(get("render_size"));
        r.axis = parseAxis(get("axis")).value_or(Axis::Z);
        r.offset = std::stod(get("offset"));
        r.autoOrientation = get("auto_orientation") == "1";
        r.state = parseJobState(get("state")).value_or(JobState::Error);
        r.progress = std::stod(get("progress"));
        r.message = get("message");
        r.startedAt = fromEpoch(std::stoll(get("started_at")));
        if (fields.count("finished_at")) {
            r.finishedAt = fromEpoch(std::stoll(get("finished_at")));
        }
        return r;
    } catch (const std::exception& e) {
        LOG_WARN("Corrupt record for job " + id + ": " + e.what());
        return std::nullopt;
    }
}

bool FileRecordStore::create(const RenderRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    return writeLocked(record);
}

bool FileRecordStore::updateProgress(const JobId& id, double progress, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = readLocked(id);
    if (!record) {
        LOG_WARN("No record to update for job " + id);
        return false;
    }
    if (isTerminal(record->state)) {
        return false;
    }
    record->progress = progress;
    record->message = message;
    return writeLocked(*record);
}

bool FileRecordStore::complete(const JobId& id, const std::filesystem::path& filePath,
                               std::uintmax_t fileSize, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = readLocked(id);
    if (!record) {
        LOG_WARN("No record to complete for job " + id);
        return false;
    }
    record->state = JobState::Finished;
    record->progress = 100.0;
    record->message = message;
    record->filePath = filePath;
    record->fileSize = fileSize;
    record->finishedAt = std::chrono::system_clock::now();
    return writeLocked(*record);
}

bool FileRecordStore::fail(const JobId& id, JobState state, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = readLocked(id);
    if (!record) {
        LOG_WARN("No record to fail for job " + id);
        return false;
    }
    record->state = state;
    record->message = message;
    record->finishedAt = std::chrono::system_clock::now();
    return writeLocked(*record);
}

std::optional<RenderRecord> FileRecordStore::find(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return readLocked(id);
}

}
