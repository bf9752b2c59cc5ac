/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/orchestrator.hpp"
#include "spindle/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>

namespace spindle {

namespace {
constexpr const char* kCancelMessage = "Render cancelled by user.";
constexpr const char* kShutdownMessage = "Render cancelled: service shutting down.";

double clampFinite(double value, double lo, double hi, double fallback) {
    if (!std::isfinite(value)) {
        return fallback;
    }
    return std::min(hi, std::max(lo, value));
}

std::string qualityLabel(Quality quality) {
    std::string label = toString(quality);
    label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    return label;
}

std::string launchMessage(const RenderRequest& request) {
    if (request.autoOrientation) {
        return "Launching renderer (" + qualityLabel(request.quality) + ", auto orientation)…";
    }
    char offset[32];
    std::snprintf(offset, sizeof(offset), "%.1f", request.offset);
    return "Launching renderer (" + qualityLabel(request.quality) + ", axis " + toString(request.axis) +
           ", start " + offset + "°)…";
}

bool isSupportedSize(int size) {
    return size == 720 || size == 1080 || size == 1440 || size == 2160;
}
}

RenderRequest normalizeOptions(const RenderOptions& options, const Config& config) {
    RenderRequest request;
    request.seconds = config.seconds;
    request.fps = config.baseFps;
    request.axis = parseAxis(options.axis).value_or(config.axis);
    request.offset = clampFinite(options.offset, 0.0, 360.0, 0.0);
    request.autoOrientation = options.autoOrientation;
    request.quality = parseQuality(options.quality).value_or(config.quality);
    request.format = parseFormat(options.format).value_or(config.format);
    request.size = isSupportedSize(options.resolution) ? options.resolution : config.renderSize;
    request.kelvin = std::min(10000, std::max(2000, options.kelvin));
    request.autoBrightness = options.autoBrightness;
    request.exposure = options.autoBrightness ? 0.0 : clampFinite(options.exposure, -2.0, 2.0, 0.0);
    request.watermark = options.watermark;
    return request;
}

std::string sanitizeFilename(const std::string& name) {
    std::string base = std::filesystem::path(name).filename().string();
    std::string out;
    out.reserve(base.size());
    for (char c : base) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '.' || c == '-' || c == '_') {
            out += c;
        } else if (std::isspace(u)) {
            out += '_';
        }
    }
    out.erase(0, out.find_first_not_of("._"));
    return out.empty() ? "model.stl" : out;
}

std::string validateModel(const std::filesystem::path& model, std::uintmax_t maxBytes) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(model, ec)) {
        return "Please choose an STL file to upload.";
    }

    std::string ext = model.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext != ".stl") {
        return "Only .stl files are supported.";
    }

    auto size = std::filesystem::file_size(model, ec);
    if (ec) {
        return "Cannot read model file: " + ec.message();
    }
    if (size == 0) {
        return "Model file is empty.";
    }
    if (size > maxBytes) {
        char buf[128];
        std::snprintf(buf, sizeof(buf), "STL file too large (%.1fMB). Maximum size is %.0fMB.",
                      static_cast<double>(size) / (1024.0 * 1024.0),
                      static_cast<double>(maxBytes) / (1024.0 * 1024.0));
        return buf;
    }
    return "";
}

Orchestrator::Orchestrator(Config config, std::unique_ptr<Interpolator> interpolator,
                           std::shared_ptr<RecordStore> records)
    : config_(std::move(config)),
      launcher_(config_),
      artifacts_(config_.storageRoot),
      interpolator_(std::move(interpolator)),
      records_(std::move(records)) {
    if (config_.scratchRoot.empty()) {
        std::error_code ec;
        config_.scratchRoot = std::filesystem::temp_directory_path(ec);
    }
    if (!interpolator_) {
        interpolator_ = std::make_unique<FfmpegInterpolator>(config_.ffmpegBin);
    }
    if (!records_ && !config_.storageRoot.empty()) {
        records_ = std::make_shared<FileRecordStore>(config_.storageRoot);
    }
    if (!config_.storageRoot.empty() && !artifacts_.prepare()) {
        LOG_WARN("Persistent storage unavailable, owned renders will be served from their workspace");
    }

    LOG_DEBUG("Orchestrator created - scratch: " + config_.scratchRoot.string() +
              ", storage: " + config_.storageRoot.string() +
              ", fps: " + std::to_string(config_.baseFps) + "->" + std::to_string(config_.finalFps) +
              ", max concurrent: " + std::to_string(config_.maxConcurrentPerOwner));
}

Orchestrator::~Orchestrator() {
    shutdown();
}

SubmitResult Orchestrator::submit(const std::filesystem::path& model, const RenderOptions& options) {
    if (shutdown_.load()) {
        return {false, "", ErrorCode::InvalidState, "Orchestrator is shutting down."};
    }

    std::string invalid = validateModel(model, config_.maxUploadBytes);
    if (!invalid.empty()) {
        LOG_WARN("Rejected submission " + model.string() + ": " + invalid);
        return {false, "", ErrorCode::BadInput, invalid};
    }

    RenderRequest request = normalizeOptions(options, config_);
    const std::string filename = sanitizeFilename(model.filename().string());
    const std::string ext = extensionFor(request.format);

    if (config_.jobRetention.count() > 0) {
        reap(config_.jobRetention);
    } else {
        pruneMonitors(false);
    }

    // An owned submission holds a slot from the capacity check until its job
    // is registered, or until it fails.
    struct Slot {
        Orchestrator* self;
        std::optional<std::string> owner;
        ~Slot() {
            if (owner) {
                std::lock_guard<std::mutex> lock(self->admissionMutex_);
                self->releaseSlotLocked(*owner);
            }
        }
    } slot{this, std::nullopt};

    if (options.owner) {
        std::lock_guard<std::mutex> admission(admissionMutex_);
        auto pending = pending_.find(*options.owner);
        auto running = registry_.countRunning(*options.owner) + (pending == pending_.end() ? 0 : pending->second);
        if (running >= static_cast<std::size_t>(config_.maxConcurrentPerOwner)) {
            LOG_INFO("Owner " + *options.owner + " at capacity (" + std::to_string(running) + " running)");
            return {false, "", ErrorCode::CapacityExceeded,
                    "Maximum " + std::to_string(config_.maxConcurrentPerOwner) +
                    " concurrent renders allowed. Please wait for current renders to complete."};
        }
        ++pending_[*options.owner];
        slot.owner = options.owner;
    }

    if (!launcher_.resolveRenderer()) {
        return {false, "", ErrorCode::ExecutableNotFound, "Renderer executable not found. Set SPINDLE_RENDERER."};
    }

    std::string error;
    auto workspace = Workspace::create(config_.scratchRoot, error);
    if (!workspace) {
        LOG_ERROR(error);
        return {false, "", ErrorCode::IoError, error};
    }

    JobSettings settings;
    settings.owner = options.owner;
    settings.filename = filename;
    settings.downloadName = std::filesystem::path(filename).stem().string() + "_turntable" + ext;
    settings.format = request.format;
    settings.quality = request.quality;
    settings.renderSize = request.size;
    settings.autoOrientation = request.autoOrientation;
    settings.totalFrames = config_.totalFrames();
    settings.needsInterpolation = config_.needsInterpolation();
    settings.finalFps = config_.finalFps;
    settings.finalArtifact = workspace->path() / ("turntable" + ext);
    settings.primaryArtifact = settings.needsInterpolation ? workspace->path() / ("turntable_base" + ext)
                                                           : settings.finalArtifact;

    request.input = workspace->path() / filename;
    request.output = settings.primaryArtifact;

    std::error_code ec;
    std::filesystem::copy_file(model, request.input, ec);
    if (ec) {
        std::string message = "Failed to stage model: " + ec.message();
        LOG_ERROR(message);
        workspace->release();
        return {false, "", ErrorCode::IoError, message};
    }

    LaunchResult launched = launcher_.launch(request);
    if (!launched) {
        workspace->release();
        return {false, "", launched.error, launched.message};
    }
    std::shared_ptr<Process> process = std::move(launched.process);

    const JobId id = registry_.generateId();
    const std::string message = launchMessage(request);
    auto job = std::make_shared<Job>(id, settings, std::move(*workspace), request.axis, request.offset,
                                     message, config_.eta);
    job->attachProcess(process);

    if (options.owner && records_) {
        RenderRecord record;
        record.jobId = id;
        record.owner = *options.owner;
        record.filename = filename;
        record.downloadName = settings.downloadName;
        record.mimetype = mimetypeFor(settings.format);
        record.filePath = settings.finalArtifact;
        record.quality = settings.quality;
        record.format = settings.format;
        record.renderSize = settings.renderSize;
        record.axis = request.axis;
        record.offset = request.offset;
        record.autoOrientation = request.autoOrientation;
        record.state = JobState::Running;
        record.message = message;
        record.startedAt = std::chrono::system_clock::now();
        if (!records_->create(record)) {
            LOG_WARN("Failed to create record for job " + id);
        }
    }

    {
        std::lock_guard<std::mutex> admission(admissionMutex_);
        registry_.insert(job);
        if (slot.owner) {
            releaseSlotLocked(*slot.owner);
            slot.owner.reset();
        }
    }

    auto monitor = std::make_unique<Monitor>(job, process,
                                             MonitorContext{config_, *interpolator_, artifacts_, records_.get()});
    if (!monitor->start()) {
        stopJob(job, "Failed to start progress monitor.");
        return {false, "", ErrorCode::IoError, "Failed to start progress monitor."};
    }
    {
        std::lock_guard<std::mutex> lock(monitorsMutex_);
        monitors_[id] = std::move(monitor);
    }

    LOG_INFO("Submitted job " + id + " (" + filename + ", " + toString(request.quality) + ", " +
             std::to_string(request.size) + "px, " + toString(request.format) + ")");
    return {true, id, ErrorCode::None, ""};
}

QueryResult Orchestrator::query(const JobId& id) const {
    if (auto job = registry_.find(id)) {
        return {true, job->view(), ErrorCode::None, ""};
    }

    if (records_) {
        if (auto record = records_->find(id)) {
            JobView view;
            view.id = record->jobId;
            view.state = record->state;
            view.message = record->message;
            view.progress = record->progress;
            view.axis = record->axis;
            view.offset = record->offset;
            if (record->state == JobState::Finished) {
                view.etaSeconds = 0.0;
            }
            return {true, view, ErrorCode::None, ""};
        }
    }
    return {false, {}, ErrorCode::NotFound, "Job not found."};
}

OpResult Orchestrator::cancel(const JobId& id) {
    auto job = registry_.find(id);
    if (!job) {
        return {false, ErrorCode::NotFound, "Job not found."};
    }
    if (!stopJob(job, kCancelMessage)) {
        return {false, ErrorCode::InvalidState,
                std::string("Job is not running (") + toString(job->state()) + ")."};
    }
    LOG_INFO("Job " + id + " cancelled");
    return {true, ErrorCode::None, ""};
}

// Wins the terminal transition or does nothing.
bool Orchestrator::stopJob(const std::shared_ptr<Job>& job, const std::string& message) {
    auto process = job->cancel(message);
    if (!process) {
        return false;
    }
    if (*process) {
        (*process)->terminate(config_.cancelGrace);
    }
    job->releaseWorkspace();
    if (job->owner() && records_) {
        (void)records_->fail(job->id(), JobState::Cancelled, message);
    }
    return true;
}

FetchResult Orchestrator::fetchArtifact(const JobId& id) {
    auto job = registry_.find(id);
    if (!job) {
        return fetchFromRecord(id);
    }

    FetchResult result;
    const JobSettings& settings = job->settings();
    result.downloadName = settings.downloadName;
    result.mimetype = mimetypeFor(settings.format);

    JobState state = job->state();
    if (state != JobState::Finished) {
        result.error = ErrorCode::NotReady;
        result.message = state == JobState::Running ? "Render still in progress."
                                                    : std::string("Render ") + toString(state) + ".";
        return result;
    }

    if (auto stored = job->storedArtifact()) {
        auto stream = std::make_unique<std::ifstream>(*stored, std::ios::binary);
        std::error_code ec;
        auto size = std::filesystem::file_size(*stored, ec);
        if (!*stream || ec) {
            LOG_WARN("Stored artifact missing for job " + id + ": " + stored->string());
            result.error = ErrorCode::NotFound;
            result.message = "Rendered file missing.";
            return result;
        }
        result.ok = true;
        result.stream = std::move(stream);
        result.size = size;
        return result;
    }

    if (!job->owner() && job->consumed()) {
        result.error = ErrorCode::AlreadyConsumed;
        result.message = "This render has already been downloaded.";
        return result;
    }

    std::unique_ptr<std::ifstream> stream;
    std::uintmax_t size = 0;
    bool held = job->withWorkspace([&](const std::filesystem::path&) {
        std::error_code ec;
        size = std::filesystem::file_size(settings.finalArtifact, ec);
        if (!ec) {
            stream = std::make_unique<std::ifstream>(settings.finalArtifact, std::ios::binary);
        }
    });

    if (!held) {
        result.error = job->owner() ? ErrorCode::NotFound : ErrorCode::AlreadyConsumed;
        result.message = job->owner() ? "Rendered file missing." : "This render has already been downloaded.";
        return result;
    }
    if (!stream || !*stream) {
        LOG_WARN("Artifact missing for finished job " + id);
        job->releaseWorkspace();
        registry_.remove(id);
        result.error = ErrorCode::NotFound;
        result.message = "Rendered file missing.";
        return result;
    }

    if (!job->owner()) {
        if (!job->markConsumed()) {
            result.error = ErrorCode::AlreadyConsumed;
            result.message = "This render has already been downloaded.";
            return result;
        }
        // The open stream stays readable after the directory is gone.
        job->releaseWorkspace();
        LOG_DEBUG("Job " + id + " downloaded, workspace released");
    }

    result.ok = true;
    result.stream = std::move(stream);
    result.size = size;
    return result;
}

FetchResult Orchestrator::fetchFromRecord(const JobId& id) const {
    FetchResult result;
    result.error = ErrorCode::NotFound;
    result.message = "Job not found.";

    if (!records_) {
        return result;
    }
    auto record = records_->find(id);
    if (!record) {
        return result;
    }
    result.downloadName = record->downloadName;
    result.mimetype = record->mimetype;

    if (record->state != JobState::Finished) {
        result.error = ErrorCode::NotReady;
        result.message = std::string("Render ") + toString(record->state) + ".";
        return result;
    }
    if (record->filePath.empty() || !artifacts_.contains(record->filePath)) {
        result.message = "Rendered file missing.";
        return result;
    }

    auto stream = std::make_unique<std::ifstream>(record->filePath, std::ios::binary);
    std::error_code ec;
    auto size = std::filesystem::file_size(record->filePath, ec);
    if (!*stream || ec) {
        result.message = "Rendered file missing.";
        return result;
    }

    result.ok = true;
    result.error = ErrorCode::None;
    result.message.clear();
    result.stream = std::move(stream);
    result.size = size;
    return result;
}

OpResult Orchestrator::remove(const JobId& id) {
    auto job = registry_.find(id);
    if (!job) {
        return {false, ErrorCode::NotFound, "Job not found."};
    }
    if (job->isRunning()) {
        return {false, ErrorCode::InvalidState, "Job is still running."};
    }
    job->releaseWorkspace();
    registry_.remove(id);
    pruneMonitors(false);
    return {true, ErrorCode::None, ""};
}

void Orchestrator::releaseSlotLocked(const std::string& owner) {
    auto it = pending_.find(owner);
    if (it != pending_.end() && --it->second == 0) {
        pending_.erase(it);
    }
}

std::size_t Orchestrator::reap(std::chrono::seconds maxAge) {
    const auto now = Clock::now();
    std::size_t removed = 0;
    for (const auto& job : registry_.snapshot()) {
        auto ended = job->endedAt();
        if (!ended || now - *ended < maxAge) {
            continue;
        }
        job->releaseWorkspace();
        if (registry_.remove(job->id())) {
            ++removed;
        }
    }
    pruneMonitors(false);
    if (removed > 0) {
        LOG_INFO("Reaped " + std::to_string(removed) + " finished job(s)");
    }
    return removed;
}

void Orchestrator::shutdown() noexcept {
    if (shutdown_.exchange(true)) {
        return;
    }
    LOG_INFO("Shutting down orchestrator...");

    try {
        std::size_t cancelled = 0;
        for (const auto& job : registry_.snapshot()) {
            if (stopJob(job, kShutdownMessage)) {
                ++cancelled;
            }
        }
        if (cancelled > 0) {
            LOG_INFO("Cancelled " + std::to_string(cancelled) + " running job(s)");
        }
        pruneMonitors(true);
    } catch (const std::exception& e) {
        LOG_ERROR("Error during shutdown: " + std::string(e.what()));
    }

    LOG_INFO("Orchestrator shutdown complete");
}

std::size_t Orchestrator::runningCount(const std::string& owner) const {
    return registry_.countRunning(owner);
}

void Orchestrator::pruneMonitors(bool all) {
    std::vector<std::unique_ptr<Monitor>> finished;
    {
        std::lock_guard<std::mutex> lock(monitorsMutex_);
        for (auto it = monitors_.begin(); it != monitors_.end();) {
            if (all || it->second->done()) {
                finished.push_back(std::move(it->second));
                it = monitors_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Joined outside the lock
    for (auto& monitor : finished) {
        monitor->join();
    }
}

}
