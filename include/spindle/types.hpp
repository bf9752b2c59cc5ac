#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace spindle {

// Job lifecycle states. Finished, Error and Cancelled are terminal.
enum class JobState : std::uint8_t { Running, Finished, Error, Cancelled };

// Why a job ended in Error.
enum class FailureKind : std::uint8_t { None, RenderFailure, PostProcessFailure, StreamReadFailure };

enum class ErrorCode : std::uint8_t {
    None = 0,
    BadInput,
    ExecutableNotFound,
    CapacityExceeded,
    NotFound,
    InvalidState,
    NotReady,
    AlreadyConsumed,
    IoError
};

enum class Axis : std::uint8_t { X, Y, Z };
enum class Quality : std::uint8_t { Fast, Standard, Ultra };
enum class VideoFormat : std::uint8_t { Mp4, Webm };

// Opaque job identifier (hex token).
using JobId = std::string;

inline bool isTerminal(JobState state) noexcept { return state != JobState::Running; }

const char* toString(JobState state) noexcept;
const char* toString(FailureKind kind) noexcept;
const char* toString(ErrorCode code) noexcept;
const char* toString(Axis axis) noexcept;
const char* toString(Quality quality) noexcept;
const char* toString(VideoFormat format) noexcept;

// Case-insensitive parsers; nullopt for unknown values.
std::optional<JobState> parseJobState(const std::string& value) noexcept;
std::optional<Axis> parseAxis(const std::string& value) noexcept;
std::optional<Quality> parseQuality(const std::string& value) noexcept;
std::optional<VideoFormat> parseFormat(const std::string& value) noexcept;

// ".mp4" / ".webm"
const char* extensionFor(VideoFormat format) noexcept;
const char* mimetypeFor(VideoFormat format) noexcept;

} // namespace spindle
