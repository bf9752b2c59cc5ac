/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>

#include "spindle/types.hpp"

namespace spindle {

// Renderer stdout line shapes:
//   "[AUTO] axis=<X|Y|Z> offset=<float>"   auto-orientation decision
//   "Fra:<int> ..."                         frame progress
//   anything else non-blank                 free-text status
enum class LineKind : uint8_t {
    Blank,
    AutoOrientation,
    FrameProgress,
    StatusText
};

struct LineEvent {
    LineKind kind = LineKind::Blank;
    std::string text;               // trimmed line
    std::optional<Axis> axis;       // AutoOrientation only
    std::optional<double> offset;   // AutoOrientation only
    int frame = 0;                  // FrameProgress only
};

inline constexpr const char* kAutoMarker = "[AUTO]";
inline constexpr const char* kFrameMarker = "Fra:";

[[nodiscard]] LineEvent classifyLine(const std::string& raw);

}
