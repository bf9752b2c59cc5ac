/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <deque>
#include <optional>
#include <vector>

#include "spindle/config.hpp"

namespace spindle {

using Clock = std::chrono::steady_clock;

// Linearly recency-weighted mean: the i-th oldest of k durations weighs i.
[[nodiscard]] std::optional<double> weightedAverage(const std::vector<double>& durations) noexcept;

// Remaining seconds for a render, or nullopt during warm-up.
// Only the newest params.window durations are considered.
[[nodiscard]] std::optional<double> estimateRemaining(const std::vector<double>& durations,
                                                      int totalFrames,
                                                      int lastFrame,
                                                      double elapsedOnCurrent,
                                                      const EtaParams& params) noexcept;

// Inflates a stored estimate when the frame in flight has overrun the average.
[[nodiscard]] double refineRemaining(double eta, double average, double currentElapsed,
                                     const EtaParams& params) noexcept;

// Per-job frame timing history, fed by the monitor.
class FrameTimer final {
public:
    explicit FrameTimer(const EtaParams& params) noexcept : params_(params) {}

    // Returns false when the frame index did not advance (duplicate or out of order).
    bool observe(int frame, Clock::time_point now);

    [[nodiscard]] std::optional<double> estimate(int totalFrames, Clock::time_point now) const;
    [[nodiscard]] std::optional<double> average() const;

    [[nodiscard]] std::optional<int> lastFrame() const noexcept { return lastFrame_; }
    [[nodiscard]] std::optional<Clock::time_point> lastTimestamp() const noexcept { return lastTimestamp_; }
    [[nodiscard]] std::size_t samples() const noexcept { return durations_.size(); }

private:
    EtaParams params_;
    std::deque<double> durations_;
    std::optional<int> lastFrame_;
    std::optional<Clock::time_point> lastTimestamp_;

    [[nodiscard]] std::vector<double> sample() const;
};

}
