/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/eta.hpp"
#include <algorithm>

namespace spindle {

std::optional<double> weightedAverage(const std::vector<double>& durations) noexcept {
    if (durations.empty()) {
        return std::nullopt;
    }
    double weightedSum = 0.0;
    double weightTotal = 0.0;
    for (std::size_t i = 0; i < durations.size(); ++i) {
        double weight = static_cast<double>(i + 1);
        weightedSum += durations[i] * weight;
        weightTotal += weight;
    }
    return weightedSum / weightTotal;
}

std::optional<double> estimateRemaining(const std::vector<double>& durations,
                                        int totalFrames,
                                        int lastFrame,
                                        double elapsedOnCurrent,
                                        const EtaParams& params) noexcept {
    if (durations.size() < params.warmup || durations.empty()) {
        return std::nullopt;
    }

    std::vector<double> sample;
    if (params.window > 0 && durations.size() > params.window) {
        sample.assign(durations.end() - static_cast<std::ptrdiff_t>(params.window), durations.end());
    } else {
        sample = durations;
    }

    auto avg = weightedAverage(sample);
    if (!avg) {
        return std::nullopt;
    }

    int framesRemaining = std::max(0, totalFrames - lastFrame);
    double base = (*avg * framesRemaining) + std::max(0.0, elapsedOnCurrent);
    return std::max(0.0, base * params.safety);
}

double refineRemaining(double eta, double average, double currentElapsed,
                       const EtaParams& params) noexcept {
    if (currentElapsed > average * params.stallFactor) {
        return std::max(0.0, eta + (currentElapsed - average) * params.stallWeight);
    }
    return eta;
}

bool FrameTimer::observe(int frame, Clock::time_point now) {
    if (lastFrame_ && frame <= *lastFrame_) {
        return false;
    }

    if (lastFrame_ && lastTimestamp_) {
        double delta = std::chrono::duration<double>(now - *lastTimestamp_).count();
        if (delta > 0.0) {
            durations_.push_back(delta);
            while (params_.window > 0 && durations_.size() > params_.window) {
                durations_.pop_front();
            }
        }
    }

    lastFrame_ = frame;
    lastTimestamp_ = now;
    return true;
}

std::optional<double> FrameTimer::estimate(int totalFrames, Clock::time_point now) const {
    if (!lastFrame_ || !lastTimestamp_) {
        return std::nullopt;
    }
    double elapsed = std::chrono::duration<double>(now - *lastTimestamp_).count();
    return estimateRemaining(sample(), totalFrames, *lastFrame_, elapsed, params_);
}

std::optional<double> FrameTimer::average() const {
    if (durations_.size() < params_.warmup) {
        return std::nullopt;
    }
    return weightedAverage(sample());
}

std::vector<double> FrameTimer::sample() const {
    return std::vector<double>(durations_.begin(), durations_.end());
}

}
