/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/protocol.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace spindle {

namespace {
std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool startsWith(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

bool allDigits(const std::string& token) {
    return !token.empty() && std::all_of(token.begin(), token.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<double> parseDouble(const std::string& value) {
    try {
        std::size_t used = 0;
        double parsed = std::stod(value, &used);
        if (used != value.size() || !std::isfinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void parseAuto(LineEvent& event) {
    std::string body = event.text;
    std::replace(body.begin(), body.end(), '[', ' ');
    std::replace(body.begin(), body.end(), ']', ' ');

    std::istringstream tokens(body);
    std::string token;
    while (tokens >> token) {
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = token.substr(0, eq);
        std::string value = token.substr(eq + 1);
        if (key == "axis") {
            event.axis = parseAxis(value);
        } else if (key == "offset") {
            event.offset = parseDouble(value);
        }
    }
}

std::optional<int> parseFrame(const std::string& text) {
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), ':', ' ');

    std::istringstream tokens(normalized);
    std::string token;
    while (tokens >> token) {
        if (allDigits(token)) {
            try {
                return std::stoi(token);
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}
}

LineEvent classifyLine(const std::string& raw) {
    LineEvent event;
    event.text = trim(raw);
    if (event.text.empty()) {
        return event;
    }

    if (startsWith(event.text, kAutoMarker)) {
        event.kind = LineKind::AutoOrientation;
        parseAuto(event);
        return event;
    }

    if (startsWith(event.text, kFrameMarker)) {
        if (auto frame = parseFrame(event.text)) {
            event.kind = LineKind::FrameProgress;
            event.frame = *frame;
            return event;
        }
    }

    event.kind = LineKind::StatusText;
    return event;
}

}
