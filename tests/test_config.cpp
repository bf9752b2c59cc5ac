/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <cstdlib>

#include "spindle/config.hpp"
#include "spindle/types.hpp"

namespace spindle {
namespace {

const char* const kVars[] = {
    "SPINDLE_RENDERER", "SPINDLE_SECONDS", "SPINDLE_RENDER_FPS", "SPINDLE_FPS", "SPINDLE_AXIS",
    "SPINDLE_FORMAT", "SPINDLE_QUALITY", "SPINDLE_MAX_CONCURRENT", "SPINDLE_MAX_UPLOAD",
    "SPINDLE_CANCEL_GRACE_MS", "SPINDLE_STORAGE", "SPINDLE_SCRATCH", "SPINDLE_JOB_RETENTION",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kVars) {
            ::unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    Config config = Config::fromEnv();
    EXPECT_TRUE(config.rendererPath.empty());
    EXPECT_EQ(config.rendererName, "blender");
    EXPECT_EQ(config.baseFps, 11);
    EXPECT_EQ(config.finalFps, 25);
    EXPECT_EQ(config.axis, Axis::Z);
    EXPECT_EQ(config.format, VideoFormat::Mp4);
    EXPECT_EQ(config.quality, Quality::Ultra);
    EXPECT_EQ(config.maxConcurrentPerOwner, 5);
    EXPECT_EQ(config.maxUploadBytes, 100ULL * 1024 * 1024);
    EXPECT_EQ(config.cancelGrace.count(), 500);
    EXPECT_EQ(config.jobRetention.count(), 3600);
    EXPECT_EQ(config.scriptPath.filename().string(), "turntable.py");
    EXPECT_EQ(config.storageRoot.filename().string(), "storage");
    EXPECT_TRUE(config.needsInterpolation());
    EXPECT_EQ(config.totalFrames(), 110);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    ::setenv("SPINDLE_RENDERER", "/opt/blender/blender", 1);
    ::setenv("SPINDLE_SECONDS", "4", 1);
    ::setenv("SPINDLE_RENDER_FPS", "24", 1);
    ::setenv("SPINDLE_FPS", "24", 1);
    ::setenv("SPINDLE_AXIS", "x", 1);
    ::setenv("SPINDLE_FORMAT", "WEBM", 1);
    ::setenv("SPINDLE_QUALITY", "fast", 1);
    ::setenv("SPINDLE_MAX_CONCURRENT", "2", 1);
    ::setenv("SPINDLE_CANCEL_GRACE_MS", "100", 1);
    ::setenv("SPINDLE_SCRATCH", "/var/tmp/spindle", 1);
    ::setenv("SPINDLE_JOB_RETENTION", "600", 1);

    Config config = Config::fromEnv();
    EXPECT_EQ(config.rendererPath.string(), "/opt/blender/blender");
    EXPECT_EQ(config.axis, Axis::X);
    EXPECT_EQ(config.format, VideoFormat::Webm);
    EXPECT_EQ(config.quality, Quality::Fast);
    EXPECT_EQ(config.maxConcurrentPerOwner, 2);
    EXPECT_EQ(config.cancelGrace.count(), 100);
    EXPECT_EQ(config.scratchRoot.string(), "/var/tmp/spindle");
    EXPECT_EQ(config.jobRetention.count(), 600);
    EXPECT_FALSE(config.needsInterpolation());
    EXPECT_EQ(config.totalFrames(), 96);
}

TEST_F(ConfigTest, InvalidValuesFallBack) {
    ::setenv("SPINDLE_SECONDS", "soon", 1);
    ::setenv("SPINDLE_RENDER_FPS", "0", 1);
    ::setenv("SPINDLE_AXIS", "W", 1);
    ::setenv("SPINDLE_FORMAT", "gif", 1);
    ::setenv("SPINDLE_QUALITY", "max", 1);
    ::setenv("SPINDLE_MAX_UPLOAD", "lots", 1);

    Config config = Config::fromEnv();
    EXPECT_DOUBLE_EQ(config.seconds, 10.0);
    EXPECT_EQ(config.baseFps, 11);
    EXPECT_EQ(config.axis, Axis::Z);
    EXPECT_EQ(config.format, VideoFormat::Mp4);
    EXPECT_EQ(config.quality, Quality::Ultra);
    EXPECT_EQ(config.maxUploadBytes, 100ULL * 1024 * 1024);
}

TEST_F(ConfigTest, TotalFramesIsAtLeastOne) {
    Config config;
    config.seconds = 0.01;
    config.baseFps = 11;
    EXPECT_EQ(config.totalFrames(), 1);
}

TEST(TypesTest, NamesAndParsers) {
    EXPECT_STREQ(toString(JobState::Cancelled), "cancelled");
    EXPECT_STREQ(toString(Axis::Y), "Y");
    EXPECT_STREQ(extensionFor(VideoFormat::Webm), ".webm");
    EXPECT_STREQ(mimetypeFor(VideoFormat::Mp4), "video/mp4");
    EXPECT_EQ(parseQuality("Standard"), Quality::Standard);
    EXPECT_EQ(parseJobState("FINISHED"), JobState::Finished);
    EXPECT_FALSE(parseAxis("").has_value());
    EXPECT_FALSE(parseFormat("avi").has_value());
    EXPECT_TRUE(isTerminal(JobState::Error));
    EXPECT_FALSE(isTerminal(JobState::Running));
}

}
}
