/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include <vector>

#include "spindle/logger.hpp"
#include "spindle/orchestrator.hpp"
#include "support/TestScripts.hpp"

namespace spindle {
namespace {

using testing::countEntries;
using testing::TempDir;
using testing::waitFor;
using testing::writeFile;
using testing::writeScript;

std::string drain(std::istream& in) {
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        model_ = dir_ / "Bracket v2.stl";
        writeFile(model_, "solid bracket\nendsolid bracket\n");
        encoderMarker_ = dir_ / "encoder-ran";
    }

    void TearDown() override {
        Logger::setSink(nullptr);
    }

    Config configWith(const std::string& rendererBody) {
        auto renderer = writeScript(dir_ / "renderer", rendererBody);
        return testing::testConfig(dir_, renderer);
    }

    // Interpolating config whose encoder leaves a marker file behind.
    Config interpolatingConfig(const std::string& rendererBody, const std::string& encoderTail = "") {
        Config config = configWith(rendererBody);
        config.finalFps = 20;
        auto encoder = writeScript(dir_ / "encoder",
                                   "touch '" + encoderMarker_.string() + "'\n" + testing::copyingEncoder() + encoderTail);
        config.ffmpegBin = encoder.string();
        return config;
    }

    JobView waitForTerminal(Orchestrator& orchestrator, const JobId& id) {
        JobView view;
        EXPECT_TRUE(waitFor([&] {
            auto result = orchestrator.query(id);
            view = result.view;
            return result && isTerminal(view.state);
        })) << "job " << id << " did not finish";
        return view;
    }

    std::filesystem::path scratch() const { return dir_ / "scratch"; }

    TempDir dir_;
    std::filesystem::path model_;
    std::filesystem::path encoderMarker_;
};

TEST_F(OrchestratorTest, AnonymousRenderFinishesAndDownloadsOnce) {
    Orchestrator orchestrator(configWith(testing::succeedingRenderer(10)));

    auto submitted = orchestrator.submit(model_, RenderOptions{});
    ASSERT_TRUE(submitted) << submitted.message;
    EXPECT_EQ(submitted.id.size(), 32u);

    auto view = waitForTerminal(orchestrator, submitted.id);
    EXPECT_EQ(view.state, JobState::Finished);
    EXPECT_DOUBLE_EQ(view.progress, 100.0);
    ASSERT_TRUE(view.etaSeconds.has_value());
    EXPECT_DOUBLE_EQ(*view.etaSeconds, 0.0);
    EXPECT_EQ(view.message, "Render complete (axis Z).");

    auto first = orchestrator.fetchArtifact(submitted.id);
    ASSERT_TRUE(first) << first.message;
    EXPECT_EQ(first.downloadName, "Bracket_v2_turntable.mp4");
    EXPECT_EQ(first.mimetype, "video/mp4");
    EXPECT_EQ(first.size, 5u);
    EXPECT_EQ(drain(*first.stream), "video");
    EXPECT_EQ(countEntries(scratch()), 0u);

    auto second = orchestrator.fetchArtifact(submitted.id);
    EXPECT_FALSE(second);
    EXPECT_EQ(second.error, ErrorCode::AlreadyConsumed);
}

TEST_F(OrchestratorTest, OwnedRenderIsInterpolatedStoredAndRecorded) {
    Orchestrator orchestrator(interpolatingConfig(testing::succeedingRenderer(10)));

    RenderOptions options;
    options.owner = std::string("alice");
    options.format = "WEBM";
    auto submitted = orchestrator.submit(model_, options);
    ASSERT_TRUE(submitted) << submitted.message;

    auto view = waitForTerminal(orchestrator, submitted.id);
    ASSERT_EQ(view.state, JobState::Finished) << view.message;
    EXPECT_TRUE(std::filesystem::exists(encoderMarker_));
    EXPECT_EQ(countEntries(scratch()), 0u);

    auto stored = dir_ / "storage" / "renders" / (submitted.id + ".webm");
    EXPECT_EQ(testing::readFile(stored), "video");

    for (int i = 0; i < 2; ++i) {
        auto fetched = orchestrator.fetchArtifact(submitted.id);
        ASSERT_TRUE(fetched) << fetched.message;
        EXPECT_EQ(fetched.mimetype, "video/webm");
        EXPECT_EQ(drain(*fetched.stream), "video");
    }

    // Once dropped from memory the durable record answers.
    ASSERT_TRUE(orchestrator.remove(submitted.id));
    auto fromRecord = orchestrator.query(submitted.id);
    ASSERT_TRUE(fromRecord);
    EXPECT_EQ(fromRecord.view.state, JobState::Finished);
    EXPECT_DOUBLE_EQ(fromRecord.view.progress, 100.0);

    auto fetched = orchestrator.fetchArtifact(submitted.id);
    ASSERT_TRUE(fetched) << fetched.message;
    EXPECT_EQ(fetched.downloadName, "Bracket_v2_turntable.webm");
    EXPECT_EQ(drain(*fetched.stream), "video");
}

TEST_F(OrchestratorTest, EncoderFailureEndsInError) {
    std::vector<std::string> logged;
    Logger::setSink([&logged](LogLevel, const std::string& line) { logged.push_back(line); });

    Orchestrator orchestrator(interpolatingConfig(testing::succeedingRenderer(10),
                                                  "echo 'minterpolate: out of memory' >&2\nexit 1\n"));
    auto submitted = orchestrator.submit(model_, RenderOptions{});
    ASSERT_TRUE(submitted) << submitted.message;

    auto view = waitForTerminal(orchestrator, submitted.id);
    EXPECT_EQ(view.state, JobState::Error);
    EXPECT_EQ(view.failure, FailureKind::PostProcessFailure);
    EXPECT_EQ(view.message.rfind("Post-processing failed", 0), 0u);
    ASSERT_FALSE(view.diagnostics.empty());
    EXPECT_EQ(view.diagnostics.back(), "minterpolate: out of memory");
    EXPECT_EQ(countEntries(scratch()), 0u);

    orchestrator.shutdown();
    Logger::setSink(nullptr);
    bool mentionsPrimary = false;
    for (const auto& line : logged) {
        if (line.find("primary render succeeded") != std::string::npos) {
            mentionsPrimary = true;
        }
    }
    EXPECT_TRUE(mentionsPrimary);

    auto fetched = orchestrator.fetchArtifact(submitted.id);
    EXPECT_EQ(fetched.error, ErrorCode::NotReady);
}

TEST_F(OrchestratorTest, RendererFailureReportsExitCodeAndLastLine) {
    Orchestrator orchestrator(configWith("echo 'Fra:1 Mem:1M'\necho 'Error: mesh is not manifold' >&2\nexit 2\n"));
    auto submitted = orchestrator.submit(model_, RenderOptions{});
    ASSERT_TRUE(submitted) << submitted.message;

    auto view = waitForTerminal(orchestrator, submitted.id);
    EXPECT_EQ(view.state, JobState::Error);
    EXPECT_EQ(view.failure, FailureKind::RenderFailure);
    EXPECT_NE(view.message.find("code 2"), std::string::npos);
    EXPECT_NE(view.message.find("mesh is not manifold"), std::string::npos);
    EXPECT_EQ(view.diagnostics, (std::vector<std::string>{"Error: mesh is not manifold"}));
    EXPECT_EQ(countEntries(scratch()), 0u);
}

TEST_F(OrchestratorTest, MissingArtifactIsARenderFailure) {
    Orchestrator orchestrator(configWith("echo 'Fra:10'\nexit 0\n"));
    auto submitted = orchestrator.submit(model_, RenderOptions{});
    ASSERT_TRUE(submitted) << submitted.message;

    auto view = waitForTerminal(orchestrator, submitted.id);
    EXPECT_EQ(view.state, JobState::Error);
    EXPECT_EQ(view.failure, FailureKind::RenderFailure);
    EXPECT_NE(view.message.find("No additional output from renderer."), std::string::npos);
}

TEST_F(OrchestratorTest, AutoOrientationIsReflectedInMessages) {
    Orchestrator orchestrator(configWith("echo '[AUTO] axis=X offset=30.0'\n" + testing::succeedingRenderer(10)));
    auto submitted = orchestrator.submit(model_, RenderOptions{});
    ASSERT_TRUE(submitted) << submitted.message;

    auto view = waitForTerminal(orchestrator, submitted.id);
    EXPECT_EQ(view.state, JobState::Finished);
    EXPECT_EQ(view.axis, Axis::X);
    EXPECT_DOUBLE_EQ(view.offset, 30.0);
    EXPECT_EQ(view.message, "Render complete (axis X).");
}

TEST_F(OrchestratorTest, CancelStopsRendererAndIsFinal) {
    Orchestrator orchestrator(interpolatingConfig(
        testing::rendererPrologue() + "echo 'Fra:1'\necho 'Fra:2'\nsleep 30\nprintf 'video' > \"$OUT\"\n"));

    RenderOptions options;
    options.owner = std::string("alice");
    auto submitted = orchestrator.submit(model_, options);
    ASSERT_TRUE(submitted) << submitted.message;
    ASSERT_TRUE(waitFor([&] { return orchestrator.query(submitted.id).view.progress >= 20.0; }));
    ASSERT_EQ(countEntries(scratch()), 1u);

    auto cancelled = orchestrator.cancel(submitted.id);
    ASSERT_TRUE(cancelled) << cancelled.message;

    auto view = orchestrator.query(submitted.id).view;
    EXPECT_EQ(view.state, JobState::Cancelled);
    EXPECT_EQ(view.message, "Render cancelled by user.");
    EXPECT_FALSE(view.etaSeconds.has_value());
    EXPECT_EQ(countEntries(scratch()), 0u);

    auto again = orchestrator.cancel(submitted.id);
    EXPECT_FALSE(again);
    EXPECT_EQ(again.error, ErrorCode::InvalidState);

    // Let the monitor observe the killed renderer; nothing may change afterwards.
    orchestrator.shutdown();
    view = orchestrator.query(submitted.id).view;
    EXPECT_EQ(view.state, JobState::Cancelled);
    EXPECT_EQ(countEntries(scratch()), 0u);
    EXPECT_FALSE(std::filesystem::exists(encoderMarker_));
    EXPECT_EQ(countEntries(dir_ / "storage" / "renders"), 0u);
    EXPECT_EQ(orchestrator.fetchArtifact(submitted.id).error, ErrorCode::NotReady);
}

TEST_F(OrchestratorTest, OwnerCeilingRejectsBeforeAnyLaunch) {
    Config config = configWith(testing::rendererPrologue() + "sleep 30\n");
    config.maxConcurrentPerOwner = 1;
    Orchestrator orchestrator(config);

    RenderOptions alice;
    alice.owner = std::string("alice");
    auto first = orchestrator.submit(model_, alice);
    ASSERT_TRUE(first) << first.message;
    EXPECT_EQ(orchestrator.runningCount("alice"), 1u);

    auto second = orchestrator.submit(model_, alice);
    EXPECT_FALSE(second);
    EXPECT_EQ(second.error, ErrorCode::CapacityExceeded);
    EXPECT_EQ(countEntries(scratch()), 1u);

    // Other owners and anonymous callers are unaffected.
    RenderOptions bob;
    bob.owner = std::string("bob");
    EXPECT_TRUE(orchestrator.submit(model_, bob));
    EXPECT_TRUE(orchestrator.submit(model_, RenderOptions{}));

    ASSERT_TRUE(orchestrator.cancel(first.id));
    EXPECT_TRUE(orchestrator.submit(model_, alice));
}

TEST_F(OrchestratorTest, ConcurrentOwnerSubmissionsStayWithinCeiling) {
    Config config = configWith(testing::rendererPrologue() + "sleep 30\n");
    config.maxConcurrentPerOwner = 2;
    Orchestrator orchestrator(config);

    RenderOptions alice;
    alice.owner = std::string("alice");
    std::vector<SubmitResult> results(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] { results[i] = orchestrator.submit(model_, alice); });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::size_t accepted = 0;
    for (const auto& result : results) {
        if (result) {
            ++accepted;
        } else {
            EXPECT_EQ(result.error, ErrorCode::CapacityExceeded);
        }
    }
    EXPECT_EQ(accepted, 2u);
    EXPECT_EQ(orchestrator.runningCount("alice"), 2u);
    EXPECT_EQ(countEntries(scratch()), 2u);
}

TEST_F(OrchestratorTest, LaunchMessageDescribesOptions) {
    Orchestrator orchestrator(configWith(testing::rendererPrologue() + "sleep 30\n"));

    auto autoJob = orchestrator.submit(model_, RenderOptions{});
    ASSERT_TRUE(autoJob);
    EXPECT_EQ(orchestrator.query(autoJob.id).view.message, "Launching renderer (Ultra, auto orientation)…");

    RenderOptions manual;
    manual.autoOrientation = false;
    manual.axis = "y";
    manual.offset = 45.25;
    manual.quality = "fast";
    auto manualJob = orchestrator.submit(model_, manual);
    ASSERT_TRUE(manualJob);
    auto view = orchestrator.query(manualJob.id).view;
    EXPECT_EQ(view.message, "Launching renderer (Fast, axis Y, start 45.2°)…");
    EXPECT_EQ(view.axis, Axis::Y);

    EXPECT_EQ(orchestrator.fetchArtifact(manualJob.id).error, ErrorCode::NotReady);
    EXPECT_EQ(orchestrator.remove(manualJob.id).error, ErrorCode::InvalidState);
}

TEST_F(OrchestratorTest, UnknownJobsAreNotFound) {
    Orchestrator orchestrator(configWith(testing::succeedingRenderer(1)));
    EXPECT_EQ(orchestrator.query("0123456789abcdef").error, ErrorCode::NotFound);
    EXPECT_EQ(orchestrator.cancel("0123456789abcdef").error, ErrorCode::NotFound);
    EXPECT_EQ(orchestrator.fetchArtifact("0123456789abcdef").error, ErrorCode::NotFound);
    EXPECT_EQ(orchestrator.remove("0123456789abcdef").error, ErrorCode::NotFound);

    auto submitted = orchestrator.submit(model_, RenderOptions{});
    ASSERT_TRUE(submitted);
    waitForTerminal(orchestrator, submitted.id);
    ASSERT_TRUE(orchestrator.remove(submitted.id));
    EXPECT_EQ(orchestrator.query(submitted.id).error, ErrorCode::NotFound);
    EXPECT_EQ(countEntries(scratch()), 0u);
}

TEST_F(OrchestratorTest, BadInputIsRejected) {
    Config config = configWith(testing::succeedingRenderer(1));
    config.maxUploadBytes = 64;
    Orchestrator orchestrator(config);

    EXPECT_EQ(orchestrator.submit(dir_ / "missing.stl", {}).error, ErrorCode::BadInput);

    writeFile(dir_ / "model.obj", "o cube\n");
    EXPECT_EQ(orchestrator.submit(dir_ / "model.obj", {}).error, ErrorCode::BadInput);

    writeFile(dir_ / "empty.stl", "");
    EXPECT_EQ(orchestrator.submit(dir_ / "empty.stl", {}).error, ErrorCode::BadInput);

    writeFile(dir_ / "huge.STL", std::string(65, 'x'));
    auto huge = orchestrator.submit(dir_ / "huge.STL", {});
    EXPECT_EQ(huge.error, ErrorCode::BadInput);
    EXPECT_NE(huge.message.find("too large"), std::string::npos);

    writeFile(dir_ / "ok.STL", "solid\n");
    EXPECT_TRUE(orchestrator.submit(dir_ / "ok.STL", {}));
}

TEST_F(OrchestratorTest, MissingRendererCreatesNoWorkspace) {
    Config config = testing::testConfig(dir_, dir_ / "no-renderer");
    Orchestrator orchestrator(config);

    auto submitted = orchestrator.submit(model_, RenderOptions{});
    EXPECT_FALSE(submitted);
    EXPECT_EQ(submitted.error, ErrorCode::ExecutableNotFound);
    EXPECT_EQ(countEntries(scratch()), 0u);
}

TEST_F(OrchestratorTest, ReapDropsOldTerminalJobs) {
    Orchestrator orchestrator(configWith(testing::succeedingRenderer(2)));
    auto submitted = orchestrator.submit(model_, RenderOptions{});
    ASSERT_TRUE(submitted);
    waitForTerminal(orchestrator, submitted.id);

    EXPECT_EQ(orchestrator.reap(std::chrono::hours(1)), 0u);
    EXPECT_EQ(orchestrator.reap(std::chrono::seconds(0)), 1u);
    EXPECT_EQ(orchestrator.query(submitted.id).error, ErrorCode::NotFound);
    EXPECT_EQ(countEntries(scratch()), 0u);
}

TEST_F(OrchestratorTest, SubmitDropsJobsPastRetention) {
    Config config = configWith(testing::succeedingRenderer(2));
    config.jobRetention = std::chrono::seconds(1);
    Orchestrator orchestrator(config);

    auto first = orchestrator.submit(model_, RenderOptions{});
    ASSERT_TRUE(first);
    waitForTerminal(orchestrator, first.id);
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));

    auto second = orchestrator.submit(model_, RenderOptions{});
    ASSERT_TRUE(second) << second.message;
    EXPECT_EQ(orchestrator.query(first.id).error, ErrorCode::NotFound);
    EXPECT_TRUE(orchestrator.query(second.id));
}

TEST_F(OrchestratorTest, ShutdownCancelsRunningJobs) {
    Orchestrator orchestrator(configWith(testing::rendererPrologue() + "sleep 30\n"));
    auto submitted = orchestrator.submit(model_, RenderOptions{});
    ASSERT_TRUE(submitted);

    orchestrator.shutdown();
    EXPECT_EQ(orchestrator.query(submitted.id).view.state, JobState::Cancelled);
    EXPECT_EQ(countEntries(scratch()), 0u);
    EXPECT_EQ(orchestrator.submit(model_, RenderOptions{}).error, ErrorCode::InvalidState);
}

TEST(RenderOptionsTest, NormalizationClampsAndDefaults) {
    Config config;
    config.axis = Axis::Y;
    config.renderSize = 1080;

    RenderOptions options;
    options.axis = "w";
    options.offset = 720.0;
    options.quality = "extreme";
    options.format = "gif";
    options.resolution = 999;
    options.kelvin = 50000;
    options.autoBrightness = false;
    options.exposure = -7.0;

    RenderRequest request = normalizeOptions(options, config);
    EXPECT_EQ(request.axis, Axis::Y);
    EXPECT_DOUBLE_EQ(request.offset, 360.0);
    EXPECT_EQ(request.quality, Quality::Ultra);
    EXPECT_EQ(request.format, VideoFormat::Mp4);
    EXPECT_EQ(request.size, 1080);
    EXPECT_EQ(request.kelvin, 10000);
    EXPECT_DOUBLE_EQ(request.exposure, -2.0);

    options.autoBrightness = true;
    options.offset = -5.0;
    options.resolution = 2160;
    options.kelvin = 100;
    request = normalizeOptions(options, config);
    EXPECT_DOUBLE_EQ(request.exposure, 0.0);
    EXPECT_DOUBLE_EQ(request.offset, 0.0);
    EXPECT_EQ(request.size, 2160);
    EXPECT_EQ(request.kelvin, 2000);
}

TEST(RenderOptionsTest, FilenamesAreSanitized) {
    EXPECT_EQ(sanitizeFilename("Bracket v2.stl"), "Bracket_v2.stl");
    EXPECT_EQ(sanitizeFilename("../../etc/passwd.stl"), "passwd.stl");
    EXPECT_EQ(sanitizeFilename(".hidden.stl"), "hidden.stl");
    EXPECT_EQ(sanitizeFilename("???"), "model.stl");
}

}
}
