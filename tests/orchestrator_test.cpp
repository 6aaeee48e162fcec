#include <gtest/gtest.h>

#include <recfetch/orchestrator.hpp>

#include "test_support.hpp"

namespace recfetch {
namespace {

using testing::FakeDownloadExecutor;
using testing::FakeMergeTool;
using testing::FakeSessionProvider;
using testing::TempDir;

class OrchestratorTest : public ::testing::Test {
   protected:
	void SetUp() override {
		config.output_directory = dir.path();
		config.min_merged_bytes = 100;
	}

	Orchestrator make() {
		return Orchestrator(config, session, downloader, tool);
	}

	TempDir dir;
	Config config;
	FakeSessionProvider session;
	FakeDownloadExecutor downloader;
	FakeMergeTool tool;
};

TEST_F(OrchestratorTest, DownloadsAndMergesEachRecording) {
	auto orchestrator = make();
	auto res = orchestrator.run(1, 2);
	ASSERT_TRUE(res);

	EXPECT_EQ(res.value().succeeded(), (std::vector<RecordingNumber>{1, 2}));
	EXPECT_TRUE(res.value().ok());
	EXPECT_EQ(session.opens, 1);
	EXPECT_EQ(dir.filenames(), (std::vector<std::string>{
								   "Recording_01.mp4", "Recording_02.mp4"}));
}

TEST_F(OrchestratorTest, PerItemMergeHappensBeforeNextDownload) {
	std::vector<std::string> seen;
	downloader.on_download = [&](RecordingNumber number) {
		if (number == 2) seen = dir.filenames();
	};

	auto orchestrator = make();
	ASSERT_TRUE(orchestrator.run(1, 2));
	EXPECT_EQ(seen, std::vector<std::string>{"Recording_01.mp4"});
}

TEST_F(OrchestratorTest, SkipsExistingRecordingWithoutTouchingSession) {
	dir.touch("Recording_03.mp4", 4096);

	auto orchestrator = make();
	auto res = orchestrator.run(3, 3);
	ASSERT_TRUE(res);

	EXPECT_EQ(res.value().skipped(), std::vector<RecordingNumber>{3});
	EXPECT_TRUE(session.resolved.empty());
	EXPECT_TRUE(downloader.requests.empty());
}

TEST_F(OrchestratorTest, ForceRedownloadsExistingRecording) {
	dir.touch("Recording_03.mp4", 4096);
	config.force_redownload = true;

	auto orchestrator = make();
	auto res = orchestrator.run(3, 3);
	ASSERT_TRUE(res);

	EXPECT_EQ(res.value().succeeded(), std::vector<RecordingNumber>{3});
	ASSERT_EQ(downloader.requests.size(), 1u);
	EXPECT_EQ(downloader.requests[0].number, 3);
}

TEST_F(OrchestratorTest, FailedItemsDoNotStopTheRun) {
	session.sources[2] = std::nullopt;
	downloader.failing = {3};

	auto orchestrator = make();
	auto res = orchestrator.run(1, 4);
	ASSERT_TRUE(res);

	const auto &report = res.value();
	EXPECT_EQ(report.succeeded(), (std::vector<RecordingNumber>{1, 4}));
	EXPECT_EQ(report.failed(), (std::vector<RecordingNumber>{2, 3}));
	EXPECT_FALSE(report.ok());
	EXPECT_EQ(session.resolved, (std::vector<RecordingNumber>{1, 2, 3, 4}));
}

TEST_F(OrchestratorTest, PassesRefererAndCookieJarToDownloader) {
	session.sources[5] =
		MediaSource{"https://player.vimeo.com/video/1", true,
					"https://platform.example.com/recordings/5",
					ResolutionStep::iframe_embed};
	session.jar = dir.path() / "jar.txt";

	auto orchestrator = make();
	ASSERT_TRUE(orchestrator.run(5, 6));

	ASSERT_EQ(downloader.requests.size(), 2u);
	const auto &with_referer = downloader.requests[0];
	ASSERT_TRUE(with_referer.referer.has_value());
	EXPECT_EQ(*with_referer.referer,
			  "https://platform.example.com/recordings/5");
	EXPECT_EQ(with_referer.cookie_jar, dir.path() / "jar.txt");
	EXPECT_EQ(with_referer.output_template.filename().string(),
			  "Recording_05.%(ext)s");

	EXPECT_FALSE(downloader.requests[1].referer.has_value());
}

TEST_F(OrchestratorTest, MissingMergeToolAbortsBeforeLogin) {
	tool.available = false;

	auto orchestrator = make();
	auto res = orchestrator.run(1, 3);
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error(), make_error_code(errc::merge_tool_missing));
	EXPECT_EQ(session.opens, 0);
	EXPECT_TRUE(downloader.requests.empty());
}

TEST_F(OrchestratorTest, AllowSplitKeepsFragmentsWithoutMergeTool) {
	tool.available = false;
	config.allow_unmerged_output = true;

	auto orchestrator = make();
	auto res = orchestrator.run(1, 1);
	ASSERT_TRUE(res);

	EXPECT_EQ(res.value().succeeded(), std::vector<RecordingNumber>{1});
	EXPECT_TRUE(tool.calls.empty());
	EXPECT_EQ(dir.filenames(),
			  (std::vector<std::string>{
				  "Recording_01.fhls-2400.mp4",
				  "Recording_01.fhls-audio-high-Original.mp4"}));
}

TEST_F(OrchestratorTest, LoginFailureEndsTheRun) {
	session.open_result = outcome::failure(errc::login_failed);

	auto orchestrator = make();
	auto res = orchestrator.run(1, 3);
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error(), make_error_code(errc::login_failed));
	EXPECT_TRUE(session.resolved.empty());
}

TEST_F(OrchestratorTest, StopRequestFinishesCurrentItemOnly) {
	Orchestrator orchestrator = make();
	downloader.on_download = [&](RecordingNumber number) {
		if (number == 2) orchestrator.request_stop();
	};

	auto res = orchestrator.run(1, 4);
	ASSERT_TRUE(res);

	const auto &report = res.value();
	EXPECT_TRUE(report.interrupted());
	EXPECT_EQ(report.succeeded(), (std::vector<RecordingNumber>{1, 2}));
	EXPECT_EQ(report.failed(), (std::vector<RecordingNumber>{3, 4}));
	EXPECT_EQ(downloader.requests.size(), 2u);
	// The item in flight was still finalized
	EXPECT_TRUE(dir.exists("Recording_02.mp4"));
}

TEST_F(OrchestratorTest, FinalPassMergesLeftoversOutsideTheRange) {
	dir.touch("Recording_09.fhls-2400.mp4");
	dir.touch("Recording_09.fhls-audio-high-Original.mp4");

	auto orchestrator = make();
	ASSERT_TRUE(orchestrator.run(1, 1));

	EXPECT_TRUE(dir.exists("Recording_09.mp4"));
	EXPECT_FALSE(dir.exists("Recording_09.fhls-2400.mp4"));
}

TEST_F(OrchestratorTest, RejectsEmptyRange) {
	auto orchestrator = make();
	auto res = orchestrator.run(5, 4);
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error(), make_error_code(errc::invalid_config));
	EXPECT_EQ(tool.probes, 0);
}

TEST_F(OrchestratorTest, MergeOnlyReconcilesWithoutSession) {
	dir.touch("Recording_04.fhls-2400.mp4");
	dir.touch("Recording_04.fhls-audio-high-Original.mp4");
	dir.touch("Recording_05.fhls-2400.mp4");

	auto orchestrator = make();
	auto res = orchestrator.merge_only();
	ASSERT_TRUE(res);

	EXPECT_EQ(session.opens, 0);
	EXPECT_EQ(res.value().count(MergeStatus::merged), 1);
	EXPECT_EQ(res.value().count(MergeStatus::not_mergeable), 1);
	EXPECT_TRUE(dir.exists("Recording_04.mp4"));
	EXPECT_TRUE(dir.exists("Recording_05.fhls-2400.mp4"));
}

TEST_F(OrchestratorTest, MergeOnlyNeedsTheMergeTool) {
	tool.available = false;

	auto orchestrator = make();
	auto res = orchestrator.merge_only();
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error(), make_error_code(errc::merge_tool_missing));
}

}  // namespace
}  // namespace recfetch
