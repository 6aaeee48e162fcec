#include <gtest/gtest.h>

#include <recfetch/merge_executor.hpp>

#include "test_support.hpp"

namespace recfetch {
namespace {

using testing::FakeMergeTool;
using testing::TempDir;

constexpr std::uintmax_t kMinBytes = 1024;

class MergeExecutorTest : public ::testing::Test {
   protected:
	MergeExecutor executor() {
		return MergeExecutor(FragmentScanner(dir.path(), RecordingNames()),
							 tool, kMinBytes);
	}

	TempDir dir;
	FakeMergeTool tool;
};

TEST_F(MergeExecutorTest, MergesPairIntoCanonicalFile) {
	dir.touch("Recording_02.fhls-2400.mp4");
	dir.touch("Recording_02.fhls-audio-high-Original.mp4");

	auto res = executor().reconcile();
	ASSERT_TRUE(res);

	EXPECT_EQ(dir.filenames(), std::vector<std::string>{"Recording_02.mp4"});
	ASSERT_EQ(tool.calls.size(), 1u);
	EXPECT_EQ(tool.calls[0].video.filename().string(),
			  "Recording_02.fhls-2400.mp4");
	EXPECT_EQ(tool.calls[0].audio.filename().string(),
			  "Recording_02.fhls-audio-high-Original.mp4");

	const auto *entry = res.value().find(2);
	ASSERT_NE(entry, nullptr);
	EXPECT_EQ(entry->status, MergeStatus::merged);
}

TEST_F(MergeExecutorTest, LeavesVideoOnlyRecordingUntouched) {
	dir.touch("Recording_05.fhls-2400.mp4");

	auto res = executor().reconcile();
	ASSERT_TRUE(res);

	EXPECT_EQ(dir.filenames(),
			  std::vector<std::string>{"Recording_05.fhls-2400.mp4"});
	EXPECT_TRUE(tool.calls.empty());

	const auto *entry = res.value().find(5);
	ASSERT_NE(entry, nullptr);
	EXPECT_EQ(entry->status, MergeStatus::not_mergeable);
	EXPECT_EQ(entry->reason, make_error_code(errc::audio_missing));
	EXPECT_EQ(entry->reason.message(), "Video only, no audio file found");
}

TEST_F(MergeExecutorTest, ToolFailureKeepsFragments) {
	dir.touch("Recording_09.fhls-2400.mp4");
	dir.touch("Recording_09.fhls-audio-high-Original.mp4");
	tool.failing = {9};
	tool.failed_output_bytes = 10;	// truncated partial output

	auto res = executor().reconcile();
	ASSERT_TRUE(res);

	EXPECT_EQ(dir.filenames(),
			  (std::vector<std::string>{
				  "Recording_09.fhls-2400.mp4",
				  "Recording_09.fhls-audio-high-Original.mp4"}));

	const auto *entry = res.value().find(9);
	ASSERT_NE(entry, nullptr);
	EXPECT_EQ(entry->status, MergeStatus::failed);
	EXPECT_EQ(entry->reason, make_error_code(errc::merge_failed));
	EXPECT_EQ(res.value().count(MergeStatus::failed), 1);
}

TEST_F(MergeExecutorTest, UndersizedOutputIsDiscarded) {
	dir.touch("Recording_03.fhls-2400.mp4");
	dir.touch("Recording_03.fhls-audio-high-Original.mp4");
	tool.output_bytes = kMinBytes;	// at the floor is still too small

	auto res = executor().reconcile();
	ASSERT_TRUE(res);

	EXPECT_FALSE(dir.exists("Recording_03.mp4"));
	EXPECT_TRUE(dir.exists("Recording_03.fhls-2400.mp4"));
	EXPECT_TRUE(dir.exists("Recording_03.fhls-audio-high-Original.mp4"));
	EXPECT_EQ(res.value().find(3)->reason,
			  make_error_code(errc::merge_output_invalid));
}

TEST_F(MergeExecutorTest, SecondRunIsANoOp) {
	dir.touch("Recording_02.fhls-2400.mp4");
	dir.touch("Recording_02.fhls-audio-high-Original.mp4");

	ASSERT_TRUE(executor().reconcile());
	auto after_first = dir.filenames();
	ASSERT_EQ(tool.calls.size(), 1u);

	auto second = executor().reconcile();
	ASSERT_TRUE(second);
	EXPECT_EQ(dir.filenames(), after_first);
	EXPECT_EQ(tool.calls.size(), 1u);
	EXPECT_EQ(second.value().count(MergeStatus::merged), 0);
}

TEST_F(MergeExecutorTest, RetryAfterFailureMakesTheSameChoice) {
	dir.touch("Recording_04.fhls-1200.mp4");
	dir.touch("Recording_04.fhls-2400.mp4");
	dir.touch("Recording_04.fhls-audio-high-English.mp4");
	dir.touch("Recording_04.fhls-audio-high-Original.mp4");
	tool.failing = {4};

	ASSERT_TRUE(executor().reconcile());
	tool.failing.clear();
	ASSERT_TRUE(executor().reconcile());

	ASSERT_EQ(tool.calls.size(), 2u);
	EXPECT_EQ(tool.calls[0].video, tool.calls[1].video);
	EXPECT_EQ(tool.calls[0].audio, tool.calls[1].audio);
	EXPECT_EQ(tool.calls[1].video.filename().string(),
			  "Recording_04.fhls-2400.mp4");

	EXPECT_EQ(dir.filenames(), std::vector<std::string>{"Recording_04.mp4"});
}

TEST_F(MergeExecutorTest, MergeRemovesUnselectedVariants) {
	dir.touch("Recording_02.fhls-1200.mp4");
	dir.touch("Recording_02.fhls-2400.mp4");
	dir.touch("Recording_02.fhls-audio-high-English.mp4");
	dir.touch("Recording_02.fhls-audio-high-Original.mp4");

	auto first = executor().reconcile();
	ASSERT_TRUE(first);
	EXPECT_EQ(first.value().find(2)->status, MergeStatus::merged);
	EXPECT_EQ(dir.filenames(), std::vector<std::string>{"Recording_02.mp4"});

	auto second = executor().reconcile();
	ASSERT_TRUE(second);
	EXPECT_EQ(tool.calls.size(), 1u);
	EXPECT_TRUE(second.value().entries.empty());
	EXPECT_EQ(dir.filenames(), std::vector<std::string>{"Recording_02.mp4"});
}

TEST_F(MergeExecutorTest, MergeKeepsVariantStillBeingDownloaded) {
	dir.touch("Recording_02.fhls-2400.mp4");
	dir.touch("Recording_02.fhls-audio-high-Original.mp4");
	dir.touch("Recording_02.fhls-audio-high-English.mp4");
	dir.touch("Recording_02.fhls-audio-high-English.mp4.part");

	ASSERT_TRUE(executor().reconcile());

	EXPECT_EQ(dir.filenames(),
			  (std::vector<std::string>{
				  "Recording_02.fhls-audio-high-English.mp4",
				  "Recording_02.fhls-audio-high-English.mp4.part",
				  "Recording_02.mp4"}));
}

TEST_F(MergeExecutorTest, LargePartialOutputOfFailedMergeIsRemoved) {
	dir.touch("Recording_09.fhls-2400.mp4");
	dir.touch("Recording_09.fhls-audio-high-Original.mp4");
	tool.failing = {9};
	tool.failed_output_bytes = 4 * kMinBytes;  // killed mid-write

	auto failed = executor().reconcile();
	ASSERT_TRUE(failed);
	EXPECT_EQ(failed.value().find(9)->status, MergeStatus::failed);
	EXPECT_FALSE(dir.exists("Recording_09.mp4"));

	FragmentScanner scanner(dir.path(), RecordingNames());
	EXPECT_FALSE(scanner.find_canonical(9).has_value());

	tool.failing.clear();
	auto retried = executor().reconcile();
	ASSERT_TRUE(retried);
	EXPECT_EQ(retried.value().find(9)->status, MergeStatus::merged);
	EXPECT_EQ(tool.calls.size(), 2u);
	EXPECT_EQ(dir.filenames(), std::vector<std::string>{"Recording_09.mp4"});
}

TEST_F(MergeExecutorTest, InProgressFragmentIsNeverConsumed) {
	dir.touch("Recording_06.fhls-2400.mp4");
	dir.touch("Recording_06.fhls-2400.mp4.part");
	dir.touch("Recording_06.fhls-audio-high-Original.mp4");

	auto res = executor().reconcile();
	ASSERT_TRUE(res);

	EXPECT_TRUE(tool.calls.empty());
	EXPECT_TRUE(dir.exists("Recording_06.fhls-2400.mp4"));
	EXPECT_TRUE(dir.exists("Recording_06.fhls-2400.mp4.part"));
	EXPECT_EQ(res.value().find(6)->reason,
			  make_error_code(errc::video_in_progress));
}

TEST_F(MergeExecutorTest, ExistingMergedFileShieldsFragments) {
	dir.touch("Recording_07.mp4", 2048);
	dir.touch("Recording_07.fhls-2400.mp4");
	dir.touch("Recording_07.fhls-audio-high-Original.mp4");

	auto res = executor().reconcile();
	ASSERT_TRUE(res);

	EXPECT_TRUE(tool.calls.empty());
	EXPECT_EQ(dir.filenames().size(), 3u);
	EXPECT_EQ(res.value().find(7)->status, MergeStatus::already_merged);
}

TEST_F(MergeExecutorTest, RemovesLeftoverTempFiles) {
	dir.touch("Recording_02.fhls-2400.mp4.ytdl");

	auto res = executor().reconcile();
	ASSERT_TRUE(res);

	EXPECT_TRUE(dir.filenames().empty());
	EXPECT_EQ(res.value().removed_temp_files.size(), 1u);
}

TEST_F(MergeExecutorTest, ScopedRunOnlyTouchesRequestedNumber) {
	for (int n : {1, 2}) {
		RecordingNames names;
		dir.touch(names.canonical_filename(n, "fhls-2400.mp4"));
		dir.touch(names.canonical_filename(n, "fhls-audio-high-Original.mp4"));
	}

	auto res = executor().reconcile(std::set<RecordingNumber>{2});
	ASSERT_TRUE(res);

	EXPECT_TRUE(dir.exists("Recording_02.mp4"));
	EXPECT_FALSE(dir.exists("Recording_01.mp4"));
	EXPECT_TRUE(dir.exists("Recording_01.fhls-2400.mp4"));
}

TEST_F(MergeExecutorTest, UnreadableDirectoryFails) {
	MergeExecutor broken(FragmentScanner(dir.path() / "gone", RecordingNames()),
						 tool, kMinBytes);
	auto res = broken.reconcile();
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error(), make_error_code(errc::output_dir_unusable));
}

}  // namespace
}  // namespace recfetch
