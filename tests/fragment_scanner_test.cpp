#include <gtest/gtest.h>

#include <recfetch/fragment_scanner.hpp>

#include "test_support.hpp"

namespace recfetch {
namespace {

using testing::TempDir;

TEST(FragmentScannerTest, GroupsFragmentsByNumberAndKind) {
	TempDir dir;
	dir.touch("Recording_02.fhls-2400.mp4");
	dir.touch("Recording_02.fhls-1200.mp4");
	dir.touch("Recording_02.fhls-audio-high-Original.mp4");
	dir.touch("Recording_04.f140.m4a");
	dir.touch("unrelated.txt");

	FragmentScanner scanner(dir.path(), RecordingNames());
	auto res = scanner.scan();
	ASSERT_TRUE(res);
	const auto &groups = res.value().groups;
	ASSERT_EQ(groups.size(), 2u);

	const auto &two = groups.at(2);
	ASSERT_EQ(two.videos.size(), 2u);
	ASSERT_EQ(two.audios.size(), 1u);
	// Listing order is by file name
	EXPECT_EQ(two.videos[0].variant_suffix, "fhls-1200");
	EXPECT_EQ(two.videos[1].variant_suffix, "fhls-2400");
	EXPECT_EQ(two.audios[0].variant_suffix, "fhls-audio-high-Original");

	const auto &four = groups.at(4);
	EXPECT_TRUE(four.videos.empty());
	ASSERT_EQ(four.audios.size(), 1u);
	EXPECT_EQ(four.audios[0].extension, "m4a");
}

TEST(FragmentScannerTest, MergedFileEvictsStaleFragments) {
	TempDir dir;
	dir.touch("Recording_07.fhls-2400.mp4");
	dir.touch("Recording_07.fhls-audio-high-Original.mp4");
	dir.touch("Recording_07.mp4");
	dir.touch("Recording_08.fhls-2400.mp4");

	FragmentScanner scanner(dir.path(), RecordingNames());
	auto res = scanner.scan();
	ASSERT_TRUE(res);

	EXPECT_EQ(res.value().groups.count(7), 0u);
	EXPECT_EQ(res.value().groups.count(8), 1u);
	ASSERT_EQ(res.value().evicted.size(), 1u);
	EXPECT_EQ(res.value().evicted[0].number, 7);
	EXPECT_EQ(res.value().evicted[0].path.filename().string(),
			  "Recording_07.mp4");
}

TEST(FragmentScannerTest, MergedFileWithoutFragmentsIsNotReported) {
	TempDir dir;
	dir.touch("Recording_03.mp4");

	FragmentScanner scanner(dir.path(), RecordingNames());
	auto res = scanner.scan();
	ASSERT_TRUE(res);
	EXPECT_TRUE(res.value().groups.empty());
	EXPECT_TRUE(res.value().evicted.empty());
}

TEST(FragmentScannerTest, FilterRestrictsToRequestedNumbers) {
	TempDir dir;
	dir.touch("Recording_01.fhls-2400.mp4");
	dir.touch("Recording_02.fhls-2400.mp4");
	dir.touch("Recording_03.fhls-2400.mp4");

	FragmentScanner scanner(dir.path(), RecordingNames());
	auto res = scanner.scan(std::set<RecordingNumber>{2});
	ASSERT_TRUE(res);
	ASSERT_EQ(res.value().groups.size(), 1u);
	EXPECT_EQ(res.value().groups.begin()->first, 2);
}

TEST(FragmentScannerTest, FlagsFragmentsStillBeingWritten) {
	TempDir dir;
	dir.touch("Recording_05.fhls-2400.mp4");
	dir.touch("Recording_05.fhls-2400.mp4.part");
	dir.touch("Recording_05.fhls-audio-high-English.mp4");

	FragmentScanner scanner(dir.path(), RecordingNames());
	auto res = scanner.scan();
	ASSERT_TRUE(res);
	const auto &group = res.value().groups.at(5);
	ASSERT_EQ(group.videos.size(), 1u);
	EXPECT_TRUE(group.videos[0].has_in_progress_marker);
	ASSERT_EQ(group.audios.size(), 1u);
	EXPECT_FALSE(group.audios[0].has_in_progress_marker);
}

TEST(FragmentScannerTest, CollectsTempStateFiles) {
	TempDir dir;
	dir.touch("Recording_05.fhls-2400.mp4.ytdl");

	FragmentScanner scanner(dir.path(), RecordingNames());
	auto res = scanner.scan();
	ASSERT_TRUE(res);
	ASSERT_EQ(res.value().temp_files.size(), 1u);
	EXPECT_EQ(res.value().temp_files[0].filename().string(),
			  "Recording_05.fhls-2400.mp4.ytdl");
	EXPECT_TRUE(res.value().groups.empty());
}

TEST(FragmentScannerTest, MissingDirectoryIsAnError) {
	TempDir dir;
	FragmentScanner scanner(dir.path() / "missing", RecordingNames());
	auto res = scanner.scan();
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error(), make_error_code(errc::output_dir_unusable));
}

TEST(FragmentScannerTest, FindsMergedFileWhateverTheContainer) {
	TempDir dir;
	dir.touch("Recording_09.mkv");
	dir.touch("Recording_10.fhls-2400.mp4");

	FragmentScanner scanner(dir.path(), RecordingNames());
	auto nine = scanner.find_canonical(9);
	ASSERT_TRUE(nine.has_value());
	EXPECT_EQ(nine->filename().string(), "Recording_09.mkv");
	EXPECT_FALSE(scanner.find_canonical(10).has_value());
}

}  // namespace
}  // namespace recfetch
