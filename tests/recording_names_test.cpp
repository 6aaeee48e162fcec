#include <gtest/gtest.h>

#include <recfetch/recording_names.hpp>

namespace recfetch {
namespace {

TEST(RecordingNamesTest, CanonicalFilenameIsZeroPadded) {
	RecordingNames names;
	EXPECT_EQ(names.canonical_filename(7), "Recording_07.mp4");
	EXPECT_EQ(names.canonical_filename(42), "Recording_42.mp4");
	EXPECT_EQ(names.canonical_filename(123), "Recording_123.mp4");
	EXPECT_EQ(names.canonical_filename(3, "mkv"), "Recording_03.mkv");
}

TEST(RecordingNamesTest, OutputTemplateKeepsDownloaderPlaceholder) {
	RecordingNames names;
	EXPECT_EQ(names.output_template(5), "Recording_05.%(ext)s");
}

TEST(RecordingNamesTest, ParsesFragmentWithDottedSuffix) {
	RecordingNames names;
	auto p = names.parse("Recording_02.fhls-audio-high.Original.m4a");
	EXPECT_EQ(p.kind, NameKind::fragment);
	EXPECT_EQ(p.number, 2);
	EXPECT_EQ(p.variant_suffix, "fhls-audio-high.Original");
	EXPECT_EQ(p.extension, "m4a");
}

TEST(RecordingNamesTest, ParsesCanonicalNames) {
	RecordingNames names;

	auto mp4 = names.parse("Recording_02.mp4");
	EXPECT_EQ(mp4.kind, NameKind::canonical);
	EXPECT_EQ(mp4.number, 2);

	auto mkv = names.parse("Recording_11.mkv");
	EXPECT_EQ(mkv.kind, NameKind::canonical);
	EXPECT_EQ(mkv.number, 11);

	// Padding is not required to recognize a merged file
	EXPECT_EQ(names.parse("Recording_7.webm").number, 7);
}

TEST(RecordingNamesTest, BareAudioFileIsAnUnsuffixedFragment) {
	RecordingNames names;
	auto p = names.parse("Recording_05.m4a");
	EXPECT_EQ(p.kind, NameKind::fragment);
	EXPECT_EQ(p.number, 5);
	EXPECT_TRUE(p.variant_suffix.empty());
}

TEST(RecordingNamesTest, ExtensionsMatchCaseInsensitively) {
	RecordingNames names;
	EXPECT_EQ(names.parse("Recording_02.MP4").kind, NameKind::canonical);

	auto audio = names.parse("Recording_03.M4A");
	EXPECT_EQ(audio.kind, NameKind::fragment);
	EXPECT_EQ(RecordingNames::classify(audio.variant_suffix, audio.extension),
			  StreamKind::audio);
}

TEST(RecordingNamesTest, RecognizesInProgressMarkers) {
	RecordingNames names;

	auto part = names.parse("Recording_02.fhls-2400.mp4.part");
	EXPECT_EQ(part.kind, NameKind::in_progress_marker);
	EXPECT_EQ(part.marked_name, "Recording_02.fhls-2400.mp4");

	auto frag = names.parse("Recording_02.fhls-2400.mp4.part-Frag17");
	EXPECT_EQ(frag.kind, NameKind::in_progress_marker);
	EXPECT_EQ(frag.marked_name, "Recording_02.fhls-2400.mp4");
}

TEST(RecordingNamesTest, RecognizesTempStateFiles) {
	RecordingNames names;
	EXPECT_EQ(names.parse("Recording_02.fhls-2400.mp4.ytdl").kind,
			  NameKind::temp_state);
}

TEST(RecordingNamesTest, IgnoresUnrelatedFiles) {
	RecordingNames names;
	EXPECT_EQ(names.parse("notes.txt").kind, NameKind::unrelated);
	EXPECT_EQ(names.parse("Lecture_02.mp4").kind, NameKind::unrelated);
	EXPECT_EQ(names.parse("Recording_.mp4").kind, NameKind::unrelated);
	// Recording numbers start at 1
	EXPECT_EQ(names.parse("Recording_00.mp4").kind, NameKind::unrelated);
}

TEST(RecordingNamesTest, PrefixIsMatchedLiterally) {
	RecordingNames names("Rec.(a)_");
	EXPECT_EQ(names.parse("Rec.(a)_04.mp4").kind, NameKind::canonical);
	EXPECT_EQ(names.parse("RecX(a)_04.mp4").kind, NameKind::unrelated);
}

TEST(RecordingNamesTest, ClassifiesAudioBySuffixOrExtension) {
	EXPECT_EQ(RecordingNames::classify("fhls-AUDIO-high", "mp4"),
			  StreamKind::audio);
	EXPECT_EQ(RecordingNames::classify("f140", "m4a"), StreamKind::audio);
	EXPECT_EQ(RecordingNames::classify("", "opus"), StreamKind::audio);
	EXPECT_EQ(RecordingNames::classify("fhls-2400", "mp4"), StreamKind::video);
	EXPECT_EQ(RecordingNames::classify("f137", "webm"), StreamKind::video);
}

}  // namespace
}  // namespace recfetch
