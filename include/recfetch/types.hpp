#pragma once

#include <recfetch/recfetch_export.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace recfetch {

// Positive integer identifying one recorded session.
using RecordingNumber = int;

enum class StreamKind { video, audio };

// One single-stream file written by the downloader for a recording.
// Created by the download executor, deleted only after a verified merge.
struct RECFETCH_EXPORT MediaFragment {
	std::filesystem::path path;
	RecordingNumber number = 0;
	std::string variant_suffix;	 // e.g. "fhls-2400", "fhls-audio-high-Original"
	std::string extension;		 // without the dot
	StreamKind kind = StreamKind::video;
	bool has_in_progress_marker = false;  // sibling "<name>.part" exists

	[[nodiscard]] bool is_audio_candidate() const {
		return kind == StreamKind::audio;
	}
};

// All fragments of one recording, in directory-listing order.
struct RECFETCH_EXPORT FragmentGroup {
	RecordingNumber number = 0;
	std::vector<MediaFragment> videos;
	std::vector<MediaFragment> audios;
};

// The merged output file of a recording.
struct RECFETCH_EXPORT CanonicalRecording {
	RecordingNumber number = 0;
	std::filesystem::path path;
};

struct RECFETCH_EXPORT FragmentPair {
	MediaFragment video;
	MediaFragment audio;
};

enum class RunOutcome { succeeded, skipped, failed };

// How a media source was found on a recording page, in fallback order.
enum class ResolutionStep {
	video_element,
	iframe_embed,
	player_attribute,
	page_fallback
};

struct RECFETCH_EXPORT MediaSource {
	std::string locator;	// direct media address or a page address
	bool needs_referer = false;
	std::string page_url;  // originating page, sent as referer when needed
	ResolutionStep step = ResolutionStep::page_fallback;
};

}  // namespace recfetch
