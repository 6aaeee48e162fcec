#pragma once

#include <recfetch/recfetch_export.h>

#include <optional>
#include <string_view>
#include <recfetch/result.hpp>
#include <recfetch/types.hpp>

namespace recfetch {

class RECFETCH_EXPORT CandidateSelector {
   public:
	// Picks one video and one audio fragment from a group. Fails with
	// errc::audio_missing, errc::video_missing, errc::video_in_progress or
	// errc::audio_in_progress.
	[[nodiscard]] static Result<FragmentPair> select(const FragmentGroup &group);

	// "original" 3, "english" 2, any other label 1
	[[nodiscard]] static int audio_score(std::string_view suffix);

	// Trailing "-<digits>" of the suffix; nullopt ranks below every number.
	// Kept for compatibility with the downloader's naming; larger is not
	// guaranteed to mean better quality.
	[[nodiscard]] static std::optional<long long> video_score(
		std::string_view suffix);
};

}  // namespace recfetch
