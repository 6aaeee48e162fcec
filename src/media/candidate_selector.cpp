#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>
#include <recfetch/candidate_selector.hpp>
#include <recfetch/recording_names.hpp>

#include "utils.hpp"

namespace recfetch {

int CandidateSelector::audio_score(std::string_view suffix) {
	std::string s(suffix);
	// Prefer the source-language track over a dubbed one
	if (boost::algorithm::icontains(s, "original")) return 3;
	if (boost::algorithm::icontains(s, "english")) return 2;
	return 1;
}

std::optional<long long> CandidateSelector::video_score(
	std::string_view suffix) {
	static const boost::regex trailing_number(R"(-(\d+)$)");
	boost::match_results<std::string_view::const_iterator> m;
	if (!boost::regex_search(suffix.begin(), suffix.end(), m, trailing_number)) {
		return std::nullopt;
	}
	auto digits = std::string_view(&*m[1].first, m[1].length());
	auto value = utils::to_long(digits);
	if (!value) return std::nullopt;
	return value.value();
}

Result<FragmentPair> CandidateSelector::select(const FragmentGroup &group) {
	if (group.videos.empty() && group.audios.empty()) {
		return outcome::failure(errc::video_missing);
	}
	if (group.audios.empty()) return outcome::failure(errc::audio_missing);
	if (group.videos.empty()) return outcome::failure(errc::video_missing);

	// max_element keeps the first of equal candidates
	auto video = std::max_element(
		group.videos.begin(), group.videos.end(),
		[](const MediaFragment &a, const MediaFragment &b) {
			return video_score(a.variant_suffix) <
				   video_score(b.variant_suffix);
		});
	auto audio = std::max_element(
		group.audios.begin(), group.audios.end(),
		[](const MediaFragment &a, const MediaFragment &b) {
			return audio_score(a.variant_suffix) <
				   audio_score(b.variant_suffix);
		});

	spdlog::debug("Recording {:02d}: best video '{}', best audio '{}'",
				  group.number, video->variant_suffix, audio->variant_suffix);

	if (video->has_in_progress_marker) {
		return outcome::failure(errc::video_in_progress);
	}
	if (audio->has_in_progress_marker) {
		return outcome::failure(errc::audio_in_progress);
	}
	return FragmentPair{*video, *audio};
}

}  // namespace recfetch
