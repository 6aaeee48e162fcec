#pragma once

#include <boost/algorithm/string.hpp>
#include <boost/charconv.hpp>
#include <boost/regex.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <recfetch/types.hpp>

namespace recfetch {

namespace detail {
constexpr std::size_t NUMBER_PAD_WIDTH = 2;

inline std::string regex_escape(std::string_view s) {
	static const std::string special = R"(\^$.|?*+()[]{})";
	std::string out;
	for (char c : s) {
		if (special.find(c) != std::string::npos) out += '\\';
		out += c;
	}
	return out;
}
}  // namespace detail

// What a directory entry is, decided once from its name.
enum class NameKind {
	unrelated,
	canonical,			 // <prefix><NN>.<mp4|mkv|webm>
	fragment,			 // <prefix><NN>.<suffix>.<ext>
	in_progress_marker,	 // <fragment name>.part
	temp_state			 // *.ytdl
};

struct ParsedName {
	NameKind kind = NameKind::unrelated;
	RecordingNumber number = 0;
	std::string variant_suffix;
	std::string extension;
	std::string marked_name;  // in_progress_marker: the file being written
};

/// Naming scheme of one output directory: "<prefix><NN>.mp4" for merged
/// recordings, "<prefix><NN>.<suffix>.<ext>" for downloader fragments.
class RecordingNames {
   public:
	explicit RecordingNames(std::string prefix = "Recording_")
		: prefix_(std::move(prefix)),
		  split_re_("^" + detail::regex_escape(prefix_) +
					R"((\d+)\.(.+)\.([A-Za-z0-9]+)$)"),
		  merged_re_("^" + detail::regex_escape(prefix_) +
					 R"((\d+)\.([A-Za-z0-9]+)$)") {}

	[[nodiscard]] const std::string &prefix() const { return prefix_; }

	// "Recording_07.mp4"
	[[nodiscard]] std::string canonical_filename(
		RecordingNumber number, std::string_view ext = "mp4") const {
		std::string digits = std::to_string(number);
		if (digits.size() < detail::NUMBER_PAD_WIDTH) {
			digits.insert(0, detail::NUMBER_PAD_WIDTH - digits.size(), '0');
		}
		return prefix_ + digits + "." + std::string(ext);
	}

	// yt-dlp output template: "Recording_07.%(ext)s"
	[[nodiscard]] std::string output_template(RecordingNumber number) const {
		return canonical_filename(number, "%(ext)s");
	}

	[[nodiscard]] static bool is_canonical_extension(std::string_view ext) {
		auto e = boost::algorithm::to_lower_copy(std::string(ext));
		return e == "mp4" || e == "mkv" || e == "webm";
	}

	[[nodiscard]] static bool is_audio_extension(std::string_view ext) {
		auto e = boost::algorithm::to_lower_copy(std::string(ext));
		return e == "m4a" || e == "aac" || e == "mp3" || e == "opus" ||
			   e == "ogg" || e == "wav";
	}

	// Audio if the suffix mentions "audio" or the extension is an audio one.
	[[nodiscard]] static StreamKind classify(std::string_view suffix,
											 std::string_view ext) {
		if (boost::algorithm::icontains(std::string(suffix), "audio")) {
			return StreamKind::audio;
		}
		return is_audio_extension(ext) ? StreamKind::audio : StreamKind::video;
	}

	[[nodiscard]] ParsedName parse(const std::string &filename) const {
		ParsedName parsed;

		if (boost::algorithm::ends_with(filename, ".ytdl")) {
			parsed.kind = NameKind::temp_state;
			return parsed;
		}

		// "x.mp4.part" and yt-dlp's fragment parts "x.mp4.part-Frag12"
		auto part_pos = filename.rfind(".part");
		if (part_pos != std::string::npos && part_pos > 0) {
			auto tail = std::string_view(filename).substr(part_pos);
			if (tail == ".part" || tail.substr(0, 10) == ".part-Frag") {
				parsed.kind = NameKind::in_progress_marker;
				parsed.marked_name = filename.substr(0, part_pos);
				return parsed;
			}
		}

		boost::smatch m;
		if (boost::regex_match(filename, m, split_re_)) {
			if (!parse_number(m[1].str(), parsed.number)) return {};
			parsed.kind = NameKind::fragment;
			parsed.variant_suffix = m[2].str();
			parsed.extension = m[3].str();
			return parsed;
		}

		if (boost::regex_match(filename, m, merged_re_)) {
			if (!parse_number(m[1].str(), parsed.number)) return {};
			parsed.extension = m[2].str();
			// A bare "<prefix><NN>.m4a" is an unsuffixed audio fragment: only
			// a container extension marks a merged recording.
			parsed.kind = is_canonical_extension(parsed.extension)
							  ? NameKind::canonical
							  : NameKind::fragment;
			return parsed;
		}

		return parsed;
	}

   private:
	static bool parse_number(const std::string &digits, RecordingNumber &out) {
		RecordingNumber val{};
		auto res = boost::charconv::from_chars(
			digits.data(), digits.data() + digits.size(), val);
		if (res.ec != std::errc{} || val <= 0) return false;
		out = val;
		return true;
	}

	std::string prefix_;
	boost::regex split_re_;
	boost::regex merged_re_;
};

}  // namespace recfetch
