#pragma once

#include <boost/outcome.hpp>
#include <system_error>

namespace recfetch {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// HTTP/Net errors
	request_failed = 10,
	invalid_url,
	too_many_redirects,

	// Session / environment
	credentials_missing = 20,
	login_failed,
	merge_tool_missing,
	output_dir_unusable,
	session_store_failed,

	// Per-item acquisition
	download_failed = 30,

	// Merge
	merge_failed = 40,
	merge_output_invalid,
	audio_missing,
	video_missing,
	video_in_progress,
	audio_in_progress,

	// Processes
	process_spawn_failed = 50,
	process_timed_out,

	// I/O and parsing
	file_open_failed = 60,
	file_write_failed,
	json_parse_error,
	invalid_number_format,
	invalid_config,

	unknown = 100
};

std::error_code make_error_code(errc e);

}  // namespace recfetch

namespace std {
template <>
struct is_error_code_enum<recfetch::errc> : true_type {};
}  // namespace std

namespace recfetch {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace recfetch
