#include "error.hpp"

#include <string>

namespace recfetch {

struct recfetch_error_category : std::error_category {
	const char *name() const noexcept override { return "recfetch"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::request_failed: return "Request failed";
			case errc::invalid_url: return "Invalid URL";
			case errc::too_many_redirects: return "Too many redirects";
			case errc::credentials_missing:
				return "Credentials not configured";
			case errc::login_failed: return "Login failed";
			case errc::merge_tool_missing: return "Merge tool not available";
			case errc::output_dir_unusable:
				return "Output directory unusable";
			case errc::session_store_failed:
				return "Could not store session cookies";
			case errc::download_failed: return "Download failed";
			case errc::merge_failed: return "Merge failed";
			case errc::merge_output_invalid:
				return "Merge produced an invalid file";
			case errc::audio_missing: return "Video only, no audio file found";
			case errc::video_missing: return "Audio only, no video file found";
			case errc::video_in_progress:
				return "Video still downloading (.part file exists)";
			case errc::audio_in_progress:
				return "Audio still downloading (.part file exists)";
			case errc::process_spawn_failed:
				return "Could not start external process";
			case errc::process_timed_out: return "External process timed out";
			case errc::file_open_failed: return "File open failed";
			case errc::file_write_failed: return "File write failed";
			case errc::json_parse_error: return "JSON parse error";
			case errc::invalid_number_format: return "Invalid number format";
			case errc::invalid_config: return "Invalid configuration";
			default: return "Unknown error";
		}
	}
};

const std::error_category &recfetch_category() {
	static recfetch_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), recfetch_category()};
}

}  // namespace recfetch
