#pragma once

#include <recfetch/recfetch_export.h>

#include <boost/program_options.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <recfetch/result.hpp>

namespace recfetch {

struct RECFETCH_EXPORT Credentials {
	std::string email;
	std::string password;
};

struct RECFETCH_EXPORT Config {
	Credentials credentials;
	std::string base_url =
		"https://www.codecademy.com/bootcamps/fullstack-8/recordings";
	std::filesystem::path output_directory = "downloads";
	std::filesystem::path merge_tool_path = "ffmpeg";
	std::filesystem::path downloader_path = "yt-dlp";
	// Holds cookies.json and the exported Netscape cookie jar
	std::filesystem::path session_directory = ".";
	std::string file_prefix = "Recording_";

	bool force_redownload = false;
	bool allow_unmerged_output = false;
	bool headless = false;

	std::chrono::seconds download_timeout{6 * 60 * 60};
	std::chrono::seconds merge_timeout{60 * 60};
	std::chrono::seconds http_timeout{60};
	std::uintmax_t min_merged_bytes = 1000000;
};

// Settings accepted from a config file, RECFETCH_* environment variables
// and the command line.
RECFETCH_EXPORT boost::program_options::options_description
settings_description();

// "RECFETCH_BASE_URL" -> "base-url"; empty for unrelated variables.
RECFETCH_EXPORT std::string map_environment_name(const std::string &name);

// Adds the environment and the INI-style file to `vm`. Values already in
// `vm` (from the command line) take precedence. A missing file is skipped
// unless `file_required` is set.
RECFETCH_EXPORT Result<void> store_layered_settings(
	const boost::program_options::options_description &settings,
	const std::filesystem::path &config_file, bool file_required,
	boost::program_options::variables_map &vm);

// Builds a Config from parsed settings; unset settings keep their defaults.
RECFETCH_EXPORT Result<Config> config_from_variables(
	const boost::program_options::variables_map &vm);

// Rejects empty credentials and the placeholder address from the docs.
RECFETCH_EXPORT Result<void> validate_credentials(
	const Credentials &credentials);

}  // namespace recfetch
