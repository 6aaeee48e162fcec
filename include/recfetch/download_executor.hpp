#pragma once

#include <recfetch/recfetch_export.h>

#include <filesystem>
#include <optional>
#include <string>
#include <recfetch/result.hpp>
#include <recfetch/types.hpp>

namespace recfetch {

struct RECFETCH_EXPORT DownloadRequest {
	RecordingNumber number = 0;
	std::string locator;
	std::optional<std::string> referer;	 // set for indirect embeds
	std::filesystem::path cookie_jar;
	std::filesystem::path output_template;	// e.g. dir/Recording_07.%(ext)s
};

/// Fetches the media of one recording into the output directory.
class RECFETCH_EXPORT DownloadExecutor {
   public:
	virtual ~DownloadExecutor() = default;

	// Fails with errc::download_failed on a nonzero exit,
	// errc::process_timed_out or errc::process_spawn_failed.
	virtual Result<void> download(const DownloadRequest &request) = 0;
};

}  // namespace recfetch
