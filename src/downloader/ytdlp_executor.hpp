#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <recfetch/download_executor.hpp>

namespace recfetch::downloader {

// Hands each recording to the yt-dlp command line tool. Progress goes
// straight to the terminal.
class YtDlpExecutor : public DownloadExecutor {
   public:
	YtDlpExecutor(std::filesystem::path yt_dlp,
				  std::optional<std::filesystem::path> ffmpeg_location,
				  std::chrono::seconds timeout);

	Result<void> download(const DownloadRequest &request) override;

	[[nodiscard]] std::vector<std::string> arguments(
		const DownloadRequest &request) const;

   private:
	std::filesystem::path yt_dlp_;
	std::optional<std::filesystem::path> ffmpeg_location_;
	std::chrono::seconds timeout_;
};

}  // namespace recfetch::downloader
