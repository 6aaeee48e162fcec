#include "ytdlp_executor.hpp"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <utility>

#include "process/process_runner.hpp"
#include "utils.hpp"

namespace recfetch::downloader {

YtDlpExecutor::YtDlpExecutor(
	std::filesystem::path yt_dlp,
	std::optional<std::filesystem::path> ffmpeg_location,
	std::chrono::seconds timeout)
	: yt_dlp_(std::move(yt_dlp)),
	  ffmpeg_location_(std::move(ffmpeg_location)),
	  timeout_(timeout) {}

std::vector<std::string> YtDlpExecutor::arguments(
	const DownloadRequest &request) const {
	// clang-format off
	std::vector<std::string> args = {
		"--cookies", request.cookie_jar.string(),
		"-o", request.output_template.string(),
		"--progress",
		"--newline",
		"-f", "bv*+ba/b",				// best video + best audio, else best
		"--merge-output-format", "mp4",
		"--retries", "3",
	};
	// clang-format on
	if (ffmpeg_location_) {
		args.emplace_back("--ffmpeg-location");
		args.push_back(ffmpeg_location_->string());
	}
	if (request.referer) {
		args.emplace_back("--referer");
		args.push_back(*request.referer);
	}
	args.push_back(request.locator);
	return args;
}

Result<void> YtDlpExecutor::download(const DownloadRequest &request) {
	auto args = arguments(request);
	spdlog::info("  Downloading with yt-dlp...");
	spdlog::info("  URL: {}", utils::truncate(request.locator, 80));
	if (request.referer) spdlog::info("  Referer: {}", *request.referer);
	spdlog::debug("yt-dlp command line: {} {}", yt_dlp_.string(),
				  fmt::join(args, " "));

	process::RunOptions opts;
	opts.timeout = timeout_;

	auto res = process::run(yt_dlp_, args, opts);
	if (!res) {
		spdlog::error("  Cannot start yt-dlp: {}", res.error().message());
		return res.error();
	}

	const auto &run = res.value();
	if (run.timed_out) {
		spdlog::error("  Download timed out after {}s", timeout_.count());
		return outcome::failure(errc::process_timed_out);
	}
	if (run.exit_code != 0) {
		spdlog::error("  yt-dlp exited with code {}", run.exit_code);
		return outcome::failure(errc::download_failed);
	}
	return outcome::success();
}

}  // namespace recfetch::downloader
