#include <recfetch/ffmpeg_merge_tool.hpp>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <utility>

#include "process/process_runner.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace recfetch {

namespace {
constexpr auto kProbeTimeout = std::chrono::seconds(30);
constexpr size_t kVersionLineLength = 60;
constexpr size_t kStderrExcerptLength = 200;
}  // namespace

FfmpegMergeTool::FfmpegMergeTool(fs::path ffmpeg, std::chrono::seconds timeout)
	: ffmpeg_(std::move(ffmpeg)), timeout_(timeout) {}

Result<std::string> FfmpegMergeTool::probe() {
	process::RunOptions opts;
	opts.timeout = kProbeTimeout;
	opts.capture_output = true;

	auto res = process::run(ffmpeg_, {"-version"}, opts);
	if (!res || !res.value().ok()) {
		return outcome::failure(errc::merge_tool_missing);
	}

	auto version = utils::first_line(res.value().std_out, kVersionLineLength);
	if (version.empty()) version = "unknown";
	return version;
}

std::vector<std::string> FfmpegMergeTool::merge_arguments(
	const fs::path &video, const fs::path &audio, const fs::path &output) {
	// clang-format off
	return {
		"-y",					// overwrite output
		"-hide_banner",
		"-loglevel", "error",
		"-i", video.string(),
		"-i", audio.string(),
		"-map", "0:v:0",
		"-map", "1:a:0",
		"-c:v", "copy",			// no video re-encoding
		"-c:a", "aac",			// AAC for player compatibility
		"-b:a", "192k",
		"-strict", "experimental",
		"-shortest",
		"-movflags", "+faststart",
		output.string(),
	};
	// clang-format on
}

Result<void> FfmpegMergeTool::merge(const fs::path &video, const fs::path &audio,
									const fs::path &output) {
	auto args = merge_arguments(video, audio, output);
	spdlog::debug("ffmpeg command line: {} {}", ffmpeg_.string(),
				  fmt::join(args, " "));

	process::RunOptions opts;
	opts.timeout = timeout_;
	opts.capture_output = true;

	auto res = process::run(ffmpeg_, args, opts);
	if (!res) return res.error();

	const auto &run = res.value();
	if (run.timed_out) return outcome::failure(errc::process_timed_out);
	if (run.exit_code != 0) {
		spdlog::error(
			"    ffmpeg exited with code {}: {}", run.exit_code,
			run.std_err.empty()
				? std::string("Unknown error")
				: utils::truncate(run.std_err, kStderrExcerptLength));
		return outcome::failure(errc::merge_failed);
	}
	return outcome::success();
}

}  // namespace recfetch
