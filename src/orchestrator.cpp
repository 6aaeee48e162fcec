#include <spdlog/spdlog.h>

#include <recfetch/orchestrator.hpp>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace recfetch {

Orchestrator::Orchestrator(Config config, SessionProvider &session,
						   DownloadExecutor &downloader, MergeTool &merge_tool)
	: config_(std::move(config)),
	  session_(session),
	  downloader_(downloader),
	  merge_tool_(merge_tool),
	  scanner_(config_.output_directory, RecordingNames(config_.file_prefix)) {
}

MergeExecutor Orchestrator::merge_executor() {
	return MergeExecutor(scanner_, merge_tool_, config_.min_merged_bytes);
}

Result<void> Orchestrator::prepare_output_directory() {
	std::error_code ec;
	fs::create_directories(config_.output_directory, ec);
	if (ec || !fs::is_directory(config_.output_directory, ec)) {
		spdlog::error("Cannot use output directory {}: {}",
					  config_.output_directory.string(), ec.message());
		return outcome::failure(errc::output_dir_unusable);
	}
	spdlog::info("Output directory: {}",
				 fs::absolute(config_.output_directory, ec).string());
	return outcome::success();
}

bool Orchestrator::probe_merge_tool() {
	auto version = merge_tool_.probe();
	if (!version) {
		spdlog::warn("  ffmpeg not found - split video/audio files won't be "
					 "merged automatically");
		return false;
	}
	spdlog::info("  ffmpeg found: {}", version.value());
	return true;
}

Result<ReconcileSummary> Orchestrator::merge_only() {
	spdlog::info("[0/4] Checking dependencies...");
	merge_available_ = probe_merge_tool();

	if (auto dir = prepare_output_directory(); !dir) return dir.error();

	if (!merge_available_) {
		spdlog::error("Cannot merge files without ffmpeg installed!");
		return outcome::failure(errc::merge_tool_missing);
	}
	return merge_executor().reconcile();
}

Result<RunReport> Orchestrator::run(RecordingNumber first,
									RecordingNumber last) {
	if (first <= 0 || last < first) {
		spdlog::error("Invalid recording range {}..{}", first, last);
		return outcome::failure(errc::invalid_config);
	}

	spdlog::info("[0/4] Checking dependencies...");
	merge_available_ = probe_merge_tool();

	if (auto dir = prepare_output_directory(); !dir) return dir.error();

	// Best-quality streams usually arrive split, so without a merge tool
	// the run would leave unplayable halves behind.
	if (!merge_available_ && !config_.allow_unmerged_output) {
		spdlog::error("ffmpeg is required for normal downloads");
		spdlog::error(
			"  Install ffmpeg, or re-run with --allow-split to keep separate "
			"audio/video files");
		return outcome::failure(errc::merge_tool_missing);
	}

	if (auto opened = session_.open(); !opened) {
		spdlog::error("Login failed! Please check your credentials.");
		return opened.error();
	}

	RunReport report;
	int total = last - first + 1;
	spdlog::info("[3/4] Downloading recordings {} to {}...", first, last);

	for (RecordingNumber number = first; number <= last; ++number) {
		if (stop_requested()) {
			if (!report.interrupted()) {
				spdlog::warn("Stop requested, not starting recording {}",
							 number);
			}
			report.mark_interrupted();
			report.record(number, RunOutcome::failed);
			continue;
		}
		spdlog::info("");
		spdlog::info("--- Recording {} ({}/{}) ---", number,
					 number - first + 1, total);
		report.record(number, process(number));
	}

	spdlog::info("[4/4] Finishing up...");
	finish_run();
	return report;
}

RunOutcome Orchestrator::process(RecordingNumber number) {
	if (!config_.force_redownload && scanner_.find_canonical(number)) {
		spdlog::info(
			"  Already downloaded, skipping (use --force to re-download)");
		return RunOutcome::skipped;
	}

	spdlog::info("  Extracting video from recording page...");
	auto source = session_.resolve_media_source(number);
	if (!source || source->locator.empty()) {
		spdlog::warn("  Could not find video URL");
		return RunOutcome::failed;
	}

	DownloadRequest request;
	request.number = number;
	request.locator = source->locator;
	if (source->needs_referer) request.referer = source->page_url;
	request.cookie_jar = session_.cookie_jar_path();
	request.output_template =
		config_.output_directory / scanner_.names().output_template(number);

	if (auto downloaded = downloader_.download(request); !downloaded) {
		spdlog::error("  Download failed for recording {}: {}", number,
					  downloaded.error().message());
		return RunOutcome::failed;
	}
	spdlog::info("  Download complete");

	// Finalize now so an interrupted run keeps what it already fetched.
	// The outcome of this merge does not change the item's result.
	if (merge_available_) {
		auto merged = merge_executor().reconcile(std::set{number});
		if (!merged) {
			spdlog::warn("  Could not reconcile recording {}: {}", number,
						 merged.error().message());
		}
	}
	return RunOutcome::succeeded;
}

void Orchestrator::finish_run() {
	if (!merge_available_) {
		spdlog::info("Checking for ffmpeg again before the final merge...");
		merge_available_ = probe_merge_tool();
	}

	if (merge_available_) {
		auto merged = merge_executor().reconcile();
		if (!merged) {
			spdlog::warn("Final merge pass failed: {}",
						 merged.error().message());
		}
		return;
	}

	if (!config_.allow_unmerged_output) return;

	auto scanned = scanner_.scan();
	if (!scanned) {
		spdlog::warn("Cannot scan {} for split files: {}",
					 config_.output_directory.string(),
					 scanned.error().message());
		return;
	}

	size_t fragments = 0;
	for (const auto &[number, group] : scanned.value().groups) {
		fragments += group.videos.size() + group.audios.size();
	}
	if (fragments == 0) return;

	spdlog::warn("NOTE: Split audio/video files detected!");
	spdlog::warn("  {} split files found that need merging.", fragments);
	spdlog::warn("  Install ffmpeg and run: rec-fetch --merge");
}

}  // namespace recfetch
