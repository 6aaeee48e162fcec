#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <recfetch/ffmpeg_merge_tool.hpp>
#include <recfetch/fragment_scanner.hpp>
#include <recfetch/merge_executor.hpp>

using namespace recfetch;

// Reconciles the split audio/video files of one directory:
//   merge_directory <dir> [prefix]
int main(int argc, char *argv[]) {
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("recfetch", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::debug);

	if (argc < 2) {
		std::cerr << "Usage: merge_directory <dir> [prefix]\n";
		return 1;
	}
	std::filesystem::path dir = argv[1];
	RecordingNames names(argc > 2 ? argv[2] : "Recording_");

	FfmpegMergeTool ffmpeg;
	auto version = ffmpeg.probe();
	if (!version) {
		std::cerr << "ffmpeg not available: " << version.error().message()
				  << "\n";
		return 1;
	}
	std::cout << "Using " << version.value() << "\n";

	MergeExecutor executor(FragmentScanner(dir, names), ffmpeg);
	auto summary = executor.reconcile();
	if (!summary) {
		std::cerr << "Reconcile failed: " << summary.error().message() << "\n";
		return 1;
	}

	for (const auto &entry : summary.value().entries) {
		std::cout << names.canonical_filename(entry.number) << ": ";
		switch (entry.status) {
			case MergeStatus::merged: std::cout << "merged"; break;
			case MergeStatus::already_merged: std::cout << "already merged"; break;
			case MergeStatus::not_mergeable:
				std::cout << "skipped (" << entry.reason.message() << ")";
				break;
			case MergeStatus::failed:
				std::cout << "failed (" << entry.reason.message() << ")";
				break;
		}
		std::cout << "\n";
	}
	std::cout << "Removed " << summary.value().removed_temp_files.size()
			  << " temp files\n";
	return 0;
}
