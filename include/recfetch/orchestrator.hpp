#pragma once

#include <recfetch/recfetch_export.h>

#include <atomic>
#include <recfetch/config.hpp>
#include <recfetch/download_executor.hpp>
#include <recfetch/fragment_scanner.hpp>
#include <recfetch/merge_executor.hpp>
#include <recfetch/merge_tool.hpp>
#include <recfetch/result.hpp>
#include <recfetch/run_report.hpp>
#include <recfetch/session_provider.hpp>

namespace recfetch {

/// Drives one run over a range of recordings.
///
/// Items are processed one at a time in ascending order. A failed item is
/// recorded and the run moves on; only environment failures found before
/// any work starts (no merge tool, bad credentials, unusable output
/// directory) end the run early with an error.
class RECFETCH_EXPORT Orchestrator {
   public:
	Orchestrator(Config config, SessionProvider &session,
				 DownloadExecutor &downloader, MergeTool &merge_tool);

	Result<RunReport> run(RecordingNumber first, RecordingNumber last);

	// Reconciles the whole output directory without downloading anything.
	Result<ReconcileSummary> merge_only();

	// Safe to call from another thread. The current item is finished, the
	// rest are recorded as failed.
	void request_stop() noexcept { stop_requested_.store(true); }
	[[nodiscard]] bool stop_requested() const noexcept {
		return stop_requested_.load();
	}

	[[nodiscard]] const Config &config() const { return config_; }

   private:
	Result<void> prepare_output_directory();
	bool probe_merge_tool();
	RunOutcome process(RecordingNumber number);
	void finish_run();
	MergeExecutor merge_executor();

	Config config_;
	SessionProvider &session_;
	DownloadExecutor &downloader_;
	MergeTool &merge_tool_;
	FragmentScanner scanner_;
	bool merge_available_ = false;
	std::atomic<bool> stop_requested_{false};
};

}  // namespace recfetch
