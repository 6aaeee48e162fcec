#pragma once

#include <recfetch/recfetch_export.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>
#include <recfetch/fragment_scanner.hpp>
#include <recfetch/merge_tool.hpp>
#include <recfetch/result.hpp>
#include <recfetch/types.hpp>

namespace recfetch {

// Merged files at or below this size are treated as truncated.
constexpr std::uintmax_t kDefaultMinMergedBytes = 1000000;

enum class MergeStatus {
	merged,
	already_merged,	 // evicted by an existing merged file
	not_mergeable,	 // see reason: missing stream or download in progress
	failed			 // merge tool error or bogus output; fragments kept
};

struct RECFETCH_EXPORT MergeEntry {
	RecordingNumber number = 0;
	MergeStatus status = MergeStatus::not_mergeable;
	std::error_code reason;
	std::filesystem::path output;
};

struct RECFETCH_EXPORT ReconcileSummary {
	std::vector<MergeEntry> entries;  // ascending by number
	std::vector<std::filesystem::path> removed_temp_files;

	[[nodiscard]] int count(MergeStatus status) const;
	[[nodiscard]] const MergeEntry *find(RecordingNumber number) const;
};

/// Turns fragment pairs in an output directory into merged recordings.
///
/// Fragments are deleted only after the merge tool succeeded and the output
/// passed the size check, so a failed merge can always be retried from the
/// same files. A successful merge also removes the unselected variants of
/// that recording, except those still being downloaded. Running it again
/// over an already reconciled directory does nothing.
class RECFETCH_EXPORT MergeExecutor {
   public:
	MergeExecutor(FragmentScanner scanner, MergeTool &tool,
				  std::uintmax_t min_merged_bytes = kDefaultMinMergedBytes);

	// Scans, selects and merges every group (or only `only`), then removes
	// leftover temp files. Fails only if the directory can't be scanned.
	Result<ReconcileSummary> reconcile(const NumberFilter &only = std::nullopt);

	// Merges one selected pair into `target`.
	Result<void> merge_pair(const FragmentPair &pair,
							const std::filesystem::path &target);

   private:
	void remove_failed_output(const std::filesystem::path &target);
	// Deletes the group's other finished variants once `merged` is in place.
	void remove_superseded(const FragmentGroup &group,
						   const FragmentPair &merged);
	std::vector<std::filesystem::path> remove_temp_files(
		const std::vector<std::filesystem::path> &files);

	FragmentScanner scanner_;
	MergeTool &tool_;
	std::uintmax_t min_merged_bytes_;
};

}  // namespace recfetch
