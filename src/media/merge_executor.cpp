#include <spdlog/spdlog.h>

#include <algorithm>
#include <recfetch/candidate_selector.hpp>
#include <recfetch/merge_executor.hpp>
#include <utility>

namespace fs = std::filesystem;

namespace recfetch {

int ReconcileSummary::count(MergeStatus status) const {
	return static_cast<int>(
		std::count_if(entries.begin(), entries.end(),
					  [status](const MergeEntry &e) { return e.status == status; }));
}

const MergeEntry *ReconcileSummary::find(RecordingNumber number) const {
	auto it = std::find_if(
		entries.begin(), entries.end(),
		[number](const MergeEntry &e) { return e.number == number; });
	return it == entries.end() ? nullptr : &*it;
}

MergeExecutor::MergeExecutor(FragmentScanner scanner, MergeTool &tool,
							 std::uintmax_t min_merged_bytes)
	: scanner_(std::move(scanner)),
	  tool_(tool),
	  min_merged_bytes_(min_merged_bytes) {}

Result<ReconcileSummary> MergeExecutor::reconcile(const NumberFilter &only) {
	spdlog::info("Scanning for unmerged audio/video files...");

	auto scanned = scanner_.scan(only);
	if (!scanned) return scanned.error();
	const auto &scan = scanned.value();

	ReconcileSummary summary;
	for (const auto &evicted : scan.evicted) {
		summary.entries.push_back({evicted.number, MergeStatus::already_merged,
								   {}, evicted.path});
	}

	for (const auto &[number, group] : scan.groups) {
		MergeEntry entry;
		entry.number = number;

		auto selected = CandidateSelector::select(group);
		if (!selected) {
			spdlog::info("  Recording {:02d}: {}, skipping", number,
						 selected.error().message());
			entry.status = MergeStatus::not_mergeable;
			entry.reason = selected.error();
			summary.entries.push_back(std::move(entry));
			continue;
		}

		const auto &pair = selected.value();
		entry.output = scanner_.output_dir() /
					   scanner_.names().canonical_filename(number);

		spdlog::info("  Recording {:02d}: Merging video + audio...", number);
		spdlog::info("    Video: {}", pair.video.path.filename().string());
		spdlog::info("    Audio: {}", pair.audio.path.filename().string());

		auto merged = merge_pair(pair, entry.output);
		if (merged) {
			entry.status = MergeStatus::merged;
			remove_superseded(group, pair);
		} else {
			entry.status = MergeStatus::failed;
			entry.reason = merged.error();
		}
		summary.entries.push_back(std::move(entry));
	}

	summary.removed_temp_files = remove_temp_files(scan.temp_files);

	std::sort(summary.entries.begin(), summary.entries.end(),
			  [](const MergeEntry &a, const MergeEntry &b) {
				  return a.number < b.number;
			  });

	int merged_count = summary.count(MergeStatus::merged);
	if (merged_count > 0) {
		spdlog::info("Successfully merged {} recording(s)", merged_count);
	} else {
		spdlog::info("No files needed merging");
	}
	return summary;
}

Result<void> MergeExecutor::merge_pair(const FragmentPair &pair,
									   const fs::path &target) {
	auto res = tool_.merge(pair.video.path, pair.audio.path, target);
	if (!res) {
		spdlog::error("    Merge failed: {}", res.error().message());
		// Whatever the tool left behind is unfinished, whatever its size
		remove_failed_output(target);
		return res.error();
	}

	std::error_code ec;
	auto size = fs::file_size(target, ec);
	if (ec || size <= min_merged_bytes_) {
		spdlog::error("    Merge produced invalid file, keeping originals");
		std::error_code rm_ec;
		fs::remove(target, rm_ec);
		return outcome::failure(errc::merge_output_invalid);
	}

	spdlog::info("    Merged successfully: {}", target.filename().string());

	// The only place fragments are ever deleted
	for (const auto *frag : {&pair.video, &pair.audio}) {
		std::error_code rm_ec;
		if (!fs::remove(frag->path, rm_ec) && rm_ec) {
			spdlog::warn("    Could not remove {}: {}",
						 frag->path.filename().string(), rm_ec.message());
		}
	}
	spdlog::info("    Cleaned up split files");
	return outcome::success();
}

void MergeExecutor::remove_failed_output(const fs::path &target) {
	std::error_code ec;
	if (fs::remove(target, ec)) {
		spdlog::debug("    Removed partial output {}",
					  target.filename().string());
	} else if (ec) {
		spdlog::warn("    Could not remove partial output {}: {}",
					 target.filename().string(), ec.message());
	}
}

void MergeExecutor::remove_superseded(const FragmentGroup &group,
									  const FragmentPair &merged) {
	auto remove_unused = [&merged](const std::vector<MediaFragment> &frags) {
		for (const auto &frag : frags) {
			if (frag.path == merged.video.path ||
				frag.path == merged.audio.path) {
				continue;
			}
			// Still being written by a downloader; leave it alone
			if (frag.has_in_progress_marker) continue;

			std::error_code ec;
			if (fs::remove(frag.path, ec)) {
				spdlog::info("    Removed unused variant {}",
							 frag.path.filename().string());
			} else if (ec) {
				spdlog::warn("    Could not remove {}: {}",
							 frag.path.filename().string(), ec.message());
			}
		}
	};
	remove_unused(group.videos);
	remove_unused(group.audios);
}

std::vector<fs::path> MergeExecutor::remove_temp_files(
	const std::vector<fs::path> &files) {
	std::vector<fs::path> removed;
	for (const auto &file : files) {
		std::error_code ec;
		if (fs::remove(file, ec)) {
			removed.push_back(file);
		} else if (ec) {
			spdlog::debug("Could not remove {}: {}", file.string(),
						  ec.message());
		}
	}
	return removed;
}

}  // namespace recfetch
