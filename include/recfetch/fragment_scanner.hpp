#pragma once

#include <recfetch/recfetch_export.h>

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <vector>
#include <recfetch/recording_names.hpp>
#include <recfetch/result.hpp>
#include <recfetch/types.hpp>

namespace recfetch {

using NumberFilter = std::optional<std::set<RecordingNumber>>;

struct RECFETCH_EXPORT ScanResult {
	// Recordings with unmerged fragments, ascending.
	std::map<RecordingNumber, FragmentGroup> groups;
	// Staged groups dropped because their merged file already exists.
	std::vector<CanonicalRecording> evicted;
	// Leftover downloader state files (*.ytdl).
	std::vector<std::filesystem::path> temp_files;
};

/// Classifies the contents of one output directory into fragment groups.
///
/// Fragments are staged first and merged recordings scanned second, so a
/// recording that has both a merged file and stale fragments (left behind by
/// an interrupted earlier run) is dropped from the working set.
class RECFETCH_EXPORT FragmentScanner {
   public:
	FragmentScanner(std::filesystem::path output_dir, RecordingNames names);

	[[nodiscard]] Result<ScanResult> scan(
		const NumberFilter &only = std::nullopt) const;

	// Any merged file for the number, whatever its zero padding.
	[[nodiscard]] std::optional<std::filesystem::path> find_canonical(
		RecordingNumber number) const;

	[[nodiscard]] const std::filesystem::path &output_dir() const {
		return output_dir_;
	}
	[[nodiscard]] const RecordingNames &names() const { return names_; }

   private:
	Result<std::vector<std::string>> list_filenames() const;

	std::filesystem::path output_dir_;
	RecordingNames names_;
};

}  // namespace recfetch
