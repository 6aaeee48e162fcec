#pragma once

#include <recfetch/recfetch_export.h>

#include <filesystem>
#include <string>
#include <recfetch/result.hpp>

namespace recfetch {

/// External program that combines one video and one audio file.
class RECFETCH_EXPORT MergeTool {
   public:
	virtual ~MergeTool() = default;

	// Checks that the tool can run. Returns its version line.
	virtual Result<std::string> probe() = 0;

	// Writes `output` from the first video stream of `video` and the first
	// audio stream of `audio`, overwriting `output` if present. Fails with
	// errc::merge_failed on a nonzero exit and errc::process_timed_out when
	// the tool hangs.
	virtual Result<void> merge(const std::filesystem::path &video,
							   const std::filesystem::path &audio,
							   const std::filesystem::path &output) = 0;
};

}  // namespace recfetch
