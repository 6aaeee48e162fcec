#pragma once

#include <recfetch/recfetch_export.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <recfetch/merge_tool.hpp>

namespace recfetch {

// Merges with the ffmpeg command line tool: video stream copied, audio
// re-encoded to AAC, cut to the shorter input, moov atom moved to the front.
class RECFETCH_EXPORT FfmpegMergeTool : public MergeTool {
   public:
	explicit FfmpegMergeTool(std::filesystem::path ffmpeg = "ffmpeg",
							 std::chrono::seconds timeout = std::chrono::hours(1));

	Result<std::string> probe() override;

	Result<void> merge(const std::filesystem::path &video,
					   const std::filesystem::path &audio,
					   const std::filesystem::path &output) override;

	[[nodiscard]] static std::vector<std::string> merge_arguments(
		const std::filesystem::path &video, const std::filesystem::path &audio,
		const std::filesystem::path &output);

	[[nodiscard]] const std::filesystem::path &path() const { return ffmpeg_; }

   private:
	std::filesystem::path ffmpeg_;
	std::chrono::seconds timeout_;
};

}  // namespace recfetch
