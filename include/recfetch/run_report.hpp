#pragma once

#include <recfetch/recfetch_export.h>

#include <filesystem>
#include <string>
#include <vector>
#include <recfetch/types.hpp>

namespace recfetch {

// Per-recording outcomes of one run, in processing order.
class RECFETCH_EXPORT RunReport {
   public:
	void record(RecordingNumber number, RunOutcome outcome);
	void mark_interrupted() { interrupted_ = true; }

	[[nodiscard]] const std::vector<RecordingNumber> &succeeded() const {
		return succeeded_;
	}
	[[nodiscard]] const std::vector<RecordingNumber> &skipped() const {
		return skipped_;
	}
	[[nodiscard]] const std::vector<RecordingNumber> &failed() const {
		return failed_;
	}
	[[nodiscard]] bool interrupted() const { return interrupted_; }

	// True iff nothing failed
	[[nodiscard]] bool ok() const { return failed_.empty(); }

	[[nodiscard]] std::string render(
		const std::filesystem::path &output_dir) const;

   private:
	std::vector<RecordingNumber> succeeded_;
	std::vector<RecordingNumber> skipped_;
	std::vector<RecordingNumber> failed_;
	bool interrupted_ = false;
};

}  // namespace recfetch
