#include <fmt/format.h>
#include <fmt/ranges.h>

#include <recfetch/run_report.hpp>

namespace recfetch {

void RunReport::record(RecordingNumber number, RunOutcome outcome) {
	switch (outcome) {
		case RunOutcome::succeeded: succeeded_.push_back(number); break;
		case RunOutcome::skipped: skipped_.push_back(number); break;
		case RunOutcome::failed: failed_.push_back(number); break;
	}
}

std::string RunReport::render(const std::filesystem::path &output_dir) const {
	std::string out;
	auto line = std::string(60, '=');

	out += fmt::format("\n{}\n", line);
	out += "Download Summary\n";
	out += fmt::format("{}\n", line);

	out += fmt::format("  Successful: {} videos\n", succeeded_.size());
	if (!succeeded_.empty()) {
		out += fmt::format("    [{}]\n", fmt::join(succeeded_, ", "));
	}

	out += fmt::format(
		"  Skipped:    {} videos (already downloaded)\n", skipped_.size());
	if (!skipped_.empty()) {
		out += fmt::format("    [{}]\n", fmt::join(skipped_, ", "));
	}

	out += fmt::format("  Failed:     {} videos\n", failed_.size());
	if (!failed_.empty()) {
		out += fmt::format("    [{}]\n", fmt::join(failed_, ", "));
	}

	if (interrupted_) {
		out +=
			"  Run interrupted; recordings not started are counted as failed\n";
	}

	out += fmt::format("\nVideos saved to: {}\n", output_dir.string());
	return out;
}

}  // namespace recfetch
