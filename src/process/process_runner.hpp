#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <recfetch/result.hpp>

namespace recfetch::process {

struct RunOptions {
	// Zero means no timeout
	std::chrono::seconds timeout{0};
	// Capture stdout/stderr instead of passing them through to the terminal
	bool capture_output = false;
	std::optional<std::filesystem::path> working_dir;
};

struct RunResult {
	int exit_code = -1;
	bool timed_out = false;
	std::string std_out;  // only when captured
	std::string std_err;  // only when captured

	[[nodiscard]] bool ok() const { return !timed_out && exit_code == 0; }
};

// Resolves a bare tool name on PATH; paths with a directory part are
// returned as-is if they exist. Returns nullopt when nothing is found.
std::optional<std::filesystem::path> find_executable(
	const std::filesystem::path &program);

// Runs a program to completion, killing it if the timeout expires.
// Fails with errc::process_spawn_failed if it could not be started; a
// nonzero exit or a timeout is reported through RunResult.
Result<RunResult> run(const std::filesystem::path &program,
					  const std::vector<std::string> &args,
					  const RunOptions &options = {});

}  // namespace recfetch::process
