#include "process_runner.hpp"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/process.hpp>
#include <future>

namespace asio = boost::asio;
namespace bp = boost::process;
namespace fs = std::filesystem;

namespace recfetch::process {

std::optional<fs::path> find_executable(const fs::path &program) {
	if (program.empty()) return std::nullopt;

	if (program.has_parent_path()) {
		std::error_code ec;
		if (fs::exists(program, ec)) return program;
		return std::nullopt;
	}

	auto found = bp::search_path(program.string());
	if (found.empty()) return std::nullopt;
	return fs::path(found.string());
}

Result<RunResult> run(const fs::path &program,
					  const std::vector<std::string> &args,
					  const RunOptions &options) {
	auto exe = find_executable(program);
	if (!exe) {
		spdlog::error("'{}' is not installed or not in PATH", program.string());
		return outcome::failure(errc::process_spawn_failed);
	}

	std::error_code dir_ec;
	fs::path start_dir = options.working_dir ? *options.working_dir
											 : fs::current_path(dir_ec);
	if (dir_ec) {
		spdlog::error("Cannot determine working directory: {}",
					  dir_ec.message());
		return outcome::failure(errc::process_spawn_failed);
	}

	spdlog::debug("Running: {} {}", exe->string(), fmt::join(args, " "));

	try {
		asio::io_context ioc;
		asio::steady_timer timer(ioc);
		RunResult result;

		std::future<std::string> out_future;
		std::future<std::string> err_future;

		auto exit_handler =
			bp::on_exit([&](int exit_code, const std::error_code &ec) {
				if (!ec) result.exit_code = exit_code;
				timer.cancel();
			});

		std::error_code spawn_ec;
		bp::child child;
		if (options.capture_output) {
			child = bp::child(bp::exe = exe->string(), bp::args = args,
							  bp::start_dir = start_dir.string(),
							  bp::std_in < bp::null, bp::std_out > out_future,
							  bp::std_err > err_future, ioc, exit_handler,
							  spawn_ec);
		} else {
			child = bp::child(bp::exe = exe->string(), bp::args = args,
							  bp::start_dir = start_dir.string(),
							  bp::std_in < bp::null, ioc, exit_handler,
							  spawn_ec);
		}

		if (spawn_ec) {
			spdlog::error("Failed to start {}: {}", exe->string(),
						  spawn_ec.message());
			return outcome::failure(errc::process_spawn_failed);
		}

		if (options.timeout.count() > 0) {
			timer.expires_after(options.timeout);
			timer.async_wait([&](const boost::system::error_code &ec) {
				if (ec) return;	 // cancelled: the child exited first
				std::error_code term_ec;
				if (child.running(term_ec)) {
					spdlog::warn("{} exceeded {}s, terminating",
								 exe->filename().string(),
								 options.timeout.count());
					result.timed_out = true;
					child.terminate(term_ec);
				}
			});
		}

		ioc.run();

		if (options.capture_output) {
			result.std_out = out_future.get();
			result.std_err = err_future.get();
		}
		return result;

	} catch (const std::exception &e) {
		spdlog::error("Process error running {}: {}", exe->string(), e.what());
		return outcome::failure(errc::process_spawn_failed);
	}
}

}  // namespace recfetch::process
