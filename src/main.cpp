#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include <recfetch/config.hpp>
#include <recfetch/ffmpeg_merge_tool.hpp>
#include <recfetch/orchestrator.hpp>

#include "downloader/ytdlp_executor.hpp"
#include "session/page_session_provider.hpp"

namespace po = boost::program_options;
namespace asio = boost::asio;

namespace {

constexpr const char *kDefaultConfigFile = "recfetch.conf";

constexpr const char *kExamples = R"(Examples:
  rec-fetch --start 1 --end 25           Download recordings 1-25
  rec-fetch --video 5                    Download only recording 5
  rec-fetch --start 1 --end 5 --force    Re-download even if exists
  rec-fetch --merge                      Merge any split audio/video files
)";

struct Selection {
	bool merge_only = false;
	int first = 0;
	int last = 0;
};

// Checks the mode flags the way the help text describes them.
std::optional<Selection> select_mode(const po::variables_map &vm) {
	int modes = static_cast<int>(vm.count("video") + vm.count("start") +
								 vm.count("merge"));
	if (modes != 1) {
		spdlog::error(
			"Exactly one of --video, --start or --merge is required");
		return std::nullopt;
	}

	Selection sel;
	if (vm.count("merge")) {
		sel.merge_only = true;
		return sel;
	}

	if (vm.count("video")) {
		sel.first = sel.last = vm["video"].as<int>();
	} else {
		if (!vm.count("end")) {
			spdlog::error("--end is required when using --start");
			return std::nullopt;
		}
		sel.first = vm["start"].as<int>();
		sel.last = vm["end"].as<int>();
		if (sel.first > sel.last) {
			spdlog::error("--start must be less than or equal to --end");
			return std::nullopt;
		}
	}
	if (sel.first < 1) {
		spdlog::error("Video numbers must be positive");
		return std::nullopt;
	}
	return sel;
}

// Ctrl+C lets the current recording finish; the rest are not started.
class SignalWatcher {
   public:
	explicit SignalWatcher(recfetch::Orchestrator &orchestrator)
		: signals_(ioc_, SIGINT, SIGTERM) {
		signals_.async_wait(
			[&orchestrator](const boost::system::error_code &ec, int sig) {
				if (!ec) {
					spdlog::warn(
						"Received signal {}, stopping after the current "
						"recording",
						sig);
					orchestrator.request_stop();
				}
			});
		thread_ = std::thread([this] { ioc_.run(); });
	}

	~SignalWatcher() {
		boost::system::error_code ec;
		signals_.cancel(ec);
		thread_.join();
	}

	SignalWatcher(const SignalWatcher &) = delete;
	SignalWatcher &operator=(const SignalWatcher &) = delete;

   private:
	asio::io_context ioc_;
	asio::signal_set signals_;
	std::thread thread_;
};

}  // namespace

int main(int argc, char *argv[]) {
	try {
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[recfetch] %v");

		po::options_description modes("Recording selection");
		// clang-format off
		modes.add_options()
			("video,v", po::value<int>(), "Download a single recording by number")
			("start,s", po::value<int>(), "First recording number (use with --end)")
			("end,e", po::value<int>(), "Last recording number (use with --start)")
			("merge,m", "Merge any split audio/video files (requires ffmpeg)");

		po::options_description general("Options");
		general.add_options()
			("help,h", "Print help message")
			("force,f", "Re-download even if the recording already exists")
			("headless", "Accepted for compatibility; the HTTP session has no window")
			("allow-split", "Allow downloads without ffmpeg (leaves separate audio/video files)")
			("config", po::value<std::string>(),
			 "Settings file (default: recfetch.conf if present)")
			("verbose", "Enable verbose logging");
		// clang-format on

		auto settings = recfetch::settings_description();

		po::options_description desc;
		desc.add(modes).add(general).add(settings);

		po::variables_map vm;
		po::store(po::parse_command_line(argc, argv, desc), vm);

		if (vm.count("help")) {
			std::cout << "Usage: rec-fetch [options]\n"
					  << desc << "\n"
					  << kExamples;
			return 0;
		}

		spdlog::set_level(vm.count("verbose") ? spdlog::level::debug
											  : spdlog::level::info);

		auto selection = select_mode(vm);
		if (!selection) {
			std::cerr << "Usage: rec-fetch [options]\n" << desc << "\n";
			return 1;
		}

		bool explicit_config = vm.count("config") > 0;
		std::filesystem::path config_file =
			explicit_config ? vm["config"].as<std::string>() : kDefaultConfigFile;
		if (auto stored = recfetch::store_layered_settings(
				settings, config_file, explicit_config, vm);
			!stored) {
			return 1;
		}

		auto config = recfetch::config_from_variables(vm);
		if (!config) return 1;
		const auto &cfg = config.value();

		spdlog::info("{}", std::string(60, '='));
		spdlog::info("  Recording Downloader");
		spdlog::info("{}", std::string(60, '='));

		recfetch::FfmpegMergeTool merge_tool(cfg.merge_tool_path,
											 cfg.merge_timeout);
		std::optional<std::filesystem::path> ffmpeg_location;
		if (cfg.merge_tool_path.has_parent_path()) {
			ffmpeg_location = cfg.merge_tool_path;
		}
		recfetch::downloader::YtDlpExecutor downloader(
			cfg.downloader_path, ffmpeg_location, cfg.download_timeout);
		recfetch::session::PageSessionProvider session(cfg);

		recfetch::Orchestrator orchestrator(cfg, session, downloader,
											merge_tool);

		if (selection->merge_only) {
			auto summary = orchestrator.merge_only();
			if (!summary) {
				spdlog::error("Merge pass failed: {}",
							  summary.error().message());
				return 1;
			}
			return 0;
		}

		SignalWatcher watcher(orchestrator);
		auto report = orchestrator.run(selection->first, selection->last);

		if (!report) {
			spdlog::error("Run aborted: {}", report.error().message());
			return 1;
		}

		fmt::print("{}", report.value().render(
							 std::filesystem::absolute(cfg.output_directory)));

		return report.value().ok() && !report.value().interrupted() ? 0 : 1;

	} catch (const std::exception &e) {
		fmt::print(stderr, "ERROR: {}\n", e.what());
		return 1;
	}
}
