#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <recfetch/config.hpp>

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace recfetch {

namespace {
constexpr std::string_view kEnvPrefix = "RECFETCH_";
constexpr std::string_view kPlaceholderEmail = "your_email@example.com";

Result<std::chrono::seconds> seconds_setting(const po::variables_map &vm,
											 const char *name,
											 std::chrono::seconds fallback) {
	if (!vm.count(name)) return fallback;
	auto value = vm[name].as<long long>();
	if (value <= 0) {
		spdlog::error("Setting '{}' must be a positive number of seconds",
					  name);
		return outcome::failure(errc::invalid_config);
	}
	return std::chrono::seconds(value);
}
}  // namespace

po::options_description settings_description() {
	po::options_description desc("Settings (also RECFETCH_* / config file)");
	// clang-format off
	desc.add_options()
		("email", po::value<std::string>(), "Account email")
		("password", po::value<std::string>(), "Account password")
		("base-url", po::value<std::string>(),
		 "Recordings index URL; item N is <base-url>/N")
		("output-dir", po::value<std::string>(),
		 "Directory for downloaded recordings")
		("ffmpeg", po::value<std::string>(), "Path to the ffmpeg binary")
		("yt-dlp", po::value<std::string>(), "Path to the yt-dlp binary")
		("session-dir", po::value<std::string>(),
		 "Directory for saved session cookies")
		("prefix", po::value<std::string>(),
		 "Recording file name prefix (default Recording_)")
		("download-timeout", po::value<long long>(),
		 "Seconds before a download is abandoned")
		("merge-timeout", po::value<long long>(),
		 "Seconds before a merge is abandoned")
		("http-timeout", po::value<long long>(),
		 "Seconds per platform page request")
		("min-merged-bytes", po::value<unsigned long long>(),
		 "Smallest merged file accepted as valid");
	// clang-format on
	return desc;
}

std::string map_environment_name(const std::string &name) {
	if (name.size() <= kEnvPrefix.size() ||
		name.compare(0, kEnvPrefix.size(), kEnvPrefix) != 0) {
		return {};
	}
	std::string option = name.substr(kEnvPrefix.size());
	for (char &c : option) {
		c = c == '_' ? '-'
					 : static_cast<char>(
						   std::tolower(static_cast<unsigned char>(c)));
	}
	return option;
}

Result<void> store_layered_settings(const po::options_description &settings,
									const fs::path &config_file,
									bool file_required, po::variables_map &vm) {
	try {
		po::store(po::parse_environment(
					  settings,
					  [&settings](const std::string &env) {
						  auto option = map_environment_name(env);
						  if (option.empty() ||
							  !settings.find_nothrow(option, false)) {
							  return std::string{};
						  }
						  return option;
					  }),
				  vm);

		std::error_code ec;
		if (!config_file.empty() && fs::exists(config_file, ec)) {
			std::ifstream in(config_file);
			if (!in) {
				spdlog::error("Cannot open config file {}",
							  config_file.string());
				return outcome::failure(errc::file_open_failed);
			}
			spdlog::debug("Loading settings from {}", config_file.string());
			po::store(po::parse_config_file(in, settings, true), vm);
		} else if (file_required) {
			spdlog::error("Config file {} not found", config_file.string());
			return outcome::failure(errc::file_open_failed);
		}

		po::notify(vm);
	} catch (const po::error &e) {
		spdlog::error("Invalid configuration: {}", e.what());
		return outcome::failure(errc::invalid_config);
	}
	return outcome::success();
}

Result<Config> config_from_variables(const po::variables_map &vm) {
	Config config;

	auto str = [&vm](const char *name, std::string &out) {
		if (vm.count(name)) out = vm[name].as<std::string>();
	};
	auto path = [&vm](const char *name, fs::path &out) {
		if (vm.count(name)) out = vm[name].as<std::string>();
	};

	str("email", config.credentials.email);
	str("password", config.credentials.password);
	str("base-url", config.base_url);
	str("prefix", config.file_prefix);
	path("output-dir", config.output_directory);
	path("ffmpeg", config.merge_tool_path);
	path("yt-dlp", config.downloader_path);
	path("session-dir", config.session_directory);

	while (!config.base_url.empty() && config.base_url.back() == '/') {
		config.base_url.pop_back();
	}
	if (config.file_prefix.empty()) {
		spdlog::error("Setting 'prefix' must not be empty");
		return outcome::failure(errc::invalid_config);
	}

	auto download = seconds_setting(vm, "download-timeout", config.download_timeout);
	if (!download) return download.error();
	config.download_timeout = download.value();

	auto merge = seconds_setting(vm, "merge-timeout", config.merge_timeout);
	if (!merge) return merge.error();
	config.merge_timeout = merge.value();

	auto http = seconds_setting(vm, "http-timeout", config.http_timeout);
	if (!http) return http.error();
	config.http_timeout = http.value();

	if (vm.count("min-merged-bytes")) {
		config.min_merged_bytes = vm["min-merged-bytes"].as<unsigned long long>();
	}

	config.force_redownload = vm.count("force") > 0;
	config.allow_unmerged_output = vm.count("allow-split") > 0;
	config.headless = vm.count("headless") > 0;

	return config;
}

Result<void> validate_credentials(const Credentials &credentials) {
	if (credentials.email.empty() || credentials.password.empty()) {
		spdlog::error("Credentials not configured!");
		spdlog::error(
			"Set RECFETCH_EMAIL and RECFETCH_PASSWORD, or add email= and "
			"password= to recfetch.conf");
		return outcome::failure(errc::credentials_missing);
	}
	if (credentials.email == kPlaceholderEmail) {
		spdlog::error("You're still using the example email!");
		return outcome::failure(errc::credentials_missing);
	}
	return outcome::success();
}

}  // namespace recfetch
