#include <spdlog/spdlog.h>

#include <algorithm>
#include <recfetch/fragment_scanner.hpp>
#include <utility>

namespace fs = std::filesystem;

namespace recfetch {

namespace {
bool passes(const NumberFilter &only, RecordingNumber number) {
	return !only || only->count(number) > 0;
}
}  // namespace

FragmentScanner::FragmentScanner(fs::path output_dir, RecordingNames names)
	: output_dir_(std::move(output_dir)), names_(std::move(names)) {}

Result<std::vector<std::string>> FragmentScanner::list_filenames() const {
	std::error_code ec;
	fs::directory_iterator it(output_dir_, ec);
	if (ec) {
		spdlog::error(
			"Cannot read output directory {}: {}", output_dir_.string(),
			ec.message());
		return outcome::failure(errc::output_dir_unusable);
	}

	std::vector<std::string> filenames;
	for (; it != fs::directory_iterator(); it.increment(ec)) {
		if (ec) break;
		std::error_code type_ec;
		if (!it->is_regular_file(type_ec)) continue;
		filenames.push_back(it->path().filename().string());
	}
	if (ec) {
		spdlog::error("Error listing {}: {}", output_dir_.string(),
					  ec.message());
		return outcome::failure(errc::output_dir_unusable);
	}

	// Listing order is unspecified; sort so "first encountered" is stable
	std::sort(filenames.begin(), filenames.end());
	return filenames;
}

Result<ScanResult> FragmentScanner::scan(const NumberFilter &only) const {
	auto listed = list_filenames();
	if (!listed) return listed.error();
	const auto &filenames = listed.value();

	std::vector<ParsedName> parsed;
	parsed.reserve(filenames.size());
	std::set<std::string> marked;
	for (const auto &name : filenames) {
		parsed.push_back(names_.parse(name));
		if (parsed.back().kind == NameKind::in_progress_marker) {
			marked.insert(parsed.back().marked_name);
		}
	}

	ScanResult result;

	// Pass 1: stage fragments
	for (size_t i = 0; i < filenames.size(); ++i) {
		const auto &p = parsed[i];
		if (p.kind == NameKind::temp_state) {
			result.temp_files.push_back(output_dir_ / filenames[i]);
			continue;
		}
		if (p.kind != NameKind::fragment || !passes(only, p.number)) continue;

		MediaFragment frag;
		frag.path = output_dir_ / filenames[i];
		frag.number = p.number;
		frag.variant_suffix = p.variant_suffix;
		frag.extension = p.extension;
		frag.kind = RecordingNames::classify(p.variant_suffix, p.extension);
		frag.has_in_progress_marker = marked.count(filenames[i]) > 0;

		auto &group = result.groups[p.number];
		group.number = p.number;
		if (frag.is_audio_candidate()) {
			group.audios.push_back(std::move(frag));
		} else {
			group.videos.push_back(std::move(frag));
		}
	}

	// Pass 2: merged files evict staged groups
	for (size_t i = 0; i < filenames.size(); ++i) {
		const auto &p = parsed[i];
		if (p.kind != NameKind::canonical || !passes(only, p.number)) continue;
		auto it = result.groups.find(p.number);
		if (it == result.groups.end()) continue;
		spdlog::info("  Recording {:02d}: Already merged, skipping", p.number);
		result.evicted.push_back({p.number, output_dir_ / filenames[i]});
		result.groups.erase(it);
	}

	spdlog::debug("Scanned {}: {} file(s), {} group(s), {} evicted",
				  output_dir_.string(), filenames.size(), result.groups.size(),
				  result.evicted.size());
	return result;
}

std::optional<fs::path> FragmentScanner::find_canonical(
	RecordingNumber number) const {
	auto listed = list_filenames();
	if (!listed) return std::nullopt;
	for (const auto &name : listed.value()) {
		auto p = names_.parse(name);
		if (p.kind == NameKind::canonical && p.number == number) {
			return output_dir_ / name;
		}
	}
	return std::nullopt;
}

}  // namespace recfetch
