#include "markup_resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>
#include <boost/url.hpp>
#include <vector>

#include "net/http_client.hpp"
#include "utils.hpp"

namespace recfetch::session {

namespace {

const boost::regex &tag_regex() {
	static const boost::regex re(R"(<([A-Za-z][A-Za-z0-9-]*)\b[^>]*>)");
	return re;
}

struct Tag {
	std::string name;  // lowercased
	std::string_view text;
	size_t offset = 0;
};

std::vector<Tag> opening_tags(std::string_view html) {
	std::vector<Tag> tags;
	boost::cregex_iterator it(html.data(), html.data() + html.size(),
							  tag_regex());
	for (boost::cregex_iterator end; it != end; ++it) {
		const auto &m = *it;
		Tag tag;
		tag.name = boost::algorithm::to_lower_copy(m[1].str());
		tag.offset = static_cast<size_t>(m.position(0));
		tag.text = html.substr(tag.offset, static_cast<size_t>(m.length(0)));
		tags.push_back(std::move(tag));
	}
	return tags;
}

std::string decode_entities(std::string value) {
	boost::algorithm::replace_all(value, "&amp;", "&");
	boost::algorithm::replace_all(value, "&#38;", "&");
	boost::algorithm::replace_all(value, "&quot;", "\"");
	boost::algorithm::replace_all(value, "&#39;", "'");
	return value;
}

std::string absolute(const std::string &page_url, const std::string &value) {
	auto resolved = net::resolve_reference(page_url, value);
	if (!resolved) {
		spdlog::debug("Keeping unresolvable address as is: {}", value);
		return value;
	}
	return resolved.value();
}

MediaSource direct(std::string locator, const std::string &page_url,
				   ResolutionStep step) {
	return MediaSource{std::move(locator), false, page_url, step};
}

std::optional<MediaSource> from_video_element(const std::vector<Tag> &tags,
											  std::string_view html,
											  const std::string &page_url) {
	auto video = std::find_if(tags.begin(), tags.end(),
							  [](const Tag &t) { return t.name == "video"; });
	if (video == tags.end()) return std::nullopt;

	if (auto src = tag_attribute(video->text, "src"); src && !src->empty()) {
		spdlog::info("  Found video element source");
		return direct(absolute(page_url, *src), page_url,
					  ResolutionStep::video_element);
	}

	auto close = boost::algorithm::ifind_first(
		boost::make_iterator_range(html.begin() + video->offset, html.end()),
		"</video");
	size_t limit =
		close.empty() ? html.size()
					  : static_cast<size_t>(close.begin() - html.begin());

	for (auto it = video + 1; it != tags.end() && it->offset < limit; ++it) {
		if (it->name != "source") continue;
		if (auto src = tag_attribute(it->text, "src"); src && !src->empty()) {
			spdlog::info("  Found video element source");
			return direct(absolute(page_url, *src), page_url,
						  ResolutionStep::video_element);
		}
	}
	return std::nullopt;
}

std::optional<MediaSource> from_iframe(const std::vector<Tag> &tags,
									   const std::string &page_url) {
	static constexpr std::array<std::string_view, 4> kPlayers = {
		"vimeo", "youtube", "wistia", "player"};

	for (auto keyword : kPlayers) {
		for (const auto &tag : tags) {
			if (tag.name != "iframe") continue;
			auto src = tag_attribute(tag.text, "src");
			if (!src || src->find(keyword) == std::string::npos) continue;

			spdlog::info("  Found embedded video iframe: {}...",
						 utils::truncate(*src, 50));
			if (src->find("vimeo") != std::string::npos) {
				spdlog::info(
					"  Vimeo embed detected - using page URL for the "
					"downloader");
				return MediaSource{page_url, true, page_url,
								   ResolutionStep::iframe_embed};
			}
			return direct(absolute(page_url, *src), page_url,
						  ResolutionStep::iframe_embed);
		}
	}
	return std::nullopt;
}

bool has_class(std::string_view tag, std::string_view cls) {
	auto classes = tag_attribute(tag, "class");
	if (!classes) return false;
	std::vector<std::string> names;
	boost::algorithm::split(names, *classes, boost::is_any_of(" \t\n"),
							boost::token_compress_on);
	return std::find(names.begin(), names.end(), cls) != names.end();
}

std::optional<MediaSource> from_player_attribute(const std::vector<Tag> &tags,
												 const std::string &page_url) {
	using Matcher = bool (*)(std::string_view);
	static const std::array<Matcher, 5> kContainers = {
		[](std::string_view t) {
			return tag_attribute(t, "data-video-url").has_value();
		},
		[](std::string_view t) {
			return tag_attribute(t, "data-src").has_value();
		},
		[](std::string_view t) { return has_class(t, "video-player"); },
		[](std::string_view t) { return has_class(t, "wistia_embed"); },
		[](std::string_view t) { return has_class(t, "vimeo-player"); },
	};

	for (auto matches : kContainers) {
		auto container = std::find_if(
			tags.begin(), tags.end(),
			[matches](const Tag &t) { return matches(t.text); });
		if (container == tags.end()) continue;

		for (std::string_view attr : {"data-video-url", "data-src"}) {
			if (auto value = tag_attribute(container->text, attr);
				value && !value->empty()) {
				spdlog::info("  Found video URL in player container");
				return direct(absolute(page_url, *value), page_url,
							  ResolutionStep::player_attribute);
			}
		}
		// An id, not an address
		if (auto id = tag_attribute(container->text, "data-video-id");
			id && !id->empty()) {
			spdlog::info("  Found video id in player container");
			return direct(*id, page_url, ResolutionStep::player_attribute);
		}
	}
	return std::nullopt;
}

}  // namespace

std::optional<std::string> tag_attribute(std::string_view tag,
										 std::string_view name) {
	boost::regex re(
		"[\\s\"']" + std::string(name) +
			R"(\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s"'>]+)))",
		boost::regex::icase);
	boost::cmatch m;
	if (!boost::regex_search(tag.data(), tag.data() + tag.size(), m, re)) {
		// Valueless attribute, e.g. <div data-src>
		boost::regex bare("\\s" + std::string(name) + R"((?=[\s/>]))",
						  boost::regex::icase);
		if (boost::regex_search(tag.data(), tag.data() + tag.size(), bare)) {
			return std::string{};
		}
		return std::nullopt;
	}
	for (int group = 1; group <= 3; ++group) {
		if (m[group].matched) return decode_entities(m[group].str());
	}
	return std::string{};
}

MediaSource resolve_from_markup(std::string_view html,
								const std::string &page_url) {
	auto tags = opening_tags(html);

	if (auto source = from_video_element(tags, html, page_url)) return *source;
	if (auto source = from_iframe(tags, page_url)) return *source;
	if (auto source = from_player_attribute(tags, page_url)) return *source;

	spdlog::info(
		"  No direct video source found, will try page URL with the "
		"downloader");
	return MediaSource{page_url, true, page_url, ResolutionStep::page_fallback};
}

std::optional<std::string> find_csrf_token(std::string_view html) {
	for (const auto &tag : opening_tags(html)) {
		if (tag.name == "meta" &&
			boost::algorithm::iequals(
				tag_attribute(tag.text, "name").value_or(""), "csrf-token")) {
			if (auto content = tag_attribute(tag.text, "content");
				content && !content->empty()) {
				return content;
			}
		}
		if (tag.name == "input" &&
			tag_attribute(tag.text, "name").value_or("") ==
				"authenticity_token") {
			if (auto value = tag_attribute(tag.text, "value");
				value && !value->empty()) {
				return value;
			}
		}
	}
	return std::nullopt;
}

bool is_login_url(std::string_view url) {
	auto parsed = boost::urls::parse_uri(url);
	if (parsed.has_error()) {
		return boost::algorithm::icontains(url, "/login");
	}
	std::string path = parsed.value().path();
	return boost::algorithm::icontains(path, "/login");
}

}  // namespace recfetch::session
