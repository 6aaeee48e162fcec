#include "cookie_jar.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>

#include "utils.hpp"

namespace recfetch::session {

namespace {

std::string_view trim(std::string_view sv) {
	while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
		sv.remove_prefix(1);
	while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t'))
		sv.remove_suffix(1);
	return sv;
}

std::string bare_domain(std::string_view domain) {
	if (!domain.empty() && domain.front() == '.') domain.remove_prefix(1);
	return boost::algorithm::to_lower_copy(std::string(domain));
}

bool domain_matches(std::string_view cookie_domain, std::string_view host) {
	auto domain = bare_domain(cookie_domain);
	auto h = boost::algorithm::to_lower_copy(std::string(host));
	if (h == domain) return true;
	return h.size() > domain.size() &&
		   boost::algorithm::ends_with(h, "." + domain);
}

bool path_matches(std::string_view cookie_path, std::string_view path) {
	if (cookie_path.empty() || cookie_path == "/") return true;
	if (path.compare(0, cookie_path.size(), cookie_path) != 0) return false;
	return path.size() == cookie_path.size() || cookie_path.back() == '/' ||
		   path[cookie_path.size()] == '/';
}

bool is_expired(const Cookie &c, std::int64_t now) {
	return c.expires > 0 && c.expires < static_cast<double>(now);
}

// "Wed, 21 Oct 2026 07:28:00 GMT"
std::optional<std::int64_t> parse_http_date(std::string_view text) {
	std::tm tm{};
	std::istringstream in{std::string(text)};
	in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
	if (in.fail()) {
		// Older servers use dashes: "Wed, 21-Oct-2026 07:28:00 GMT"
		tm = {};
		in.clear();
		in.str(std::string(text));
		in >> std::get_time(&tm, "%a, %d-%b-%Y %H:%M:%S");
		if (in.fail()) return std::nullopt;
	}
	return static_cast<std::int64_t>(timegm(&tm));
}

}  // namespace

void to_json(nlohmann::json &j, const Cookie &c) {
	j = nlohmann::json{{"name", c.name},	 {"value", c.value},
					   {"domain", c.domain}, {"path", c.path},
					   {"expires", c.expires}, {"secure", c.secure},
					   {"httpOnly", c.http_only}};
}

void from_json(const nlohmann::json &j, Cookie &c) {
	c.name = utils::json_field_default<std::string>(j, "name", "");
	c.value = utils::json_field_default<std::string>(j, "value", "");
	c.domain = utils::json_field_default<std::string>(j, "domain", "");
	c.path = utils::json_field_default<std::string>(j, "path", "/");
	c.expires = utils::json_field_default<double>(j, "expires", -1);
	c.secure = utils::json_field_default<bool>(j, "secure", false);
	c.http_only = utils::json_field_default<bool>(j, "httpOnly", false);
}

Result<CookieJar> CookieJar::load(const std::filesystem::path &path) {
	std::ifstream in(path);
	if (!in) return outcome::failure(errc::file_open_failed);

	CookieJar jar;
	try {
		auto j = nlohmann::json::parse(in);
		if (!j.is_array()) return outcome::failure(errc::json_parse_error);
		for (const auto &entry : j) {
			auto cookie = entry.get<Cookie>();
			if (cookie.name.empty()) continue;
			jar.put(std::move(cookie));
		}
	} catch (const nlohmann::json::exception &e) {
		spdlog::warn("Cannot parse {}: {}", path.string(), e.what());
		return outcome::failure(errc::json_parse_error);
	}
	return jar;
}

Result<void> CookieJar::save(const std::filesystem::path &path) const {
	std::ofstream out(path, std::ios::trunc);
	if (!out) return outcome::failure(errc::file_open_failed);
	out << nlohmann::json(cookies_).dump(2) << '\n';
	if (!out) return outcome::failure(errc::file_write_failed);
	return outcome::success();
}

Result<void> CookieJar::export_netscape(const std::filesystem::path &path,
										std::int64_t now) const {
	std::ofstream out(path, std::ios::trunc);
	if (!out) return outcome::failure(errc::file_open_failed);

	out << "# Netscape HTTP Cookie File\n"
		<< "# https://curl.haxx.se/rfc/cookie_spec.html\n"
		<< "# This is a generated file! Do not edit.\n\n";

	for (const auto &c : cookies_) {
		auto domain = c.domain;
		if (domain.empty() || domain.front() != '.') domain.insert(0, ".");
		auto expiry = c.expires <= 0 ? now + kSessionCookieLifetime
									 : static_cast<std::int64_t>(c.expires);
		out << fmt::format("{}\tTRUE\t{}\t{}\t{}\t{}\t{}\n", domain,
						   c.path.empty() ? "/" : c.path,
						   c.secure ? "TRUE" : "FALSE", expiry, c.name,
						   c.value);
	}

	if (!out) return outcome::failure(errc::file_write_failed);
	return outcome::success();
}

void CookieJar::set_from_header(std::string_view header,
								std::string_view request_host,
								std::int64_t now) {
	std::vector<std::string> parts;
	boost::algorithm::split(parts, header, boost::is_any_of(";"));
	if (parts.empty()) return;

	auto pair = trim(parts.front());
	auto eq = pair.find('=');
	if (eq == std::string_view::npos || eq == 0) return;

	Cookie cookie;
	cookie.name = std::string(trim(pair.substr(0, eq)));
	cookie.value = std::string(trim(pair.substr(eq + 1)));
	cookie.domain = boost::algorithm::to_lower_copy(std::string(request_host));

	std::optional<double> max_age_expiry;
	for (size_t i = 1; i < parts.size(); ++i) {
		auto attr = trim(parts[i]);
		auto attr_eq = attr.find('=');
		auto key = boost::algorithm::to_lower_copy(
			std::string(trim(attr.substr(0, attr_eq))));
		auto value = attr_eq == std::string_view::npos
						 ? std::string_view{}
						 : trim(attr.substr(attr_eq + 1));

		if (key == "domain" && !value.empty()) {
			auto domain = bare_domain(value);
			// Reject cookies for domains the server does not belong to
			if (!domain_matches(domain, request_host)) return;
			cookie.domain = "." + domain;
		} else if (key == "path" && !value.empty()) {
			cookie.path = std::string(value);
		} else if (key == "secure") {
			cookie.secure = true;
		} else if (key == "httponly") {
			cookie.http_only = true;
		} else if (key == "max-age") {
			if (auto seconds = utils::to_long(value)) {
				// Non-positive Max-Age deletes the cookie
				max_age_expiry = seconds.value() > 0
									 ? static_cast<double>(now + seconds.value())
									 : 1.0;
			}
		} else if (key == "expires") {
			if (auto when = parse_http_date(value)) {
				cookie.expires = static_cast<double>(*when);
			}
		}
	}
	if (max_age_expiry) cookie.expires = *max_age_expiry;

	if (is_expired(cookie, now)) {
		cookies_.erase(
			std::remove_if(cookies_.begin(), cookies_.end(),
						   [&](const Cookie &c) {
							   return c.name == cookie.name &&
									  c.path == cookie.path &&
									  bare_domain(c.domain) ==
										  bare_domain(cookie.domain);
						   }),
			cookies_.end());
		return;
	}
	put(std::move(cookie));
}

std::string CookieJar::header_for(std::string_view host, std::string_view path,
								  bool https, std::int64_t now) const {
	std::string header;
	for (const auto &c : cookies_) {
		if (c.secure && !https) continue;
		if (is_expired(c, now)) continue;
		if (!domain_matches(c.domain, host) || !path_matches(c.path, path))
			continue;
		if (!header.empty()) header += "; ";
		header += c.name;
		header += '=';
		header += c.value;
	}
	return header;
}

void CookieJar::put(Cookie cookie) {
	auto it = std::find_if(cookies_.begin(), cookies_.end(),
						   [&](const Cookie &c) {
							   return c.name == cookie.name &&
									  c.path == cookie.path &&
									  bare_domain(c.domain) ==
										  bare_domain(cookie.domain);
						   });
	if (it != cookies_.end()) {
		*it = std::move(cookie);
	} else {
		cookies_.push_back(std::move(cookie));
	}
}

}  // namespace recfetch::session
