#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>
#include <recfetch/result.hpp>

namespace recfetch::session {

// Field names follow the browser-export layout of cookies.json.
struct Cookie {
	std::string name;
	std::string value;
	std::string domain;
	std::string path = "/";
	double expires = -1;  // unix seconds, <= 0 for a session cookie
	bool secure = false;
	bool http_only = false;
};

void to_json(nlohmann::json &j, const Cookie &c);
void from_json(const nlohmann::json &j, Cookie &c);

class CookieJar {
   public:
	// Seconds a session cookie stays valid in the exported Netscape jar
	static constexpr std::int64_t kSessionCookieLifetime = 31536000;

	// errc::file_open_failed if absent, errc::json_parse_error if malformed
	static Result<CookieJar> load(const std::filesystem::path &path);
	Result<void> save(const std::filesystem::path &path) const;

	// Writes the jar in the Netscape format read by the downloader.
	Result<void> export_netscape(const std::filesystem::path &path,
								 std::int64_t now) const;

	// Applies one Set-Cookie header received from `request_host`.
	void set_from_header(std::string_view header, std::string_view request_host,
						 std::int64_t now);

	// Value for the Cookie request header, empty when nothing matches.
	[[nodiscard]] std::string header_for(std::string_view host,
										 std::string_view path, bool https,
										 std::int64_t now) const;

	void put(Cookie cookie);
	void clear() { cookies_.clear(); }
	[[nodiscard]] bool empty() const { return cookies_.empty(); }
	[[nodiscard]] const std::vector<Cookie> &cookies() const {
		return cookies_;
	}

   private:
	std::vector<Cookie> cookies_;
};

}  // namespace recfetch::session
