#include "page_session_provider.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/url.hpp>
#include <ctime>

#include "cookie_jar.hpp"
#include "markup_resolver.hpp"
#include "net/http_client.hpp"

namespace recfetch::session {

namespace {

constexpr const char *kSavedSessionFile = "cookies.json";
constexpr const char *kNetscapeJarFile = "cookies_netscape.txt";

std::int64_t unix_now() { return static_cast<std::int64_t>(std::time(nullptr)); }

Result<std::string> origin_of(const std::string &url) {
	auto parsed = boost::urls::parse_uri(url);
	if (parsed.has_error()) return outcome::failure(errc::invalid_url);
	boost::urls::url origin(parsed.value());
	origin.remove_query();
	origin.remove_fragment();
	origin.set_encoded_path("");
	return std::string(origin.buffer());
}

}  // namespace

struct PageSessionProvider::Impl {
	Config config;
	boost::asio::io_context ioc;
	CookieJar jar;
	net::HttpClient client;

	explicit Impl(Config c)
		: config(std::move(c)), client(ioc, jar, config.http_timeout) {}

	std::filesystem::path saved_session() const {
		return config.session_directory / kSavedSessionFile;
	}

	std::filesystem::path netscape_jar() const {
		return config.session_directory / kNetscapeJarFile;
	}

	bool is_authenticated() {
		auto res = client.get(config.base_url);
		if (!res) {
			spdlog::warn("  Session check failed: {}", res.error().message());
			return false;
		}
		const auto &page = res.value();
		spdlog::debug("  Session check landed on {} ({})", page.final_url,
					  page.status_code);
		return page.status_code < 400 && !is_login_url(page.final_url);
	}

	Result<void> fresh_login() {
		auto origin = origin_of(config.base_url);
		if (!origin) return origin.error();
		auto login_url = origin.value() + "/login";

		spdlog::info("  Navigating to {}", login_url);
		auto form_page = client.get(login_url);
		if (!form_page) {
			spdlog::error("  Cannot load the login page: {}",
						  form_page.error().message());
			return outcome::failure(errc::login_failed);
		}
		if (!is_login_url(form_page.value().final_url)) {
			spdlog::info("  Already logged in!");
			return outcome::success();
		}

		net::FormFields fields = {
			{"user[login]", config.credentials.email},
			{"user[password]", config.credentials.password},
		};
		if (auto token = find_csrf_token(form_page.value().body)) {
			fields.emplace_back("authenticity_token", *token);
		} else {
			spdlog::warn("  No CSRF token on the login page");
		}

		spdlog::info("  Submitting login form...");
		auto submitted = client.post_form(form_page.value().final_url, fields,
										  {{"Referer", login_url}});
		if (!submitted) {
			spdlog::error("  Login request failed: {}",
						  submitted.error().message());
			return outcome::failure(errc::login_failed);
		}
		spdlog::info("  Current URL after login: {}",
					 submitted.value().final_url);

		if (!is_authenticated()) {
			spdlog::error("  Login failed, still on the login page");
			return outcome::failure(errc::login_failed);
		}
		spdlog::info("  Login successful!");
		return outcome::success();
	}

	Result<void> store_session() {
		std::error_code ec;
		std::filesystem::create_directories(config.session_directory, ec);

		if (auto saved = jar.save(saved_session()); !saved) {
			spdlog::warn("  Could not save session to {}: {}",
						 saved_session().string(), saved.error().message());
		}

		auto exported = jar.export_netscape(netscape_jar(), unix_now());
		if (!exported) {
			spdlog::error("  Could not write {}: {}", netscape_jar().string(),
						  exported.error().message());
			return outcome::failure(errc::session_store_failed);
		}
		spdlog::info("  Netscape cookies saved to {}", netscape_jar().string());
		return outcome::success();
	}
};

PageSessionProvider::PageSessionProvider(Config config)
	: m_impl(std::make_unique<Impl>(std::move(config))) {}

PageSessionProvider::~PageSessionProvider() = default;

Result<void> PageSessionProvider::open() {
	auto &impl = *m_impl;
	if (auto valid = validate_credentials(impl.config.credentials); !valid) {
		return valid.error();
	}

	spdlog::info("[1/4] Logging in...");
	if (impl.config.headless) {
		spdlog::debug("  --headless has no effect on the HTTP session");
	}

	bool restored = false;
	if (auto saved = CookieJar::load(impl.saved_session())) {
		impl.jar = std::move(saved.value());
		restored = !impl.jar.empty();
		spdlog::info("  Loaded cookies from {}", impl.saved_session().string());
	} else if (saved.error() != make_error_code(errc::file_open_failed)) {
		spdlog::warn("  Ignoring unreadable {}",
					 impl.saved_session().string());
	}

	if (!restored || !impl.is_authenticated()) {
		if (restored) {
			spdlog::info("  Cookies may be expired, trying fresh login...");
			impl.jar.clear();
		}
		if (auto login = impl.fresh_login(); !login) return login.error();
	} else {
		spdlog::info("  Saved session is still valid");
	}

	spdlog::info("[2/4] Saving session cookies...");
	return impl.store_session();
}

std::optional<MediaSource> PageSessionProvider::resolve_media_source(
	RecordingNumber number) {
	auto &impl = *m_impl;
	auto page_url = impl.config.base_url + "/" + std::to_string(number);

	spdlog::info("  Navigating to {}", page_url);
	auto page = impl.client.get(page_url);
	if (!page) {
		spdlog::warn("  Error loading recording page: {}",
					 page.error().message());
		return MediaSource{page_url, true, page_url,
						   ResolutionStep::page_fallback};
	}
	if (page.value().status_code == 404) {
		spdlog::warn("  Recording page not found (404)");
		return std::nullopt;
	}
	if (page.value().status_code >= 400) {
		spdlog::warn("  Recording page answered {}, handing the page to the "
					 "downloader",
					 page.value().status_code);
		return MediaSource{page_url, true, page_url,
						   ResolutionStep::page_fallback};
	}
	return resolve_from_markup(page.value().body, page_url);
}

std::filesystem::path PageSessionProvider::cookie_jar_path() const {
	return m_impl->netscape_jar();
}

std::filesystem::path PageSessionProvider::saved_session_path() const {
	return m_impl->saved_session();
}

}  // namespace recfetch::session
