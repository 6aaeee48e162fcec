#include "http_client.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/url.hpp>
#include <ctime>
#include <optional>

#include "session/cookie_jar.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace recfetch::net {

// =============================================================================
// GZIP/DEFLATE DECOMPRESSION
// =============================================================================

namespace {

constexpr const char *kUserAgent =
	"Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
	"Chrome/124.0 Safari/537.36";

// window_bits: 16 + MAX_WBITS for gzip, -MAX_WBITS for raw deflate
std::optional<std::string> inflate_body(const std::string &compressed,
										int window_bits) {
	if (compressed.empty()) return std::string{};

	z_stream zs{};
	if (inflateInit2(&zs, window_bits) != Z_OK) {
		spdlog::warn("Failed to init zlib for decompression");
		return std::nullopt;
	}

	zs.next_in =
		reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
	zs.avail_in = static_cast<uInt>(compressed.size());

	std::string decompressed;
	decompressed.reserve(compressed.size() * 4);

	constexpr size_t kChunkSize = 32768;
	char outbuffer[kChunkSize];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
		zs.avail_out = kChunkSize;

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
			(ret == Z_BUF_ERROR && zs.avail_in == 0)) {
			inflateEnd(&zs);
			spdlog::warn("zlib inflate error: {}", ret);
			return std::nullopt;
		}

		size_t have = kChunkSize - zs.avail_out;
		decompressed.append(outbuffer, have);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

std::string decompress_body(const std::string &body,
							const std::string &content_encoding) {
	if (content_encoding.empty() || content_encoding == "identity") {
		return body;
	}

	if (content_encoding == "gzip" || content_encoding == "x-gzip") {
		if (auto result = inflate_body(body, 16 + MAX_WBITS)) return *result;
		spdlog::warn("gzip decompression failed, returning raw body");
		return body;
	}

	if (content_encoding == "deflate") {
		// Some servers send zlib-wrapped data as deflate
		if (auto result = inflate_body(body, MAX_WBITS)) return *result;
		if (auto result = inflate_body(body, -MAX_WBITS)) return *result;
		spdlog::warn("deflate decompression failed, returning raw body");
		return body;
	}

	spdlog::debug(
		"Unknown Content-Encoding: {}, returning raw body", content_encoding);
	return body;
}

bool is_redirect(int status) {
	return status == 301 || status == 302 || status == 303 || status == 307 ||
		   status == 308;
}

std::int64_t unix_now() { return static_cast<std::int64_t>(std::time(nullptr)); }

template <typename Stream>
Result<http::response<http::string_body>> exchange(
	Stream &stream, http::request<http::string_body> &req) {
	beast::error_code ec;
	http::write(stream, req, ec);
	if (ec) {
		spdlog::debug("HTTP write failed: {}", ec.message());
		return outcome::failure(errc::request_failed);
	}

	beast::flat_buffer buffer;
	http::response<http::string_body> res;
	http::read(stream, buffer, res, ec);
	if (ec) {
		spdlog::debug("HTTP read failed: {}", ec.message());
		return outcome::failure(errc::request_failed);
	}
	return res;
}

}  // namespace

Result<std::string> resolve_reference(std::string_view base,
									  std::string_view reference) {
	auto base_res = boost::urls::parse_uri(base);
	if (base_res.has_error()) return outcome::failure(errc::invalid_url);
	auto ref_res = boost::urls::parse_uri_reference(reference);
	if (ref_res.has_error()) return outcome::failure(errc::invalid_url);

	boost::urls::url resolved(base_res.value());
	auto r = resolved.resolve(ref_res.value());
	if (r.has_error()) return outcome::failure(errc::invalid_url);
	resolved.normalize_scheme();
	resolved.normalize_authority();
	return std::string(resolved.buffer());
}

std::string encode_form(const FormFields &fields) {
	boost::urls::encoding_opts opts;
	opts.space_as_plus = true;

	std::string body;
	for (const auto &[key, value] : fields) {
		if (!body.empty()) body += '&';
		body += boost::urls::encode(key, boost::urls::unreserved_chars, opts);
		body += '=';
		body += boost::urls::encode(value, boost::urls::unreserved_chars, opts);
	}
	return body;
}

struct HttpClient::Impl {
	asio::io_context &ioc;
	session::CookieJar &jar;
	std::chrono::seconds timeout;
	ssl::context ssl_ctx;

	Impl(asio::io_context &io, session::CookieJar &j, std::chrono::seconds t)
		: ioc(io), jar(j), timeout(t), ssl_ctx(ssl::context::tlsv12_client) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(ssl::verify_peer, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error(
				"Failed to set default SSL verify paths: {}", ec.message());
		}
	}

	Result<HttpResponse> perform_request(
		http::verb method, const std::string &url_str,
		const std::string &body_content,
		const std::map<std::string, std::string> &headers) {
		try {
			auto u_res = boost::urls::parse_uri(url_str);
			if (u_res.has_error()) return outcome::failure(errc::invalid_url);
			boost::urls::url_view u = u_res.value();

			bool https = u.scheme_id() == boost::urls::scheme::https;
			if (!https && u.scheme_id() != boost::urls::scheme::http) {
				return outcome::failure(errc::invalid_url);
			}

			std::string host = u.host();
			std::string port(u.port());
			std::string path(u.encoded_path());
			if (path.empty()) path = "/";
			std::string target = path;
			if (u.has_query()) {
				target += "?";
				target += std::string(u.encoded_query());
			}
			if (port.empty()) port = https ? "443" : "80";

			http::request<http::string_body> req{method, target, 11};
			req.set(http::field::host, host);
			req.set(http::field::user_agent, kUserAgent);
			req.set(http::field::accept,
					"text/html,application/xhtml+xml,*/*;q=0.8");
			req.set(http::field::accept_encoding, "gzip, deflate");

			auto cookie_header = jar.header_for(host, path, https, unix_now());
			if (!cookie_header.empty()) {
				req.set(http::field::cookie, cookie_header);
			}

			for (const auto &[key, value] : headers) { req.set(key, value); }

			if (!body_content.empty()) {
				req.body() = body_content;
				req.prepare_payload();
			}

			boost::system::error_code ec;
			tcp::resolver resolver(ioc);
			auto results = resolver.resolve(host, port, ec);
			if (ec) {
				spdlog::debug("Cannot resolve {}: {}", host, ec.message());
				return outcome::failure(errc::request_failed);
			}

			Result<http::response<http::string_body>> res =
				outcome::failure(errc::request_failed);

			if (https) {
				beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx);
				if (!SSL_set_tlsext_host_name(
						stream.native_handle(), host.c_str())) {
					return outcome::failure(errc::request_failed);
				}
				stream.set_verify_callback(ssl::host_name_verification(host));

				beast::get_lowest_layer(stream).expires_after(timeout);
				beast::get_lowest_layer(stream).connect(results, ec);
				if (ec) {
					spdlog::debug("Connect to {} failed: {}", host,
								  ec.message());
					return outcome::failure(errc::request_failed);
				}

				stream.handshake(ssl::stream_base::client, ec);
				if (ec) {
					spdlog::debug("TLS handshake with {} failed: {}", host,
								  ec.message());
					return outcome::failure(errc::request_failed);
				}

				res = exchange(stream, req);

				// Shutdown errors (eof, truncation) don't affect the body
				beast::get_lowest_layer(stream).expires_after(
					std::chrono::seconds(2));
				stream.shutdown(ec);
			} else {
				beast::tcp_stream stream(ioc);
				stream.expires_after(timeout);
				stream.connect(results, ec);
				if (ec) {
					spdlog::debug("Connect to {} failed: {}", host,
								  ec.message());
					return outcome::failure(errc::request_failed);
				}

				res = exchange(stream, req);
				stream.socket().shutdown(tcp::socket::shutdown_both, ec);
			}

			if (!res) return res.error();
			auto &msg = res.value();

			for (auto it = msg.find(http::field::set_cookie);
				 it != msg.end() && it->name() == http::field::set_cookie;
				 ++it) {
				jar.set_from_header(it->value(), host, unix_now());
			}

			std::string content_encoding;
			auto encoding_it = msg.find(http::field::content_encoding);
			if (encoding_it != msg.end()) {
				content_encoding = boost::algorithm::to_lower_copy(
					std::string(encoding_it->value()));
			}

			HttpResponse response;
			response.status_code = static_cast<int>(msg.result_int());
			response.body = decompress_body(msg.body(), content_encoding);
			for (auto const &field : msg) {
				response.headers[boost::algorithm::to_lower_copy(
					std::string(field.name_string()))] =
					std::string(field.value());
			}
			response.final_url = url_str;
			return response;

		} catch (const std::exception &e) {
			spdlog::error("Request exception: {}", e.what());
			return outcome::failure(errc::request_failed);
		}
	}

	Result<HttpResponse> request(http::verb method, const std::string &url,
								 std::string body,
								 std::map<std::string, std::string> headers) {
		std::string current = url;
		for (int hop = 0; hop <= kMaxRedirects; ++hop) {
			spdlog::debug("{} {}", std::string(http::to_string(method)),
						  current);
			auto res = perform_request(method, current, body, headers);
			if (!res) return res.error();

			auto &response = res.value();
			auto location = response.headers.find("location");
			if (!is_redirect(response.status_code) ||
				location == response.headers.end()) {
				return res;
			}

			auto next = resolve_reference(current, location->second);
			if (!next) return next.error();

			if (response.status_code == 303 ||
				(method == http::verb::post &&
				 (response.status_code == 301 ||
				  response.status_code == 302))) {
				method = http::verb::get;
				body.clear();
				headers.erase("Content-Type");
			}
			current = std::move(next.value());
		}
		spdlog::warn("Too many redirects starting at {}", url);
		return outcome::failure(errc::too_many_redirects);
	}
};

HttpClient::HttpClient(asio::io_context &ioc, session::CookieJar &jar,
					   std::chrono::seconds timeout)
	: m_impl(std::make_unique<Impl>(ioc, jar, timeout)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse> HttpClient::get(
	const std::string &url, const std::map<std::string, std::string> &headers) {
	return m_impl->request(http::verb::get, url, {}, headers);
}

Result<HttpResponse> HttpClient::post_form(
	const std::string &url, const FormFields &fields,
	const std::map<std::string, std::string> &headers) {
	auto all_headers = headers;
	all_headers["Content-Type"] = "application/x-www-form-urlencoded";
	return m_impl->request(
		http::verb::post, url, encode_form(fields), std::move(all_headers));
}

}  // namespace recfetch::net
