#pragma once

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <recfetch/result.hpp>

namespace recfetch::session {
class CookieJar;
}

namespace recfetch::net {

namespace asio = boost::asio;

struct HttpResponse {
	int status_code = 0;
	std::string body;
	std::map<std::string, std::string> headers;
	// Address that produced this response after following redirects
	std::string final_url;
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

// Resolves `reference` against `base` ("/x" on "https://h/a/b" gives
// "https://h/x"). Absolute references come back normalized.
Result<std::string> resolve_reference(std::string_view base,
									  std::string_view reference);

// application/x-www-form-urlencoded body
std::string encode_form(const FormFields &fields);

// Blocking HTTP(S) client. Sends cookies from the jar, stores the ones the
// server sets and follows redirects.
class HttpClient {
   public:
	static constexpr int kMaxRedirects = 10;

	HttpClient(asio::io_context &ioc, session::CookieJar &jar,
			   std::chrono::seconds timeout);
	~HttpClient();
	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;

	Result<HttpResponse> get(
		const std::string &url,
		const std::map<std::string, std::string> &headers = {});

	// 302/303 answers are followed with a GET
	Result<HttpResponse> post_form(
		const std::string &url, const FormFields &fields,
		const std::map<std::string, std::string> &headers = {});

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

}  // namespace recfetch::net
