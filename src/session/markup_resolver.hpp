#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <recfetch/types.hpp>

namespace recfetch::session {

// Finds the media of a recording page: a video element, then a known player
// iframe, then a player data attribute, else the page itself with referer.
MediaSource resolve_from_markup(std::string_view html,
								const std::string &page_url);

// Rails-style CSRF token from <meta name="csrf-token"> or the hidden
// authenticity_token input.
std::optional<std::string> find_csrf_token(std::string_view html);

// Value of one attribute inside an opening tag, entity-decoded.
std::optional<std::string> tag_attribute(std::string_view tag,
										 std::string_view name);

// Whether the address is the platform's login page
bool is_login_url(std::string_view url);

}  // namespace recfetch::session
