#pragma once

#include <boost/charconv.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <recfetch/result.hpp>

namespace recfetch::utils {

// =============================================================================
// Safe numeric conversions utilizing boost::charconv
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv) {
	T val;
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::invalid_number_format);
}

// Wrappers for common uses
inline Result<int> to_int(std::string_view sv) { return to_number<int>(sv); }

inline Result<long long> to_long(std::string_view sv) {
	return to_number<long long>(sv);
}

inline Result<double> to_double(std::string_view sv) {
	return to_number<double>(sv);
}

// =============================================================================
// Text helpers for log output
// =============================================================================

// First line of a tool's output, cut to max_len characters
inline std::string first_line(std::string_view text, size_t max_len) {
	auto end = text.find('\n');
	auto line = text.substr(0, end);
	if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
	return std::string(line.substr(0, max_len));
}

inline std::string truncate(std::string_view text, size_t max_len) {
	if (text.size() <= max_len) return std::string(text);
	return std::string(text.substr(0, max_len)) + "...";
}

// =============================================================================
// JSON helpers
// =============================================================================

/// Read a field from a JSON object. Returns std::nullopt if the key is
/// missing or the value can't be converted.
template <typename T>
std::optional<T> json_field(const nlohmann::json &j, const std::string &key) {
	if (!j.is_object() || !j.contains(key)) return std::nullopt;

	try {
		return j.at(key).get<T>();
	} catch (const nlohmann::json::exception &) { return std::nullopt; }
}

/// Read a field with a default value (never returns nullopt)
template <typename T>
T json_field_default(const nlohmann::json &j, const std::string &key,
					 T default_val) {
	auto result = json_field<T>(j, key);
	return result.value_or(std::move(default_val));
}

}  // namespace recfetch::utils
