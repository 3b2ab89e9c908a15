#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace mcpgate {

/**
 * @brief Current UTC time formatted as RFC 3339 (e.g. 2025-01-31T12:00:00Z)
 */
std::string rfc3339_now();

/**
 * @brief Nanoseconds since the Unix epoch
 */
std::int64_t unix_nanos();

/**
 * @brief Build a process-unique identifier "<prefix>_<nanos>_<sequence>"
 */
std::string make_id(std::string_view prefix);

/**
 * @brief Check that a name is usable as a URL path segment
 *
 * Accepts alphanumerics, dash and underscore; rejects empty names.
 */
bool is_url_safe(std::string_view name);

/**
 * @brief Replace invalid UTF-8 sequences with U+FFFD
 */
std::string to_valid_utf8(std::string_view text);

} // namespace mcpgate
