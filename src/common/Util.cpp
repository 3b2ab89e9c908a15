#include "Util.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>

namespace mcpgate {

std::string rfc3339_now() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

std::int64_t unix_nanos() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string make_id(std::string_view prefix) {
    static std::atomic<std::uint64_t> sequence{0};

    std::string id(prefix);
    id += "_";
    id += std::to_string(unix_nanos());
    id += "_";
    id += std::to_string(sequence.fetch_add(1));
    return id;
}

bool is_url_safe(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

std::string to_valid_utf8(std::string_view text) {
    using nlohmann::json;
    const std::string encoded = json(std::string(text)).dump(-1, ' ', false, json::error_handler_t::replace);
    return json::parse(encoded).get<std::string>();
}

} // namespace mcpgate
