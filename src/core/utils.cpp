#include "mcptools/core/utils.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

#include <uuid.h>

namespace mcptools::utils {

auto generate_uuid() -> std::string {
    static thread_local std::mt19937 rng(std::random_device{}());
    auto gen = uuids::uuid_random_generator(rng);
    return uuids::to_string(gen());
}

auto timestamp_iso(Timestamp tp) -> std::string {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()).count() % 1000;
    auto time = Clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&time, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%FT%T") << '.'
        << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto url_encode(std::string_view s) -> std::string {
    std::ostringstream oss;
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::hex << std::uppercase << std::setfill('0')
                << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
        }
    }
    return oss.str();
}

auto tail(std::string_view s, std::size_t max_bytes) -> std::string {
    if (s.size() <= max_bytes) return std::string(s);
    return "..." + std::string(s.substr(s.size() - max_bytes));
}

} // namespace mcptools::utils
