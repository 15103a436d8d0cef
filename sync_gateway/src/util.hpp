#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

namespace util {
    // Random v4 UUID from the OpenSSL CSPRNG. Throws if the RNG is unavailable.
    std::string generate_uuid();

    std::string current_iso8601();
    int64_t current_timestamp_ms();

    // YYYY-MM-DD (UTC) for a unix timestamp in seconds
    std::string date_from_epoch(int64_t epoch_seconds);
    // Unix seconds for 00:00 UTC of a YYYY-MM-DD date; nullopt if malformed
    std::optional<int64_t> epoch_from_date(const std::string& date);

    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::string to_lower(std::string str);
    std::string to_upper(std::string str);
}
