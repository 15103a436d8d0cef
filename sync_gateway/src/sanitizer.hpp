#pragma once

#include <string>
#include <regex>
#include <vector>

// Scrubs credential-shaped substrings out of error text before it is logged
// or returned to a client. Patterns run in order over the same string; the
// length cap is applied last so a marker is never cut in half.
class SecretSanitizer {
public:
    static constexpr size_t MAX_LENGTH = 500;
    static constexpr size_t MAX_SCAN_LENGTH = 4096;
    static constexpr const char* REDACTED = "[REDACTED]";
    static constexpr const char* TRUNCATED_SUFFIX = "... (truncated)";

    SecretSanitizer();

    std::string sanitize(const std::string& message) const;

    static const SecretSanitizer& instance();

private:
    struct Rule {
        std::regex pattern;
        std::string replacement;
    };

    std::vector<Rule> rules_;
};

// Shorthand for SecretSanitizer::instance().sanitize(message)
std::string sanitize_error_message(const std::string& message);
