#include "sanitizer.hpp"

SecretSanitizer::SecretSanitizer() {
    const auto flags = std::regex::ECMAScript | std::regex::optimize;

    // Payment provider secret, restricted and webhook-signing keys
    rules_.push_back({
        std::regex(R"(\b(?:sk_live_|sk_test_|rk_live_|rk_test_|whsec_)[A-Za-z0-9_-]{12,})", flags),
        REDACTED
    });

    rules_.push_back({
        std::regex(R"(\bBearer\s+\S+)", flags | std::regex::icase),
        std::string("Bearer ") + REDACTED
    });

    // Generic key-like words followed by a long alphanumeric run
    rules_.push_back({
        std::regex(R"(\b(?:api|key|token|secret|password|auth)[_-]?[A-Za-z0-9]{20,}\b)",
                   flags | std::regex::icase),
        REDACTED
    });

    // Raw key material: 32+ hex chars with no recognisable prefix
    rules_.push_back({
        std::regex(R"(\b[0-9a-fA-F]{32,}\b)", flags),
        REDACTED
    });
}

const SecretSanitizer& SecretSanitizer::instance() {
    static const SecretSanitizer sanitizer;
    return sanitizer;
}

std::string SecretSanitizer::sanitize(const std::string& message) const {
    if (message.empty()) return message;

    // Only a bounded prefix is scanned: libstdc++ regex recurses once per
    // repeated character and overflows the stack on very long runs.
    bool clipped = message.size() > MAX_SCAN_LENGTH;
    std::string sanitized = clipped ? message.substr(0, MAX_SCAN_LENGTH) : message;

    for (const auto& rule : rules_) {
        try {
            sanitized = std::regex_replace(sanitized, rule.pattern, rule.replacement);
        } catch (const std::regex_error&) {
            // Backtracking limit on pathological input: drop the text rather
            // than risk returning it unredacted.
            return REDACTED;
        }
    }

    if (clipped || sanitized.size() > MAX_LENGTH) {
        sanitized = sanitized.substr(0, MAX_LENGTH) + TRUNCATED_SUFFIX;
    }

    return sanitized;
}

std::string sanitize_error_message(const std::string& message) {
    return SecretSanitizer::instance().sanitize(message);
}
