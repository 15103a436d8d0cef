#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

struct ValidationError {
    std::string field;
    std::string message;
};

// Input checks shared by the API routes and the account loader. Messages are
// safe to show a client: they describe the rule, never the rejected value.
class RequestValidator {
public:
    static constexpr size_t MAX_ACCOUNT_ID_LENGTH = 200;
    static constexpr size_t MAX_INTEGRATION_ID_LENGTH = 100;
    static constexpr size_t MAX_LABEL_LENGTH = 200;

    static std::optional<ValidationError> validate_account_id(const nlohmann::json& value);
    static std::optional<ValidationError> validate_integration_id(const nlohmann::json& value);
    static std::optional<ValidationError> validate_label(const nlohmann::json& value);
    static std::optional<ValidationError> validate_boolean(const std::string& field,
                                                           const nlohmann::json& value);
    static std::optional<ValidationError> validate_date_string(const std::string& field,
                                                               const nlohmann::json& value);

private:
    static bool is_id_char(char c);
};
