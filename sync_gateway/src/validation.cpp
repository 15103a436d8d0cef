#include "validation.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>

bool RequestValidator::is_id_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

std::optional<ValidationError> RequestValidator::validate_account_id(const nlohmann::json& value) {
    if (!value.is_string()) {
        return ValidationError{"accountId", "Account ID must be a string"};
    }

    const auto& id = value.get_ref<const std::string&>();
    if (id.empty() || id.size() > MAX_ACCOUNT_ID_LENGTH) {
        return ValidationError{"accountId", "Invalid account ID length"};
    }
    if (!std::all_of(id.begin(), id.end(), is_id_char)) {
        return ValidationError{"accountId",
            "Account ID may only contain letters, digits, '_' and '-'"};
    }
    return std::nullopt;
}

std::optional<ValidationError> RequestValidator::validate_integration_id(const nlohmann::json& value) {
    if (!value.is_string()) {
        return ValidationError{"integrationId", "Integration ID must be a string"};
    }

    const auto& id = value.get_ref<const std::string&>();
    if (id.empty() || id.size() > MAX_INTEGRATION_ID_LENGTH) {
        return ValidationError{"integrationId", "Invalid integration ID length"};
    }
    if (!std::all_of(id.begin(), id.end(), is_id_char)) {
        return ValidationError{"integrationId", "Integration ID contains invalid characters"};
    }
    return std::nullopt;
}

std::optional<ValidationError> RequestValidator::validate_label(const nlohmann::json& value) {
    if (!value.is_string()) {
        return ValidationError{"label", "Label must be a string"};
    }

    const auto& label = value.get_ref<const std::string&>();
    if (util::trim(label).empty()) {
        return ValidationError{"label", "Label cannot be empty"};
    }
    if (label.size() > MAX_LABEL_LENGTH) {
        return ValidationError{"label",
            "Label must be at most " + std::to_string(MAX_LABEL_LENGTH) + " characters"};
    }
    return std::nullopt;
}

std::optional<ValidationError> RequestValidator::validate_boolean(const std::string& field,
                                                                  const nlohmann::json& value) {
    if (!value.is_boolean()) {
        return ValidationError{field, field + " must be a boolean"};
    }
    return std::nullopt;
}

std::optional<ValidationError> RequestValidator::validate_date_string(const std::string& field,
                                                                      const nlohmann::json& value) {
    if (!value.is_string()) {
        return ValidationError{field, field + " must be a string"};
    }

    const auto& date = value.get_ref<const std::string&>();
    if (!util::epoch_from_date(date)) {
        return ValidationError{field, field + " must be a valid date in YYYY-MM-DD format"};
    }
    return std::nullopt;
}
