#include "shkit/validation.hpp"

namespace shkit {

namespace {

bool is_ascii_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

} // namespace

// ============================================================================
// Input Safety
// ============================================================================

std::optional<std::size_t> find_unescaped_metacharacter(std::string_view value) {
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (!is_dangerous_character(value[i])) {
            continue;
        }
        if (i > 0 && value[i - 1] == kEscapeMarker) {
            continue;
        }
        return i;
    }
    return std::nullopt;
}

bool validate_input(std::string_view value) {
    return !find_unescaped_metacharacter(value).has_value();
}

// ============================================================================
// Identifiers
// ============================================================================

IdentifierError classify_identifier(std::string_view value) {
    if (value.empty()) {
        return IdentifierError::Empty;
    }
    if (is_ascii_digit(value.front())) {
        return IdentifierError::LeadingDigit;
    }
    if (!is_ascii_alpha(value.front()) && value.front() != '_') {
        return IdentifierError::InvalidCharacters;
    }
    for (char c : value.substr(1)) {
        if (!is_ascii_alpha(c) && !is_ascii_digit(c) && c != '_') {
            return IdentifierError::InvalidCharacters;
        }
    }
    return IdentifierError::None;
}

bool validate_identifier(std::string_view value) {
    return classify_identifier(value) == IdentifierError::None;
}

const char* identifier_error_reason(IdentifierError error) {
    switch (error) {
        case IdentifierError::None: return "";
        case IdentifierError::Empty: return "must not be empty";
        case IdentifierError::LeadingDigit: return "must not start with a number";
        case IdentifierError::InvalidCharacters: return "contains invalid identifier characters";
    }
    return "contains invalid identifier characters";
}

} // namespace shkit
