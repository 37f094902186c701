#pragma once

/**
 * @file validation.hpp
 * @brief Predicates guarding strings destined for dynamic evaluation.
 *
 * Call these before interpolating a string into generated shell text, an
 * eval'd command, or a dynamically assigned variable name. They never
 * throw; the fatal variants live in diagnostics.hpp.
 *
 * @example
 * ```cpp
 * if (!shkit::validate_identifier(name)) {
 *     return {false, "bad variable name: " + name};
 * }
 * ```
 */

#include "shkit/export.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace shkit {

// ============================================================================
// Rule Sets
// ============================================================================

// Characters that alter the meaning of dynamically evaluated shell text
// when they appear unescaped.
inline constexpr std::string_view kDangerousCharacters = "`\";$()&|<>\n\r";

inline constexpr char kEscapeMarker = '\\';

inline constexpr bool is_dangerous_character(char c) {
    return kDangerousCharacters.find(c) != std::string_view::npos;
}

// ============================================================================
// Input Safety
// ============================================================================

// Offset of the first dangerous character not immediately preceded by a
// backslash, or nullopt when the value is safe.
//
// Only the single preceding byte is inspected: "\\$" counts as an escaped
// '$' even though the backslash is itself escaped.
SHKIT_API std::optional<std::size_t> find_unescaped_metacharacter(std::string_view value);

// True iff value contains no unescaped dangerous character.
SHKIT_API bool validate_input(std::string_view value);

// ============================================================================
// Identifiers
// ============================================================================

enum class IdentifierError {
    None,
    Empty,
    LeadingDigit,
    InvalidCharacters,
};

// Classify value against ^[A-Za-z_][A-Za-z0-9_]*$ (ASCII only).
// Reasons are checked in declaration order.
SHKIT_API IdentifierError classify_identifier(std::string_view value);

// True iff value is a complete identifier.
SHKIT_API bool validate_identifier(std::string_view value);

// Human-readable reason used in diagnostics; empty for IdentifierError::None.
SHKIT_API const char* identifier_error_reason(IdentifierError error);

} // namespace shkit
