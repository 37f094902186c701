#pragma once

#include "shkit/export.hpp"

#include <string>
#include <vector>

namespace shkit {

// Split captured output into lines. A trailing "\r" is stripped from each
// line, interior empty lines are kept and a final newline does not add an
// empty last line.
SHKIT_API std::vector<std::string> split_output_into_lines(const std::string& output);

SHKIT_API std::string join(const std::string& delimiter, const std::vector<std::string>& items);

// Join items and export the result as environment variable var_name.
// var_name must be a valid identifier; anything else is fatal.
SHKIT_API std::string join_into_env(const std::string& var_name,
                                    const std::string& delimiter,
                                    const std::vector<std::string>& items);

} // namespace shkit
