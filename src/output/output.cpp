#include "shkit/output.hpp"
#include "shkit/call_stack.hpp"
#include "shkit/diagnostics.hpp"
#include "shkit/logging.hpp"
#include "shkit/platform.hpp"

namespace shkit {

std::vector<std::string> split_output_into_lines(const std::string& output) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < output.size()) {
        std::size_t end = output.find('\n', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        std::string line = output.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

std::string join(const std::string& delimiter, const std::vector<std::string>& items) {
    std::string result;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += delimiter;
        result += items[i];
    }
    return result;
}

std::string join_into_env(const std::string& var_name,
                          const std::string& delimiter,
                          const std::vector<std::string>& items) {
    SHKIT_FRAME();
    SHKIT_HERE();
    validate_identifier_or_die("result variable name", var_name);

    std::string value = join(delimiter, items);
    if (!set_env(var_name, value)) {
        logger()->warn("failed to export {}", var_name);
    }
    return value;
}

} // namespace shkit
