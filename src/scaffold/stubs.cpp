#include "shkit/stubs.hpp"
#include "shkit/call_stack.hpp"
#include "shkit/diagnostics.hpp"
#include "shkit/logging.hpp"
#include "shkit/platform.hpp"

#include <algorithm>

namespace shkit {

ProgramStubs::ProgramStubs(TestRoot& root)
    : root_(root), bin_dir_(root.bin_dir()) {}

ProgramStubs::~ProgramStubs() {
    restore_all();
}

ScaffoldResult ProgramStubs::stub(const std::string& name, const std::vector<std::string>& body) {
    SHKIT_FRAME();
    SHKIT_HERE();
    validate_input_or_die("program name", name);

    ScaffoldResult result;
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != std::string::npos) {
        result.error = "program name must be a bare file name: \"" + name + "\"";
        return result;
    }

    result = root_.create_script("bin/" + name, body);
    if (!result.ok) {
        return result;
    }

    if (std::find(stubbed_.begin(), stubbed_.end(), name) == stubbed_.end()) {
        stubbed_.push_back(name);
    }
    prepend_bin_dir_to_path();

    logger()->debug("stubbed {} at {}", name, result.path);
    return result;
}

bool ProgramStubs::restore(const std::string& name) {
    auto it = std::find(stubbed_.begin(), stubbed_.end(), name);
    if (it == stubbed_.end()) {
        return false;
    }
    bool removed = remove_file(bin_dir_ + "/" + name);
    if (!removed) {
        logger()->warn("failed to remove stub {}", name);
    }
    stubbed_.erase(it);
    return removed;
}

void ProgramStubs::restore_all() {
    while (!stubbed_.empty()) {
        restore(stubbed_.back());
    }

    if (saved_path_) {
        const auto& original = *saved_path_;
        if (original) {
            set_env("PATH", *original);
        } else {
            unset_env("PATH");
        }
        saved_path_.reset();
        logger()->debug("restored PATH");
    }
}

void ProgramStubs::prepend_bin_dir_to_path() {
    auto current = get_env("PATH");
    std::string value = current.value_or("");

    std::string first = value.substr(0, value.find(get_path_separator()));
    if (first == bin_dir_) {
        return;
    }

    if (!saved_path_) {
        saved_path_.emplace(current);
    }
    set_env("PATH", value.empty() ? bin_dir_ : bin_dir_ + get_path_separator() + value);
}

} // namespace shkit
