#pragma once

#include "shkit/export.hpp"
#include "shkit/test_root.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shkit {

/**
 * Stub executables shadowing real programs through PATH.
 *
 * Stubs are scripts in TestRoot::bin_dir(). The first stub puts bin_dir()
 * at the front of PATH; restore_all() (and the destructor) removes every
 * stub and puts the original PATH back.
 */
class SHKIT_API ProgramStubs {
public:
    explicit ProgramStubs(TestRoot& root);
    ~ProgramStubs();

    ProgramStubs(const ProgramStubs&) = delete;
    ProgramStubs& operator=(const ProgramStubs&) = delete;

    // name must be safe shell input and a bare file name.
    ScaffoldResult stub(const std::string& name, const std::vector<std::string>& body);

    bool restore(const std::string& name);

    void restore_all();

    const std::vector<std::string>& stubbed() const { return stubbed_; }

    const std::string& bin_dir() const { return bin_dir_; }

private:
    void prepend_bin_dir_to_path();

    TestRoot& root_;
    std::string bin_dir_;
    std::vector<std::string> stubbed_;
    std::optional<std::optional<std::string>> saved_path_;  // outer: PATH modified
};

} // namespace shkit
