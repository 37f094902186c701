#include <doctest/doctest.h>
#include <shkit/call_stack.hpp>
#include <shkit/diagnostics.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

using namespace shkit;

namespace {

int g_validator_frame_line = 0;
int g_validator_line = 0;
int g_caller_line = 0;

void check_variable_name(const std::string& value, int skip_callers) {
    SHKIT_FRAME(); g_validator_frame_line = __LINE__;
    std::string name = value;
    if (name.empty()) {
        name = "unset";
    }

    SHKIT_HERE(); g_validator_line = __LINE__;
    validate_input_or_die("variable name", name, skip_callers);
}

void declare_variable(const std::string& value, int skip_callers = 2) {
    SHKIT_FRAME();
    auto depth = CallStack::depth();
    (void)depth;

    SHKIT_HERE(); g_caller_line = __LINE__;
    check_variable_name(value, skip_callers);
}

int g_command_line = 0;
int g_argument_line = 0;

void check_command(const std::string& command, const std::string& argument) {
    SHKIT_FRAME();
    SHKIT_HERE(); g_command_line = __LINE__;
    validate_input_or_die("command", command);

    SHKIT_HERE(); g_argument_line = __LINE__;
    validate_input_or_die("argument", argument);
}

FatalReport capture_command_failure(const std::string& command, const std::string& argument) {
    ScopedFatalHandler handler(throwing_fatal_handler());
    try {
        check_command(command, argument);
    } catch (const FatalError& e) {
        return e.report();
    }
    FAIL("check_command returned for \"" << command << "\" \"" << argument << "\"");
    return {};
}

void check_identifier(const std::string& value, int skip_callers) {
    SHKIT_FRAME();
    validate_identifier_or_die("result variable", value, skip_callers);
}

void assign_result(const std::string& value, int skip_callers = 2) {
    SHKIT_FRAME();
    check_identifier(value, skip_callers);
}

FatalReport capture_input_failure(const std::string& value, int skip_callers = 2) {
    ScopedFatalHandler handler(throwing_fatal_handler());
    try {
        declare_variable(value, skip_callers);
    } catch (const FatalError& e) {
        return e.report();
    }
    FAIL("validate_input_or_die returned for \"" << value << "\"");
    return {};
}

FatalReport capture_identifier_failure(const std::string& value, int skip_callers = 2) {
    ScopedFatalHandler handler(throwing_fatal_handler());
    try {
        assign_result(value, skip_callers);
    } catch (const FatalError& e) {
        return e.report();
    }
    FAIL("validate_identifier_or_die returned for \"" << value << "\"");
    return {};
}

// Run fn in a child with the default fatal handler; returns the exit status.
template <typename Fn>
int exit_status_of(Fn fn) {
    std::fflush(nullptr);
    pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        set_fatal_handler({});
        fn();
        _exit(0);
    }
    int status = 0;
    REQUIRE(waitpid(pid, &status, 0) == pid);
    REQUIRE(WIFEXITED(status));
    return WEXITSTATUS(status);
}

} // namespace

// ============================================================================
// Message Formatting
// ============================================================================

TEST_CASE("format_input_failure message") {
    CHECK(format_input_failure("name", "bad;value", "setup_fixture") ==
          "name \"bad;value\" for setup_fixture contains unescaped shell "
          "metacharacters or control operators at:");
}

TEST_CASE("format_identifier_failure message per reason") {
    CHECK(format_identifier_failure("var", "", "fn", IdentifierError::Empty) ==
          "var \"\" for fn must not be empty at:");
    CHECK(format_identifier_failure("var", "2foo", "fn", IdentifierError::LeadingDigit) ==
          "var \"2foo\" for fn must not start with a number at:");
    CHECK(format_identifier_failure("var", "a-b", "fn", IdentifierError::InvalidCharacters) ==
          "var \"a-b\" for fn contains invalid identifier characters at:");
}

TEST_CASE("FatalReport text joins message and trace") {
    FatalReport report{"msg at:", {"  a.cpp:1 f", "  b.cpp:2 main"}};
    CHECK(report.text() == "msg at:\n  a.cpp:1 f\n  b.cpp:2 main\n");
}

// ============================================================================
// validate_input_or_die
// ============================================================================

TEST_CASE("validate_input_or_die returns quietly for safe input") {
    ScopedFatalHandler handler(throwing_fatal_handler());
    CHECK_NOTHROW(declare_variable("hello world"));
    CHECK_NOTHROW(declare_variable("escaped \\$HOME"));
}

TEST_CASE("validate_input_or_die names the validating function") {
    auto report = capture_input_failure("bad;value");
    CHECK(report.message ==
          "variable name \"bad;value\" for check_variable_name contains unescaped shell "
          "metacharacters or control operators at:");
}

TEST_CASE("validate_input_or_die trace starts at the validating function") {
    auto report = capture_input_failure("bad;value");
    REQUIRE(report.trace.size() == 3);
    CHECK(report.trace[0] == "  " + std::string(__FILE__) + ":" +
                             std::to_string(g_validator_line) + " check_variable_name");
    CHECK(report.trace[1] == "  " + std::string(__FILE__) + ":" +
                             std::to_string(g_caller_line) + " declare_variable");
    CHECK(report.trace[2] == "  " + program_path() + ":0 main");
}

TEST_CASE("trace lines point at the call rather than the frame registration") {
    auto report = capture_input_failure("bad;value");
    REQUIRE(report.trace.size() == 3);
    CHECK(g_validator_line != g_validator_frame_line);
    CHECK(report.trace[0].find(":" + std::to_string(g_validator_frame_line) + " ") ==
          std::string::npos);
    CHECK(report.trace[0] == "  " + std::string(__FILE__) + ":" +
                             std::to_string(g_validator_line) + " check_variable_name");
}

TEST_CASE("trace identifies which of several validations failed") {
    auto command = capture_command_failure("ls;rm", "ok");
    REQUIRE_FALSE(command.trace.empty());
    CHECK(command.trace[0] == "  " + std::string(__FILE__) + ":" +
                              std::to_string(g_command_line) + " check_command");

    auto argument = capture_command_failure("ls", "a|b");
    REQUIRE_FALSE(argument.trace.empty());
    CHECK(argument.trace[0] == "  " + std::string(__FILE__) + ":" +
                               std::to_string(g_argument_line) + " check_command");
    CHECK(argument.message.find("argument \"a|b\" for check_command ") == 0);
}

TEST_CASE("raising skip_callers removes exactly one frame from the top") {
    auto two = capture_input_failure("bad;value", 2);
    auto three = capture_input_failure("bad;value", 3);

    REQUIRE(three.trace.size() + 1 == two.trace.size());
    CHECK(std::vector<std::string>(two.trace.begin() + 1, two.trace.end()) == three.trace);
    CHECK(three.message.find(" for declare_variable ") != std::string::npos);
}

TEST_CASE("skip_callers of one reports the reporter itself") {
    auto report = capture_input_failure("`id`", 1);
    CHECK(report.message.find(" for validate_input_or_die ") != std::string::npos);
    REQUIRE_FALSE(report.trace.empty());
    CHECK(report.trace[0].find(" validate_input_or_die") != std::string::npos);
}

TEST_CASE("skip_callers beyond the stack still reports the entry point") {
    auto report = capture_input_failure("a|b", 50);
    CHECK(report.message.find(" for main ") != std::string::npos);
    REQUIRE(report.trace.size() == 1);
    CHECK(report.trace[0] == "  " + program_path() + ":0 main");
}

TEST_CASE("skip_callers below one is a usage error") {
    ScopedFatalHandler handler(throwing_fatal_handler());
    CHECK_THROWS_AS(validate_input_or_die("name", "value", 0), std::invalid_argument);
    CHECK_THROWS_AS(validate_identifier_or_die("name", "value", -1), std::invalid_argument);
}

TEST_CASE("call stack is unwound after a fatal failure is caught") {
    auto before = CallStack::depth();
    capture_input_failure("x;y");
    CHECK(CallStack::depth() == before);
}

// ============================================================================
// validate_identifier_or_die
// ============================================================================

TEST_CASE("validate_identifier_or_die returns quietly for identifiers") {
    ScopedFatalHandler handler(throwing_fatal_handler());
    CHECK_NOTHROW(assign_result("_foo2"));
    CHECK_NOTHROW(assign_result("RESULT"));
}

TEST_CASE("validate_identifier_or_die reports an empty value") {
    auto report = capture_identifier_failure("");
    CHECK(report.message == "result variable \"\" for check_identifier must not be empty at:");
}

TEST_CASE("validate_identifier_or_die reports a leading digit") {
    auto report = capture_identifier_failure("2foo");
    CHECK(report.message ==
          "result variable \"2foo\" for check_identifier must not start with a number at:");
}

TEST_CASE("validate_identifier_or_die reports invalid characters") {
    auto report = capture_identifier_failure("foo-bar");
    CHECK(report.message ==
          "result variable \"foo-bar\" for check_identifier contains invalid "
          "identifier characters at:");
    REQUIRE(report.trace.size() == 3);
    CHECK(report.trace[0].find(" check_identifier") != std::string::npos);
    CHECK(report.trace[1].find(" assign_result") != std::string::npos);
}

// ============================================================================
// Fatal Path
// ============================================================================

TEST_CASE("set_fatal_handler returns the previous handler") {
    int calls = 0;
    FatalHandler counting = [&calls](const FatalReport&) { ++calls; };

    auto original = set_fatal_handler(counting);
    auto restored = set_fatal_handler(std::move(original));
    REQUIRE(restored);
    restored(FatalReport{});
    CHECK(calls == 1);
}

TEST_CASE("ScopedFatalHandler restores the previous handler") {
    int outer_calls = 0;
    ScopedFatalHandler outer([&outer_calls](const FatalReport&) { ++outer_calls; });
    {
        ScopedFatalHandler inner(throwing_fatal_handler());
    }
    auto current = set_fatal_handler({});
    REQUIRE(current);
    current(FatalReport{});
    CHECK(outer_calls == 1);
    set_fatal_handler(std::move(current));
}

TEST_CASE("validate_input_or_die terminates the process with status 1") {
    CHECK(exit_status_of([] { validate_input_or_die("name", "bad;value"); }) == 1);
}

TEST_CASE("validate_identifier_or_die terminates the process with status 1") {
    CHECK(exit_status_of([] { validate_identifier_or_die("name", "9x"); }) == 1);
}

TEST_CASE("the process exits even when the handler returns") {
    CHECK(exit_status_of([] {
        set_fatal_handler([](const FatalReport&) {});
        validate_input_or_die("name", "a&b");
    }) == 1);
}

TEST_CASE("successful validation does not terminate") {
    CHECK(exit_status_of([] { validate_input_or_die("name", "fine"); }) == 0);
}
