#include "shkit/diagnostics.hpp"
#include "shkit/call_stack.hpp"
#include "shkit/logging.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>

namespace shkit {

namespace {

std::mutex g_handler_mutex;
FatalHandler g_handler;

FatalHandler current_handler() {
    std::lock_guard<std::mutex> lock(g_handler_mutex);
    return g_handler;
}

void check_skip_callers(int skip_callers) {
    if (skip_callers < 1) {
        throw std::invalid_argument("skip_callers must be at least 1, got " +
                                    std::to_string(skip_callers));
    }
}

// Called directly from an *_or_die function, whose frame is index 0 of
// the snapshot. Neither helper below registers a frame of its own.
std::string calling_function(int skip_callers) {
    auto frames = with_entry_frame(CallStack::snapshot());
    auto index = static_cast<std::size_t>(skip_callers - 1);
    if (index >= frames.size()) {
        return frames.back().function;
    }
    return frames[index].function;
}

// Matches print_stack_trace(skip_callers) issued from the *_or_die frame:
// print_stack_trace would add one frame of its own on top.
[[noreturn]] void die_with_trace(std::string message, int skip_callers) {
    FatalReport report;
    report.message = std::move(message);
    report.trace = format_stack_trace(CallStack::snapshot(),
                                      static_cast<std::size_t>(skip_callers - 1));
    fatal(report);
}

} // namespace

// ============================================================================
// Fatal Reports
// ============================================================================

std::string FatalReport::text() const {
    std::string out = message + "\n";
    for (const auto& line : trace) {
        out += line + "\n";
    }
    return out;
}

FatalError::FatalError(FatalReport report)
    : std::runtime_error(report.message), report_(std::move(report)) {}

FatalHandler set_fatal_handler(FatalHandler handler) {
    std::lock_guard<std::mutex> lock(g_handler_mutex);
    FatalHandler previous = std::move(g_handler);
    g_handler = std::move(handler);
    return previous;
}

FatalHandler throwing_fatal_handler() {
    return [](const FatalReport& report) {
        throw FatalError(report);
    };
}

ScopedFatalHandler::ScopedFatalHandler(FatalHandler handler)
    : previous_(set_fatal_handler(std::move(handler))) {}

ScopedFatalHandler::~ScopedFatalHandler() {
    set_fatal_handler(std::move(previous_));
}

void fatal(const FatalReport& report) {
    std::cerr << report.text();
    std::cerr.flush();

    logger()->debug("fatal: {}", report.message);

    if (auto handler = current_handler()) {
        handler(report);
    }
    std::exit(EXIT_FAILURE);
}

// ============================================================================
// Message Formatting
// ============================================================================

std::string format_input_failure(const std::string& description,
                                 const std::string& value,
                                 const std::string& caller) {
    return description + " \"" + value + "\" for " + caller +
           " contains unescaped shell metacharacters or control operators at:";
}

std::string format_identifier_failure(const std::string& description,
                                      const std::string& value,
                                      const std::string& caller,
                                      IdentifierError error) {
    if (error == IdentifierError::None) {
        error = IdentifierError::InvalidCharacters;
    }
    return description + " \"" + value + "\" for " + caller + " " +
           identifier_error_reason(error) + " at:";
}

// ============================================================================
// Fatal Validation
// ============================================================================

void validate_input_or_die(const std::string& description,
                           const std::string& value,
                           int skip_callers) {
    SHKIT_FRAME();
    check_skip_callers(skip_callers);

    if (validate_input(value)) {
        return;
    }
    SHKIT_HERE();
    die_with_trace(format_input_failure(description, value, calling_function(skip_callers)),
                   skip_callers);
}

void validate_identifier_or_die(const std::string& description,
                                const std::string& value,
                                int skip_callers) {
    SHKIT_FRAME();
    check_skip_callers(skip_callers);

    auto error = classify_identifier(value);
    if (error == IdentifierError::None) {
        return;
    }
    SHKIT_HERE();
    die_with_trace(format_identifier_failure(description, value,
                                             calling_function(skip_callers), error),
                   skip_callers);
}

} // namespace shkit
