/*
 * shkit diagnostics - fatal validation wrappers
 *
 * The *_or_die functions turn a failed validation predicate into a fatal
 * error: a one-line description followed by the call stack is written to
 * stderr and the fatal path runs. They return only when the value is
 * valid. Callers that need to recover must use the bare predicates from
 * validation.hpp.
 *
 * The fatal path exits the process with status 1 unless a FatalHandler
 * takes over. Test harnesses install throwing_fatal_handler() to turn a
 * fatal validation failure into a test failure.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SHKIT_DIAGNOSTICS_HPP
#define SHKIT_DIAGNOSTICS_HPP

#include "shkit/export.hpp"
#include "shkit/validation.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace shkit {

// ============================================================================
// FATAL REPORTS
// ============================================================================

struct SHKIT_API FatalReport {
    std::string message;
    std::vector<std::string> trace;

    // message and trace, newline terminated
    std::string text() const;
};

class SHKIT_API FatalError : public std::runtime_error {
public:
    explicit FatalError(FatalReport report);

    const FatalReport& report() const noexcept { return report_; }

private:
    FatalReport report_;
};

using FatalHandler = std::function<void(const FatalReport&)>;

// Install handler, returning the previous one. An empty handler restores
// the default.
SHKIT_API FatalHandler set_fatal_handler(FatalHandler handler);

// Handler that throws FatalError.
SHKIT_API FatalHandler throwing_fatal_handler();

/**
 * Installs a fatal handler for the lifetime of the object.
 */
class SHKIT_API ScopedFatalHandler {
public:
    explicit ScopedFatalHandler(FatalHandler handler);
    ~ScopedFatalHandler();

    ScopedFatalHandler(const ScopedFatalHandler&) = delete;
    ScopedFatalHandler& operator=(const ScopedFatalHandler&) = delete;

private:
    FatalHandler previous_;
};

/**
 * Write report to stderr, run the fatal handler, then exit with status 1
 * if the handler returned.
 */
[[noreturn]] SHKIT_API void fatal(const FatalReport& report);

// ============================================================================
// MESSAGE FORMATTING
// ============================================================================

SHKIT_API std::string format_input_failure(const std::string& description,
                                           const std::string& value,
                                           const std::string& caller);

SHKIT_API std::string format_identifier_failure(const std::string& description,
                                                const std::string& value,
                                                const std::string& caller,
                                                IdentifierError error);

// ============================================================================
// FATAL VALIDATION
// ============================================================================

/**
 * Die unless validate_input(value).
 *
 * description names what value is ("program name"). The function
 * reported as the caller is skip_callers - 1 frames above this one, and
 * the trace starts skip_callers frames above print_stack_trace. The
 * default of 2 names and starts at the function that asked for the
 * validation.
 *
 * @throws std::invalid_argument if skip_callers < 1
 */
SHKIT_API void validate_input_or_die(const std::string& description,
                                     const std::string& value,
                                     int skip_callers = 2);

/**
 * Die unless validate_identifier(value). The message distinguishes an
 * empty value, a leading digit and other invalid characters.
 *
 * @throws std::invalid_argument if skip_callers < 1
 */
SHKIT_API void validate_identifier_or_die(const std::string& description,
                                          const std::string& value,
                                          int skip_callers = 2);

} // namespace shkit

#endif // SHKIT_DIAGNOSTICS_HPP
