/*
 * shkit call stack - explicit call-frame registry
 *
 * C++ offers no portable way to recover source file, line and function
 * name of every active frame at runtime. Functions that want to appear in
 * diagnostics register themselves with SHKIT_FRAME(); the registry is
 * thread-local, so each thread sees only its own chain.
 *
 * A frame starts out at the line of SHKIT_FRAME(). SHKIT_HERE() moves it
 * to the current line, so placing it before a call makes the trace point
 * at that call.
 *
 *   void create_fixture(const std::string& name) {
 *       SHKIT_FRAME();
 *       ...
 *       SHKIT_HERE();
 *       shkit::validate_input_or_die("fixture name", name);
 *   }
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SHKIT_CALL_STACK_HPP
#define SHKIT_CALL_STACK_HPP

#include "shkit/export.hpp"

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

namespace shkit {

// ============================================================================
// CALL FRAMES
// ============================================================================

/**
 * One entry of the active call chain.
 */
struct CallFrame {
    std::string file;
    int line = 0;
    std::string function;
};

/**
 * Thread-local registry of the frames pushed by FrameGuard.
 */
class SHKIT_API CallStack {
public:
    static void push(CallFrame frame);
    static void pop();

    // Set the line of the innermost frame. No-op when the stack is empty.
    static void mark(int line);

    // Active frames, innermost first.
    static std::vector<CallFrame> snapshot();

    static std::size_t depth();
};

/**
 * Registers a frame for the lifetime of the guard.
 */
class SHKIT_API FrameGuard {
public:
    FrameGuard(const char* file, int line, const char* function);
    ~FrameGuard();

    FrameGuard(const FrameGuard&) = delete;
    FrameGuard& operator=(const FrameGuard&) = delete;
};

#define SHKIT_FRAME_CONCAT_INNER(a, b) a##b
#define SHKIT_FRAME_CONCAT(a, b) SHKIT_FRAME_CONCAT_INNER(a, b)

#define SHKIT_FRAME() \
    ::shkit::FrameGuard SHKIT_FRAME_CONCAT(shkit_frame_guard_, __LINE__)(__FILE__, __LINE__, __func__)

#define SHKIT_HERE() ::shkit::CallStack::mark(__LINE__)

// ============================================================================
// PROGRAM ENTRY
// ============================================================================

// Record the invocation path used for the entry frame, normally argv[0].
SHKIT_API void set_program_path(const std::string& path);

// Recorded invocation path, else /proc/self/exe, else "shkit".
SHKIT_API std::string program_path();

// {program_path(), 0, "main"}
SHKIT_API CallFrame entry_frame();

// ============================================================================
// STACK TRACES
// ============================================================================

// frames with the program entry point guaranteed as the outermost entry.
SHKIT_API std::vector<CallFrame> with_entry_frame(std::vector<CallFrame> frames);

/**
 * Format frames[skip..] as "  <file>:<line> <function>", innermost first.
 *
 * The program entry point is always the last line. When no frame named
 * "main" was recorded, entry_frame() is appended; a recorded main frame
 * without a file falls back to program_path().
 */
SHKIT_API std::vector<std::string> format_stack_trace(const std::vector<CallFrame>& frames,
                                                      std::size_t skip);

/**
 * Write the current trace to out.
 *
 * Depth 0 is print_stack_trace itself, so the default skip of 1 starts at
 * its caller.
 */
SHKIT_API void print_stack_trace(std::size_t skip = 1, std::ostream& out = std::cerr);

} // namespace shkit

#endif // SHKIT_CALL_STACK_HPP
