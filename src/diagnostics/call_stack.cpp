#include "shkit/call_stack.hpp"

#include <mutex>

#ifndef _WIN32
#include <limits.h>
#include <unistd.h>
#endif

namespace shkit {

namespace {

thread_local std::vector<CallFrame> t_frames;

std::mutex g_program_path_mutex;
std::string g_program_path;

std::string read_self_exe() {
#ifdef __linux__
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len > 0) {
        buf[len] = '\0';
        return buf;
    }
#endif
    return "";
}

std::string format_frame(const CallFrame& frame) {
    return "  " + frame.file + ":" + std::to_string(frame.line) + " " + frame.function;
}

} // namespace

// ============================================================================
// CallStack
// ============================================================================

void CallStack::push(CallFrame frame) {
    t_frames.push_back(std::move(frame));
}

void CallStack::pop() {
    if (!t_frames.empty()) {
        t_frames.pop_back();
    }
}

void CallStack::mark(int line) {
    if (!t_frames.empty()) {
        t_frames.back().line = line;
    }
}

std::vector<CallFrame> CallStack::snapshot() {
    return std::vector<CallFrame>(t_frames.rbegin(), t_frames.rend());
}

std::size_t CallStack::depth() {
    return t_frames.size();
}

FrameGuard::FrameGuard(const char* file, int line, const char* function) {
    CallStack::push({file ? file : "", line, function ? function : ""});
}

FrameGuard::~FrameGuard() {
    CallStack::pop();
}

// ============================================================================
// Program Entry
// ============================================================================

void set_program_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_program_path_mutex);
    g_program_path = path;
}

std::string program_path() {
    {
        std::lock_guard<std::mutex> lock(g_program_path_mutex);
        if (!g_program_path.empty()) {
            return g_program_path;
        }
    }
    std::string exe = read_self_exe();
    if (!exe.empty()) {
        return exe;
    }
    return "shkit";
}

CallFrame entry_frame() {
    return {program_path(), 0, "main"};
}

// ============================================================================
// Stack Traces
// ============================================================================

std::vector<CallFrame> with_entry_frame(std::vector<CallFrame> frames) {
    bool has_main = false;
    for (auto& frame : frames) {
        if (frame.function == "main") {
            has_main = true;
            if (frame.file.empty()) {
                frame.file = program_path();
            }
        }
    }
    if (!has_main) {
        frames.push_back(entry_frame());
    }
    return frames;
}

std::vector<std::string> format_stack_trace(const std::vector<CallFrame>& frames,
                                            std::size_t skip) {
    auto complete = with_entry_frame(frames);

    std::vector<std::string> lines;
    for (std::size_t i = skip; i < complete.size(); ++i) {
        lines.push_back(format_frame(complete[i]));
    }
    // The entry point survives any skip count.
    if (lines.empty()) {
        lines.push_back(format_frame(complete.back()));
    }
    return lines;
}

void print_stack_trace(std::size_t skip, std::ostream& out) {
    SHKIT_FRAME();
    SHKIT_HERE();
    for (const auto& line : format_stack_trace(CallStack::snapshot(), skip)) {
        out << line << "\n";
    }
    out.flush();
}

} // namespace shkit
