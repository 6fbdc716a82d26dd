#pragma once

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace debug {

// One level of work in progress, e.g. {"pattern", "hir#4"}.
struct Frame {
    std::string what;
    std::string label;
};

/**
 * @brief Per-thread stack of frames being processed.
 *
 * Lowering pushes a frame per pattern it descends into; traces and internal
 * error messages are prefixed with the chain so that a failure deep inside a
 * nested pattern names the path that led to it.
 */
class Context {
public:
    // Pops its frame on scope exit, including during unwinding.
    class Guard {
    public:
        explicit Guard(Frame frame) : owns_(true) { frames().push_back(std::move(frame)); }

        Guard(Guard&& other) noexcept : owns_(other.owns_) { other.owns_ = false; }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        ~Guard() {
            if (owns_ && !frames().empty()) {
                frames().pop_back();
            }
        }

    private:
        bool owns_;
    };

    static std::string describe(const std::string& message) {
        const auto& stack = frames();
        if (stack.empty()) {
            return message;
        }
        std::ostringstream oss;
        oss << "while lowering ";
        for (size_t i = 0; i < stack.size(); ++i) {
            if (i > 0) {
                oss << " > ";
            }
            oss << stack[i].what;
            if (!stack[i].label.empty()) {
                oss << " " << stack[i].label;
            }
        }
        oss << ": " << message;
        return oss.str();
    }

private:
    static std::vector<Frame>& frames() {
        thread_local std::vector<Frame> stack;
        return stack;
    }
};

inline Context::Guard push(std::string what, std::string label) {
    return Context::Guard(Frame{std::move(what), std::move(label)});
}

inline std::string format_with_context(const std::string& message) {
    return Context::describe(message);
}

inline bool env_flag(const char* name) {
    return std::getenv(name) != nullptr;
}

// "[PAT DEBUG] while lowering pattern hir#4: implicit deref of &Option<i32>"
inline void trace(std::string_view channel, const std::string& message) {
    std::cerr << "[" << channel << " DEBUG] " << format_with_context(message) << std::endl;
}

} // namespace debug
