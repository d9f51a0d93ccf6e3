#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace debug {

// Where a normalization step is running; outermost first.
enum class Frame { Pass, Module, Function };

inline std::string_view to_string(Frame frame) {
    switch (frame) {
    case Frame::Pass:
        return "pass";
    case Frame::Module:
        return "module";
    case Frame::Function:
        return "function";
    }
    return "unknown";
}

// Per-thread stack of frames, rendered as a prefix on diagnostics and errors:
// "In pass 'p' -> module 'M' -> function 'f': message".
class Context {
public:
    class Guard {
    public:
        Guard(Context& ctx, Frame frame, std::string name) : ctx_(&ctx) {
            ctx_->stack_.emplace_back(frame, std::move(name));
        }

        Guard(Guard&& other) noexcept : ctx_(std::exchange(other.ctx_, nullptr)) {}

        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        ~Guard() {
            if (ctx_ && !ctx_->stack_.empty()) {
                ctx_->stack_.pop_back();
            }
        }

    private:
        Context* ctx_;
    };

    static Context& instance() {
        static thread_local Context ctx;
        return ctx;
    }

    Guard push(Frame frame, std::string name) { return Guard(*this, frame, std::move(name)); }

    std::string format(const std::string& message) const {
        if (stack_.empty()) {
            return message;
        }
        std::ostringstream oss;
        oss << "In ";
        for (size_t i = 0; i < stack_.size(); ++i) {
            oss << (i > 0 ? " -> " : "") << to_string(stack_[i].first);
            if (!stack_[i].second.empty()) {
                oss << " '" << stack_[i].second << "'";
            }
        }
        oss << ": " << message;
        return oss.str();
    }

    // Innermost name pushed for `frame`, empty when none is active.
    std::string_view current(Frame frame) const {
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
            if (it->first == frame) {
                return it->second;
            }
        }
        return {};
    }

private:
    std::vector<std::pair<Frame, std::string>> stack_;
};

inline Context::Guard push(Frame frame, std::string name) {
    return Context::instance().push(frame, std::move(name));
}

inline std::string format_with_context(const std::string& message) {
    return Context::instance().format(message);
}

} // namespace debug
