#include "pass.hpp"

#include <optional>

#include "utils/debug_context.hpp"

namespace pass {

std::string_view to_string(Tier tier) {
    switch (tier) {
    case Tier::Structural:
        return "structural";
    case Tier::Semantic:
        return "semantic";
    case Tier::Cleanup:
        return "cleanup";
    }
    return "unknown";
}

void PassContext::report(diag::Severity severity, std::string code, const std::string& message, span::Span span,
                         std::vector<std::string> notes) const {
    auto& context = debug::Context::instance();
    std::optional<debug::Context::Guard> pass_guard;
    std::optional<debug::Context::Guard> function_guard;
    if (!pass_name_.empty() && context.current(debug::Frame::Pass).empty()) {
        pass_guard.emplace(context.push(debug::Frame::Pass, pass_name_));
    }
    if (!function_.empty() && context.current(debug::Frame::Function).empty()) {
        function_guard.emplace(context.push(debug::Frame::Function, function_.name));
    }
    sink_->report(diag::Diagnostic{severity, std::move(code), context.format(message), span, std::move(notes)});
}

} // namespace pass
