#include "diagnostic.hpp"

#include <algorithm>

namespace diag {

std::string_view to_string(Severity severity) {
    switch (severity) {
    case Severity::Note:
        return "note";
    case Severity::Warning:
        return "warning";
    case Severity::Error:
        return "error";
    }
    return "unknown";
}

size_t CollectingSink::count(Severity severity) const {
    return static_cast<size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(),
                                             [&](const Diagnostic& d) { return d.severity == severity; }));
}

bool CollectingSink::has_code(std::string_view code) const {
    return std::any_of(diagnostics_.begin(), diagnostics_.end(),
                       [&](const Diagnostic& d) { return d.code == code; });
}

void StreamSink::report(Diagnostic diagnostic) {
    ++reported_;
    out_ << to_string(diagnostic.severity);
    if (!diagnostic.code.empty()) {
        out_ << "[" << diagnostic.code << "]";
    }
    out_ << ": " << diagnostic.message << "\n";
    if (dumps_ && dumps_->contains(diagnostic.span)) {
        out_ << "  --> " << dumps_->describe(diagnostic.span) << "\n";
        auto excerpt = dumps_->excerpt(diagnostic.span);
        if (!excerpt.empty()) {
            out_ << excerpt << "\n";
        }
    }
    for (const auto& note : diagnostic.notes) {
        out_ << "  = note: " << note << "\n";
    }
}

} // namespace diag
