#pragma once

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "span/dump_registry.hpp"
#include "span/span.hpp"

namespace diag {

enum class Severity { Note, Warning, Error };

std::string_view to_string(Severity severity);

// Non-fatal finding of a pass: an ambiguity it declined to repair, a marker
// it could not place, an unbound reference found by the verifier.
struct Diagnostic {
    Severity severity = Severity::Warning;
    std::string code;    // stable identifier, e.g. "harmonize-ambiguous"
    std::string message; // already prefixed with the debug context
    span::Span span = span::Span::invalid();
    std::vector<std::string> notes;
};

class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;
    virtual void report(Diagnostic diagnostic) = 0;
};

// Keeps everything; used by tests and by callers that render later.
class CollectingSink : public DiagnosticSink {
public:
    void report(Diagnostic diagnostic) override {
        diagnostics_.push_back(std::move(diagnostic));
    }

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    size_t count(Severity severity) const;
    bool has_code(std::string_view code) const;
    void clear() { diagnostics_.clear(); }

private:
    std::vector<Diagnostic> diagnostics_;
};

// Writes each diagnostic immediately, with source context when the span
// points into a file the manager knows.
class StreamSink : public DiagnosticSink {
public:
    explicit StreamSink(std::ostream& out, const span::DumpRegistry* dumps = nullptr)
        : out_(out), dumps_(dumps) {}

    void report(Diagnostic diagnostic) override;

    size_t reported() const { return reported_; }

private:
    std::ostream& out_;
    const span::DumpRegistry* dumps_;
    size_t reported_ = 0;
};

// Drops everything.
class NullSink : public DiagnosticSink {
public:
    void report(Diagnostic) override {}
};

} // namespace diag
