#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

#include "span/span.hpp"

class CompilerError : public std::runtime_error {
public:
    explicit CompilerError(const std::string& message,
                           span::Span span = span::Span::invalid())
        : std::runtime_error(message), span_(span) {}

    span::Span span() const { return span_; }

protected:
    span::Span span_ = span::Span::invalid();
};

// IR text that the reader cannot turn into a tree.
class ReaderError : public CompilerError {
public:
    explicit ReaderError(const std::string& message,
                         span::Span span = span::Span::invalid())
        : CompilerError(message, span) {}
};

// A pass list or option set that violates the scheduling rules.
class PipelineConfigError : public CompilerError {
public:
    explicit PipelineConfigError(const std::string& message)
        : CompilerError(message) {}
};

// Neither the pipeline nor the serializer could produce valid output.
class NormalizeError : public CompilerError {
public:
    explicit NormalizeError(const std::string& message,
                            span::Span span = span::Span::invalid())
        : CompilerError(message, span) {}
};

namespace error_helper {

inline void report_config_error(const std::string& message) {
    throw PipelineConfigError(message);
}

inline void report_unknown_pass(const std::string& name) {
    std::ostringstream oss;
    oss << "Unknown pass '" << name << "'";
    report_config_error(oss.str());
}

inline void report_ordering_violation(const std::string& pass, const std::string& depends_on) {
    std::ostringstream oss;
    oss << "Pass '" << pass << "' must run after '" << depends_on << "'";
    report_config_error(oss.str());
}

} // namespace error_helper
