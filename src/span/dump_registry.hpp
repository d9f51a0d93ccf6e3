#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "span.hpp"

namespace span {

struct Location {
    uint32_t line = 1;
    uint32_t column = 1;
};

// Keeps the text of every IR dump handed to the reader, so that reader errors
// and pass diagnostics can be rendered against it.
class DumpRegistry {
public:
    // A name already registered gets a "#<id>" suffix.
    DumpId add(std::string name, std::string text);

    std::string_view text(DumpId dump) const;
    const std::string& name(DumpId dump) const;
    size_t size() const { return dumps_.size(); }
    bool contains(const Span& span) const;

    Location locate(DumpId dump, uint32_t offset) const;
    // "name:line:column"
    std::string describe(const Span& span) const;
    // The first line of the span with a caret underline below it.
    std::string excerpt(const Span& span) const;

private:
    struct Dump {
        std::string name;
        std::string text;
        std::vector<uint32_t> line_starts;
    };

    const Dump& at(DumpId dump) const;
    std::string_view line_text(const Dump& dump, uint32_t line) const;

    std::vector<Dump> dumps_;
};

} // namespace span
