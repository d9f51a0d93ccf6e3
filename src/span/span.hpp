#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>

namespace span {

using DumpId = uint32_t;
constexpr DumpId kNoDump = std::numeric_limits<DumpId>::max();

// Byte range inside one registered IR dump. Passes copy it from the node they
// rewrite; nodes built from scratch carry an invalid span.
struct Span {
    DumpId dump = kNoDump;
    uint32_t start = 0;
    uint32_t end = 0;

    constexpr bool is_valid() const { return dump != kNoDump; }
    // at least one column, so a caret is always drawn
    constexpr uint32_t width() const { return end > start ? end - start : 1; }

    static constexpr Span invalid() { return {}; }

    // From the start of `first` to the end of `last`; an invalid side yields the other.
    static constexpr Span cover(const Span& first, const Span& last) {
        if (!first.is_valid() || first.dump != last.dump) return last.is_valid() ? last : first;
        if (!last.is_valid()) return first;
        return {first.dump, std::min(first.start, last.start), std::max(first.end, last.end)};
    }

    bool operator==(const Span&) const = default;
};

} // namespace span
