#include "dump_registry.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace span {

DumpId DumpRegistry::add(std::string name, std::string text) {
    DumpId id = static_cast<DumpId>(dumps_.size());
    bool taken = std::any_of(dumps_.begin(), dumps_.end(), [&](const Dump& d) { return d.name == name; });
    if (taken) {
        name += "#" + std::to_string(id);
    }
    Dump dump{std::move(name), std::move(text), {0}};
    for (uint32_t i = 0; i < dump.text.size(); ++i) {
        if (dump.text[i] == '\n') {
            dump.line_starts.push_back(i + 1);
        }
    }
    dumps_.push_back(std::move(dump));
    return id;
}

const DumpRegistry::Dump& DumpRegistry::at(DumpId dump) const {
    if (dump >= dumps_.size()) {
        throw std::out_of_range("Unknown IR dump id " + std::to_string(dump));
    }
    return dumps_[dump];
}

std::string_view DumpRegistry::text(DumpId dump) const { return at(dump).text; }
const std::string& DumpRegistry::name(DumpId dump) const { return at(dump).name; }

bool DumpRegistry::contains(const Span& span) const {
    return span.is_valid() && span.dump < dumps_.size() && span.start <= dumps_[span.dump].text.size();
}

Location DumpRegistry::locate(DumpId dump, uint32_t offset) const {
    const auto& starts = at(dump).line_starts;
    auto after = std::upper_bound(starts.begin(), starts.end(), offset);
    auto line = static_cast<uint32_t>(after - starts.begin());
    return {line, offset - starts[line - 1] + 1};
}

std::string_view DumpRegistry::line_text(const Dump& dump, uint32_t line) const {
    uint32_t begin = dump.line_starts[line - 1];
    uint32_t end = line < dump.line_starts.size() ? dump.line_starts[line] : static_cast<uint32_t>(dump.text.size());
    std::string_view view(dump.text.data() + begin, end - begin);
    while (!view.empty() && (view.back() == '\n' || view.back() == '\r')) {
        view.remove_suffix(1);
    }
    return view;
}

std::string DumpRegistry::describe(const Span& span) const {
    if (!contains(span)) {
        return "<unknown location>";
    }
    auto loc = locate(span.dump, span.start);
    return name(span.dump) + ":" + std::to_string(loc.line) + ":" + std::to_string(loc.column);
}

std::string DumpRegistry::excerpt(const Span& span) const {
    if (!contains(span)) {
        return {};
    }
    const auto& dump = dumps_[span.dump];
    auto loc = locate(span.dump, span.start);
    auto line = line_text(dump, loc.line);
    if (line.empty()) {
        return {};
    }
    // underline no further than the end of the first line
    auto room = static_cast<uint32_t>(line.size()) >= loc.column ? static_cast<uint32_t>(line.size()) - loc.column + 1 : 1;
    auto gutter = std::to_string(loc.line);
    std::ostringstream oss;
    oss << " " << gutter << " | " << line << "\n"
        << " " << std::string(gutter.size(), ' ') << " | " << std::string(loc.column - 1, ' ')
        << std::string(std::min(span.width(), room), '^');
    return oss.str();
}

} // namespace span
