#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ir/ir.hpp"

namespace pass {

/**
 * @brief Folds `<>` chains into one interpolated string literal.
 *
 * The chain must mix string literals with variables, field reads, or
 * `to_string`-style conversions of those. Literal parts that already contain
 * `#{` keep the chain as it is.
 */
class StringInterpolation {
public:
    ir::NodePtr run(const ir::NodePtr& root);

private:
    static ir::NodePtr interpolate(const ir::NodePtr& node);
    static void flatten(const ir::NodePtr& node, std::vector<ir::NodePtr>& parts);
    // Source text of an interpolatable operand: `x`, `x.a.b`.
    static std::optional<std::string> interpolated_text(const ir::NodePtr& node);
};

} // namespace pass
