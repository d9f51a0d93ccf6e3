#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ir/ir.hpp"
#include "pass/pass.hpp"

namespace pass {

/**
 * @brief Resolves call statements whose result is dropped or mis-bound.
 *
 * A bare call that updates its first argument (flagged by the builder, or a
 * call into a persistent collection module) is rebound to that argument when
 * the argument is read later. A binding of a call result that nothing reads
 * becomes a discard.
 */
class DiscardRebindResolution {
public:
    explicit DiscardRebindResolution(PassContext& context) : context_(context) {}

    ir::NodePtr run(const ir::NodePtr& root);

private:
    std::vector<ir::NodePtr> resolve(std::vector<ir::NodePtr> stmts) const;
    // First argument the call returns an updated copy of.
    std::optional<std::string> updated_argument(const ir::NodePtr& call) const;

    PassContext& context_;
};

} // namespace pass
