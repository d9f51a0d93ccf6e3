#pragma once

#include <vector>

#include "ir/ir.hpp"

namespace pass {

/**
 * @brief Turns guard-style early returns into ordinary branching.
 *
 * A conditional in non-terminal position with a returning branch absorbs the
 * statements that follow it: every branch that does not end in a return gets
 * them appended as its continuation, and the conditional becomes the last
 * statement of the list. Statements after an unconditional return are
 * unreachable and dropped.
 */
class EarlyReturnReconstruction {
public:
    ir::NodePtr run(const ir::NodePtr& root);

private:
    static std::vector<ir::NodePtr> reconstruct(std::vector<ir::NodePtr> stmts);
    static ir::NodePtr continue_branch(const ir::NodePtr& branch, const std::vector<ir::NodePtr>& rest,
                                       span::Span fallback);
};

} // namespace pass
