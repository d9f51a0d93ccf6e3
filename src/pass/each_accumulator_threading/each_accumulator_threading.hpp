#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analysis/scoped_rewriter.hpp"
#include "ir/ir.hpp"
#include "pass/pass.hpp"

namespace pass {

/**
 * @brief Turns an each-style iteration that rebinds outer names into a
 * reduction threading those names as accumulator.
 *
 *   Enum.each(xs, fn x -> total = total + x end); total
 * becomes
 *   total = Enum.reduce(xs, total, fn x, total -> total = total + x; total end); total
 *
 * Rebindings inside conditionals of the closure body are hoisted first so
 * every path yields the accumulator. A `for` over a single generator is
 * threaded the same way; its filters guard the body and a rejected element
 * passes the accumulator through.
 */
class EachAccumulatorThreading : public analysis::ScopedRewriter<EachAccumulatorThreading> {
public:
    explicit EachAccumulatorThreading(PassContext& context) : context_(context) {}

    ir::NodePtr run(const ir::NodePtr& root) { return rewrite_node(root); }

    std::vector<ir::NodePtr> rewrite_statements(std::vector<ir::NodePtr> stmts);

private:
    // Module of the configured each-function `call` targets.
    std::optional<std::string> each_module(const ir::RemoteCall& call) const;
    std::optional<ir::NodePtr> thread(const ir::NodePtr& stmt, const std::string& module,
                                      const std::vector<std::string>& names) const;
    std::optional<ir::NodePtr> thread_for(const ir::NodePtr& stmt, const std::vector<std::string>& names) const;

    PassContext& context_;
};

} // namespace pass
