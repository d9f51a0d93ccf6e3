#pragma once

#include <vector>

#include "analysis/scope.hpp"
#include "analysis/scoped_rewriter.hpp"
#include "ir/ir.hpp"

namespace pass {

// A binder `_x` whose scope reads `x` while nothing else binds `x` becomes
// `x`. Applies to clause, closure, definition and match binders.
class UnderscorePromotion : public analysis::ScopedRewriter<UnderscorePromotion> {
    using Base = analysis::ScopedRewriter<UnderscorePromotion>;

public:
    ir::NodePtr run(const ir::NodePtr& root) { return rewrite_node(root); }

    ir::Clause visit_clause(const ir::Clause& clause);
    ir::FnClause visit_fn_clause(const ir::FnClause& clause);
    ir::NodePtr rewrite(const ir::Def& def, const ir::NodePtr& self);
    std::vector<ir::NodePtr> rewrite_statements(std::vector<ir::NodePtr> stmts);

private:
    struct Site {
        std::vector<ir::PatternPtr> patterns;
        ir::NodePtr guard;
        ir::NodePtr body;
    };

    // Promotes every eligible binder of `site`; `enclosing` are the names
    // visible around it.
    static bool promote(Site& site, const analysis::NameSet& enclosing);
};

} // namespace pass
