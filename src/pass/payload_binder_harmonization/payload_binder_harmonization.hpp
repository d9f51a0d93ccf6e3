#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analysis/harmonizer.hpp"
#include "analysis/scoped_rewriter.hpp"
#include "ir/ir.hpp"
#include "pass/pass.hpp"

namespace pass {

/**
 * @brief Aligns the payload binder of `{:tag, payload}` patterns with the
 * name the clause body reads.
 *
 * Applies to case, receive, rescue, with-else and closure clauses. Several
 * unbound names are settled through the configured tie-break list; anything
 * still ambiguous is reported as a note and left alone.
 */
class PayloadBinderHarmonization : public analysis::ScopedRewriter<PayloadBinderHarmonization> {
    using Base = analysis::ScopedRewriter<PayloadBinderHarmonization>;

public:
    explicit PayloadBinderHarmonization(PassContext& context) : context_(context) {}

    ir::NodePtr run(const ir::NodePtr& root) { return rewrite_node(root); }

    ir::Clause visit_clause(const ir::Clause& clause);
    ir::FnClause visit_fn_clause(const ir::FnClause& clause);

private:
    analysis::HarmonizePolicy policy(std::vector<std::string> candidates) const;
    // Harmonized site, or nothing when the site stays as it is.
    std::optional<analysis::BindingSite> harmonize_site(const analysis::BindingSite& site,
                                                         const analysis::NameSet& enclosing,
                                                         std::vector<std::string> candidates);

    PassContext& context_;
};

} // namespace pass
