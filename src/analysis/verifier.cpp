#include "verifier.hpp"

#include "analysis/identifier_scan.hpp"
#include "analysis/scoped_rewriter.hpp"
#include "ir/pretty_print/pretty_print.hpp"

namespace analysis {

namespace {

class Verifier : public ScopedRewriter<Verifier> {
public:
    std::vector<VerifyIssue> issues;

    ir::NodePtr rewrite(const ir::Var& var, const ir::NodePtr& self) {
        check(var.name, self->span);
        return self;
    }

    ir::NodePtr rewrite(const ir::Literal& literal, const ir::NodePtr& self) {
        if (auto* text = std::get_if<std::string>(&literal.value)) {
            for (const auto& token : scan_interpolation(*text)) {
                check(token.name, self->span);
            }
        }
        return self;
    }

    ir::NodePtr rewrite(const ir::Opaque& opaque, const ir::NodePtr& self) {
        for (const auto& token : scan_identifiers(opaque.text)) {
            check(token.name, self->span);
        }
        return self;
    }

    ir::PatternPtr rewrite_pattern(const ir::PatternPtr& pattern) {
        for (const auto& name : pattern_reads(pattern)) {
            check(name, pattern->span);
        }
        return pattern;
    }

    std::vector<ir::NodePtr> rewrite_statements(std::vector<ir::NodePtr> stmts) {
        for (size_t i = 0; i + 1 < stmts.size(); ++i) {
            if (stmts[i]->is<ir::Literal>()) {
                issues.push_back(VerifyIssue{VerifyIssue::Kind::UnusedLiteral, ir::to_string(stmts[i]),
                                             function().name, stmts[i]->span});
            }
        }
        return stmts;
    }

private:
    void check(std::string_view name, span::Span span) {
        if (is_wildcard_name(name) || is_bound(name)) {
            return;
        }
        issues.push_back(VerifyIssue{VerifyIssue::Kind::UnboundReference, std::string(name), function().name, span});
    }
};

} // namespace

std::vector<VerifyIssue> verify(const ir::NodePtr& tree) {
    Verifier verifier;
    verifier.rewrite_node(tree);
    return std::move(verifier.issues);
}

} // namespace analysis
