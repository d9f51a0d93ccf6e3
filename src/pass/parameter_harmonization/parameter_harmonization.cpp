#include "parameter_harmonization.hpp"

#include "analysis/harmonizer.hpp"
#include "ir/helper.hpp"
#include "utils/debug_context.hpp"

namespace pass {

ir::NodePtr ParameterHarmonization::rewrite(const ir::Def& def, const ir::NodePtr& self) {
    auto node = rewrite_children(def, self);
    const auto& visited = ir::helper::get_def(node);
    if (visited.params.empty()) {
        return node;
    }

    auto result = analysis::harmonize(analysis::BindingSite{visited.params, visited.guard, visited.body}, {}, {});
    switch (result.action) {
    case analysis::HarmonizeAction::Renamed:
        return ir::helper::rebuild(node, ir::Def{visited.name, result.site.patterns, result.site.guard,
                                                 result.site.body, visited.is_private});
    case analysis::HarmonizeAction::Ambiguous: {
        auto context = debug::push(debug::Frame::Function, visited.name);
        context_.note("ambiguous-parameter", "parameters left unchanged; several names are unbound", node->span);
        return node;
    }
    case analysis::HarmonizeAction::Unchanged:
    case analysis::HarmonizeAction::ShapeMismatch:
        break;
    }
    return node;
}

} // namespace pass
