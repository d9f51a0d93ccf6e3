#include "block_flattening.hpp"

#include "ir/helper.hpp"
#include "ir/traversal.hpp"
#include "pass/common.hpp"

namespace pass {

ir::NodePtr BlockFlattening::run(const ir::NodePtr& root) {
    return ir::transform_bottom_up(root, &BlockFlattening::flatten);
}

std::vector<ir::NodePtr> BlockFlattening::splice(const std::vector<ir::NodePtr>& stmts, bool& changed) {
    std::vector<ir::NodePtr> out;
    out.reserve(stmts.size());
    for (size_t i = 0; i < stmts.size(); ++i) {
        const auto& stmt = stmts[i];
        auto* nested = stmt->as<ir::Block>();
        if (!nested || stmt->meta != ir::Metadata{}) {
            out.push_back(stmt);
            continue;
        }
        changed = true;
        if (nested->stmts.empty()) {
            // a terminal empty block still has to produce a value
            if (i + 1 == stmts.size()) {
                out.push_back(ir::helper::make_node(ir::Literal{ir::Literal::Nil{}}, {}, stmt->span));
            }
            continue;
        }
        out.insert(out.end(), nested->stmts.begin(), nested->stmts.end());
    }
    return out;
}

ir::NodePtr BlockFlattening::flatten(const ir::NodePtr& node) {
    if (auto* module = node->as<ir::Module>()) {
        bool changed = false;
        auto body = splice(module->body, changed);
        if (!changed) {
            return node;
        }
        return ir::helper::rebuild(node, ir::Module{module->name, std::move(body)});
    }

    auto* block = node->as<ir::Block>();
    if (!block) {
        return node;
    }
    bool changed = false;
    auto stmts = splice(block->stmts, changed);
    if (stmts.empty()) {
        return ir::helper::make_node(ir::Literal{ir::Literal::Nil{}}, node->meta, node->span);
    }
    if (stmts.size() == 1) {
        return ir::helper::with_meta(stmts.front(), merge_meta(stmts.front()->meta, node->meta));
    }
    if (!changed) {
        return node;
    }
    return ir::helper::rebuild(node, ir::Block{std::move(stmts)});
}

} // namespace pass
