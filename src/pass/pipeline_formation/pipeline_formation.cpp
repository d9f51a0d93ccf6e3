#include "pipeline_formation.hpp"

#include <vector>

#include "ir/helper.hpp"
#include "ir/traversal.hpp"

namespace pass {

namespace {

const ir::RemoteCall* nested_remote(const ir::RemoteCall& call) {
    if (call.args.empty()) {
        return nullptr;
    }
    return call.args.front()->as<ir::RemoteCall>();
}

} // namespace

ir::NodePtr PipelineFormation::form_arguments(const ir::NodePtr& call, size_t from) {
    const auto& remote = *call->as<ir::RemoteCall>();
    bool changed = from > 0;
    std::vector<ir::NodePtr> args;
    for (size_t i = from; i < remote.args.size(); ++i) {
        auto formed = form(remote.args[i]);
        changed = changed || formed != remote.args[i];
        args.push_back(std::move(formed));
    }
    if (!changed) {
        return call;
    }
    return ir::helper::rebuild(call, ir::RemoteCall{remote.module, remote.function, std::move(args)});
}

ir::NodePtr PipelineFormation::stage(const ir::NodePtr& call) {
    return form_arguments(call, 1);
}

ir::NodePtr PipelineFormation::form(const ir::NodePtr& node) {
    if (!node) {
        return node;
    }
    if (auto* pipe = node->as<ir::Pipe>()) {
        // the right side already lacks its first argument and is not a chain head
        auto lhs = form(pipe->lhs);
        auto rhs = pipe->rhs->is<ir::RemoteCall>() ? form_arguments(pipe->rhs, 0)
                                                   : ir::map_children(pipe->rhs, &PipelineFormation::form);
        if (lhs == pipe->lhs && rhs == pipe->rhs) {
            return node;
        }
        return ir::helper::rebuild(node, ir::Pipe{lhs, rhs});
    }

    auto* outer = node->as<ir::RemoteCall>();
    if (!outer || !nested_remote(*outer)) {
        return ir::map_children(node, &PipelineFormation::form);
    }

    // outermost first
    std::vector<ir::NodePtr> chain{node};
    while (nested_remote(*chain.back()->as<ir::RemoteCall>())) {
        chain.push_back(chain.back()->as<ir::RemoteCall>()->args.front());
    }

    const auto& innermost = chain.back();
    ir::NodePtr lhs;
    if (innermost->as<ir::RemoteCall>()->args.empty()) {
        lhs = form_arguments(innermost, 0);
    } else {
        auto source = form(innermost->as<ir::RemoteCall>()->args.front());
        lhs = ir::helper::make_node(ir::Pipe{source, stage(innermost)}, {}, innermost->span);
    }
    for (size_t i = chain.size() - 1; i-- > 0;) {
        const auto& call = chain[i];
        ir::Metadata meta = i == 0 ? call->meta : ir::Metadata{};
        lhs = ir::helper::make_node(ir::Pipe{lhs, stage(call)}, meta, call->span);
    }
    return lhs;
}

} // namespace pass
