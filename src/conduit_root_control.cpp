#include "conduit_root_control.hpp"
#include "conduit_registry.hpp"
#include "zf_log.h"

#include <chrono>
#include <random>

namespace conduit {

namespace {

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

template<typename Update>
Node update_node(const Node& node, const std::string& target_id, const Update& update, bool& found) {
    if (node.id() == target_id) {
        found = true;
        return update(node);
    }
    const GraphNode* graph = node.as_graph_node();
    if (!graph) return node;

    GraphNode copy = *graph;
    for (auto& child : copy.child_nodes) {
        child = update_node(child, target_id, update, found);
    }
    return Node(std::move(copy));
}

template<typename Update>
Result<FlowGraph, Error> update_in_graph(const FlowGraph& graph, const std::string& node_id, const Update& update) {
    bool found = false;
    std::vector<Node> roots;
    roots.reserve(graph.root_nodes.size());
    for (const auto& root : graph.root_nodes) {
        roots.push_back(update_node(root, node_id, update, found));
    }
    if (!found) {
        ZF_LOGW("node '%s' not found in flow '%s'", node_id.c_str(), graph.name.c_str());
        return Error::NotFound;
    }
    return graph.with_nodes(std::move(roots));
}

} // namespace

RootControlNode::RootControlNode(std::string id, std::string name, FlowGraph flow_graph,
                                 RuntimeRegistry* registry, std::int64_t created_at_ms)
    : _id(std::move(id)), _name(std::move(name)), _flow_graph(std::move(flow_graph)),
      _registry(registry), _created_at_ms(created_at_ms) {}

RootControlNode RootControlNode::create_for(FlowGraph flow_graph, std::string name, RuntimeRegistry* registry) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 999999);
    const std::int64_t created = now_ms();
    std::string id = "controller_" + std::to_string(created) + "_" + std::to_string(dist(rng));
    return RootControlNode(std::move(id), std::move(name), std::move(flow_graph), registry, created);
}

FlowGraph RootControlNode::with_root_state(ExecutionState state) const {
    std::vector<Node> roots;
    roots.reserve(_flow_graph.root_nodes.size());
    for (const auto& root : _flow_graph.root_nodes) {
        roots.push_back(root.with_execution_state(state));
    }
    return _flow_graph.with_nodes(std::move(roots));
}

FlowGraph RootControlNode::start_all() const {
    FlowGraph updated = with_root_state(ExecutionState::Running);
    if (_registry) _registry->resume_all();
    return updated;
}

FlowGraph RootControlNode::pause_all() const {
    FlowGraph updated = with_root_state(ExecutionState::Paused);
    if (_registry) _registry->pause_all();
    return updated;
}

FlowGraph RootControlNode::resume_all() const {
    FlowGraph updated = with_root_state(ExecutionState::Running);
    if (_registry) _registry->resume_all();
    return updated;
}

FlowGraph RootControlNode::stop_all() const {
    FlowGraph updated = with_root_state(ExecutionState::Idle);
    if (_registry) _registry->stop_all();
    return updated;
}

Result<FlowGraph, Error> RootControlNode::set_node_state(const std::string& node_id, ExecutionState state) const {
    return update_in_graph(_flow_graph, node_id,
        [state](const Node& node) { return node.with_execution_state(state); });
}

Result<FlowGraph, Error> RootControlNode::set_node_config(const std::string& node_id,
                                                          const ControlConfig& config) const {
    ValidationResult validation = config.validate();
    if (!validation.success) {
        ZF_LOGW("rejected control config for node '%s': %s", node_id.c_str(),
                validation.error_message().c_str());
        return Error::ValidationFailed;
    }
    return update_in_graph(_flow_graph, node_id,
        [&config](const Node& node) { return node.with_control_config(config); });
}

RootControlNode RootControlNode::with_flow_graph(FlowGraph flow_graph) const {
    return RootControlNode(_id, _name, std::move(flow_graph), _registry, _created_at_ms);
}

} // namespace conduit
