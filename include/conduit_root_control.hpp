#pragma once

#include "conduit_error.hpp"
#include "conduit_model.hpp"
#include <cstdint>
#include <string>

namespace conduit {

    class RuntimeRegistry;

    // Controls a whole flow at two levels at once: the model (a new FlowGraph with
    // updated execution states is returned) and, when a registry is attached, the
    // live runtimes registered in it.
    //
    // Root nodes always take the new state. Below them a node with
    // independent_control keeps its state, and so does its subtree.
    class RootControlNode {
    public:
        RootControlNode(std::string id, std::string name, FlowGraph flow_graph,
                        RuntimeRegistry* registry = nullptr, std::int64_t created_at_ms = 0);

        static RootControlNode create_for(FlowGraph flow_graph, std::string name = "Controller",
                                          RuntimeRegistry* registry = nullptr);

        const std::string& id() const { return _id; }
        const std::string& name() const { return _name; }
        const FlowGraph& flow_graph() const { return _flow_graph; }
        RuntimeRegistry* registry() const { return _registry; }
        std::int64_t created_at_ms() const { return _created_at_ms; }

        // Registry runtimes cannot be scheduled from here, so start_all() resumes
        // paused ones; idle runtimes need an explicit start().
        FlowGraph start_all() const;
        FlowGraph pause_all() const;
        FlowGraph resume_all() const;
        FlowGraph stop_all() const;

        FlowExecutionStatus status() const { return _flow_graph.execution_status(); }

        // Model only. The target's subtree follows the same propagation rules.
        // Unknown ids give NotFound, an invalid config gives ValidationFailed.
        Result<FlowGraph, Error> set_node_state(const std::string& node_id, ExecutionState state) const;
        Result<FlowGraph, Error> set_node_config(const std::string& node_id, const ControlConfig& config) const;

        RootControlNode with_flow_graph(FlowGraph flow_graph) const;

    private:
        FlowGraph with_root_state(ExecutionState state) const;

        std::string _id;
        std::string _name;
        FlowGraph _flow_graph;
        RuntimeRegistry* _registry;
        std::int64_t _created_at_ms;
    };

} // namespace conduit
