#pragma once

#include "conduit.hpp"
#include "task_policies/conduit_desktop_tpolicy.hpp"
#include <cstdio>
#include <iostream>
#include <string>

namespace conduit {

inline std::ostream& operator<<(std::ostream& os, Error error) {
    return os << to_str(error);
}

inline std::ostream& operator<<(std::ostream& os, ExecutionState state) {
    return os << to_str(state);
}

inline std::ostream& operator<<(std::ostream& os, PortDirection direction) {
    return os << to_str(direction);
}

inline void print_flow_status_report(const RootControlNode& controller) {
    const FlowExecutionStatus status = controller.status();
    const FlowGraph& graph = controller.flow_graph();

    printf("\n=== Flow Status: %s (v%s) ===\n", graph.name.c_str(), graph.version.c_str());
    printf("  - Overall: %s\n", to_str(status.overall_state));
    printf("  - Nodes: %zu (idle %zu, running %zu, paused %zu, error %zu)\n",
        status.total_nodes, status.idle_count, status.running_count,
        status.paused_count, status.error_count);
    printf("  - Independent control: %zu\n\n", status.independent_control_count);

    printf("%-30s | %-10s | %-8s | %s\n", "Node", "Type", "State", "Independent");
    printf("%s\n", std::string(70, '-').c_str());
    for (const auto& node : graph.get_all_nodes()) {
        const char* type = node.is_graph_node() ? "Graph" : node.as_code_node()->node_type.c_str();
        printf("%-30s | %-10s | %-8s | %s\n",
            node.name().c_str(), type, to_str(node.execution_state()),
            node.control_config().independent_control ? "yes" : "no");
    }
    printf("\n");
}

inline void print_runtime_report(const RuntimeRegistry& registry) {
    printf("\n=== Live Runtimes (%zu) ===\n", registry.count());
    printf("%-30s | %-8s | %s\n", "Node", "State", "Independent");
    printf("%s\n", std::string(60, '-').c_str());
    for (NodeRuntime* runtime : registry.snapshot()) {
        printf("%-30s | %-8s | %s\n",
            runtime->name().c_str(), to_str(runtime->execution_state()),
            runtime->control_config().independent_control ? "yes" : "no");
    }
    printf("\n");
}

} // namespace conduit
