#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace conduit {

    // Port data type that is compatible with any other
    constexpr const char* ANY_TYPE = "Any";

    enum class PortDirection {
        Input,
        Output,
    };

    enum class ExecutionState {
        Idle,
        Running,
        Paused,
        Error,
    };

    const char* to_str(PortDirection direction);
    const char* to_str(ExecutionState state);

    struct ValidationResult {
        bool success = true;
        std::vector<std::string> errors;

        static ValidationResult ok() { return ValidationResult{}; }
        static ValidationResult failure(std::vector<std::string> errs) {
            return ValidationResult{errs.empty(), std::move(errs)};
        }

        void add_error(std::string error) {
            success = false;
            errors.push_back(std::move(error));
        }

        void merge(const ValidationResult& other, const std::string& prefix = "");

        // errors joined with "; "
        std::string error_message() const;
    };

    struct Port {
        std::string id;
        std::string name;
        PortDirection direction = PortDirection::Input;
        std::string data_type = ANY_TYPE;
        bool required = false;
        std::string owning_node_id;

        bool is_input() const { return direction == PortDirection::Input; }
        bool is_output() const { return direction == PortDirection::Output; }

        // Output -> Input only, with equal data types or either side being "Any"
        bool is_compatible_with(const Port& target) const;

        ValidationResult validate() const;
        bool is_valid() const { return validate().success; }

        Port with_owner(std::string node_id) const;

        static Port input(std::string id, std::string name, std::string data_type,
                          std::string owning_node_id, bool required = false);
        static Port output(std::string id, std::string name, std::string data_type,
                           std::string owning_node_id);
    };

    struct Connection {
        static constexpr int RENDEZVOUS = 0;
        static constexpr int UNBOUNDED = -1;

        std::string id;
        std::string source_node_id;
        std::string source_port_id;
        std::string target_node_id;
        std::string target_port_id;
        int channel_capacity = RENDEZVOUS;
        std::optional<std::string> type_tag;
        // id of the GraphNode whose internal wiring holds this connection
        std::optional<std::string> parent_scope_id;

        bool is_rendezvous() const { return channel_capacity == RENDEZVOUS; }
        bool is_buffered() const { return channel_capacity > 0; }
        bool is_unbounded() const { return channel_capacity == UNBOUNDED; }
        bool is_self_loop() const {
            return source_node_id == target_node_id && source_port_id == target_port_id;
        }
        bool involves_node(const std::string& node_id) const {
            return source_node_id == node_id || target_node_id == node_id;
        }

        ValidationResult validate() const;
        ValidationResult validate_with_ports(const Port& source, const Port& target) const;

        Connection with_channel_capacity(int capacity) const;
        Connection with_type_tag(std::string tag) const;
    };

    struct ControlConfig {
        bool independent_control = false;
        int pause_buffer_size = 100;
        // delay between processing cycles
        std::chrono::milliseconds speed_attenuation{0};
        // log and skip a failing cycle instead of entering Error
        bool auto_resume_on_error = false;

        ValidationResult validate() const;
        bool is_valid() const { return validate().success; }

        ControlConfig with_independent_control(bool independent) const {
            ControlConfig copy = *this;
            copy.independent_control = independent;
            return copy;
        }
    };

    bool operator==(const ControlConfig& a, const ControlConfig& b);
    inline bool operator!=(const ControlConfig& a, const ControlConfig& b) { return !(a == b); }

    struct CodeNode {
        std::string id;
        std::string name;
        std::string node_type = "Generic";
        std::string description;
        std::vector<Port> input_ports;
        std::vector<Port> output_ports;
        ControlConfig control_config;
        ExecutionState execution_state = ExecutionState::Idle;
        std::map<std::string, std::string> configuration;
        std::optional<std::string> parent_node_id;

        const Port* find_input_port(const std::string& port_id) const;
        const Port* find_output_port(const std::string& port_id) const;
        const Port* find_port(const std::string& port_id) const;
        const Port* find_port_by_name(const std::string& port_name) const;

        ValidationResult validate() const;

        CodeNode with_execution_state(ExecutionState state) const;
        CodeNode with_control_config(const ControlConfig& config) const;
        CodeNode with_parent(std::optional<std::string> parent_id) const;
        CodeNode with_configuration(const std::string& key, const std::string& value) const;

        bool is_running() const { return execution_state == ExecutionState::Running; }
        bool is_paused() const { return execution_state == ExecutionState::Paused; }
        bool is_idle() const { return execution_state == ExecutionState::Idle; }
        bool is_error() const { return execution_state == ExecutionState::Error; }
    };

    struct GraphNode;

    // CodeNode | GraphNode. GraphNode is held by shared pointer so nodes can nest;
    // all model values are immutable, changes produce new values.
    class Node {
    public:
        Node(CodeNode node);
        Node(GraphNode node);

        bool is_code_node() const { return std::holds_alternative<CodeNode>(_node); }
        bool is_graph_node() const { return !is_code_node(); }

        // nullptr when the node is of the other kind
        const CodeNode* as_code_node() const;
        const GraphNode* as_graph_node() const;

        const std::string& id() const;
        const std::string& name() const;
        const std::vector<Port>& input_ports() const;
        const std::vector<Port>& output_ports() const;
        const ControlConfig& control_config() const;
        ExecutionState execution_state() const;
        const std::optional<std::string>& parent_node_id() const;

        const Port* find_port(const std::string& port_id) const;

        ValidationResult validate() const;

        // For a GraphNode the state and config propagate into its subtree.
        Node with_execution_state(ExecutionState state) const;
        Node with_control_config(const ControlConfig& config) const;
        Node with_parent(std::optional<std::string> parent_id) const;

        template <typename Visitor>
        decltype(auto) visit(Visitor&& visitor) const {
            if (auto* code = std::get_if<CodeNode>(&_node)) {
                return visitor(*code);
            }
            return visitor(*std::get<std::shared_ptr<const GraphNode>>(_node));
        }

    private:
        std::variant<CodeNode, std::shared_ptr<const GraphNode>> _node;
    };

    struct PortMapping {
        std::string child_node_id;
        std::string child_port_name;
    };

    struct GraphNode {
        std::string id;
        std::string name;
        std::string description;
        std::vector<Node> child_nodes;
        std::vector<Connection> internal_connections;
        std::vector<Port> input_ports;
        std::vector<Port> output_ports;
        // exposed port name -> child port
        std::map<std::string, PortMapping> port_mappings;
        ControlConfig control_config;
        ExecutionState execution_state = ExecutionState::Idle;
        std::optional<std::string> parent_node_id;

        const Port* find_port(const std::string& port_id) const;
        std::optional<Node> find_child(const std::string& child_id) const;

        // Checks children, containment, internal wiring and port mappings, recursively.
        ValidationResult validate() const;

        // Sets this node's state. With propagate, children follow unless they have
        // independent_control, in which case their whole subtree is left untouched.
        GraphNode with_execution_state(ExecutionState state, bool propagate = true) const;

        // Sets this node's config. With propagate, every child receives it while
        // keeping its own independent_control flag.
        GraphNode with_control_config(const ControlConfig& config, bool propagate = true) const;

        GraphNode add_child(Node child) const;
        GraphNode remove_child(const std::string& child_id) const;
        GraphNode add_internal_connection(Connection connection) const;
        GraphNode remove_internal_connection(const std::string& connection_id) const;
        GraphNode add_port_mapping(const std::string& port_name, PortMapping mapping) const;

        // Every node below this one, depth first
        std::vector<Node> get_all_descendants() const;
        std::vector<CodeNode> get_all_code_nodes() const;
        size_t total_node_count() const;
        // 1 for a GraphNode holding only CodeNodes
        size_t max_depth() const;
    };

    struct FlowExecutionStatus {
        size_t total_nodes = 0;
        size_t idle_count = 0;
        size_t running_count = 0;
        size_t paused_count = 0;
        size_t error_count = 0;
        size_t independent_control_count = 0;
        // Error > Running > Paused > Idle
        ExecutionState overall_state = ExecutionState::Idle;

        bool has_errors() const { return error_count > 0; }
        bool all_idle() const { return idle_count == total_nodes; }
    };

    struct FlowGraph {
        std::string id;
        std::string name;
        std::string version = "1.0.0";
        std::string description;
        std::vector<Node> root_nodes;
        std::vector<Connection> connections;
        std::map<std::string, std::string> metadata;

        ValidationResult validate() const;

        std::optional<Node> find_node(const std::string& node_id) const;
        // Root nodes and everything nested below them
        std::vector<Node> get_all_nodes() const;
        std::vector<CodeNode> get_all_code_nodes() const;
        std::vector<Connection> get_connections_for_node(const std::string& node_id) const;

        FlowGraph with_nodes(std::vector<Node> nodes) const;
        FlowGraph add_node(Node node) const;
        FlowGraph remove_node(const std::string& node_id) const;
        FlowGraph add_connection(Connection connection) const;
        FlowGraph remove_connection(const std::string& connection_id) const;
        FlowGraph with_metadata(const std::string& key, const std::string& value) const;

        FlowExecutionStatus execution_status() const;
    };

    // MAJOR.MINOR.PATCH with optional -prerelease and +build suffixes
    bool is_semantic_version(const std::string& version);

} // namespace conduit
