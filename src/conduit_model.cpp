#include "conduit_model.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <set>
#include <sstream>

namespace conduit {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

const Port* find_in(const std::vector<Port>& ports, const std::string& port_id) {
    for (const auto& port : ports) {
        if (port.id == port_id) return &port;
    }
    return nullptr;
}

const Port* find_by_name(const std::vector<Port>& ports, const std::string& name) {
    for (const auto& port : ports) {
        if (port.name == name) return &port;
    }
    return nullptr;
}

bool is_numeric_identifier(const std::string& s) {
    if (s.empty()) return false;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) return false;
    return s.size() == 1 || s[0] != '0';
}

bool is_dot_separated(const std::string& s) {
    if (s.empty()) return false;
    std::stringstream ss(s);
    std::string part;
    size_t parts = 0;
    while (std::getline(ss, part, '.')) {
        if (part.empty()) return false;
        for (unsigned char c : part) {
            if (!std::isalnum(c) && c != '-') return false;
        }
        ++parts;
    }
    return parts > 0 && s.back() != '.';
}

void collect_descendants(const GraphNode& graph, std::vector<Node>& out) {
    for (const auto& child : graph.child_nodes) {
        out.push_back(child);
        if (const GraphNode* nested = child.as_graph_node()) {
            collect_descendants(*nested, out);
        }
    }
}

} // namespace

const char* to_str(PortDirection direction) {
    switch (direction) {
        case PortDirection::Input: return "INPUT";
        case PortDirection::Output: return "OUTPUT";
        default: return "UNKNOWN";
    }
}

const char* to_str(ExecutionState state) {
    switch (state) {
        case ExecutionState::Idle: return "IDLE";
        case ExecutionState::Running: return "RUNNING";
        case ExecutionState::Paused: return "PAUSED";
        case ExecutionState::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

void ValidationResult::merge(const ValidationResult& other, const std::string& prefix) {
    for (const auto& error : other.errors) {
        add_error(prefix + error);
    }
    if (!other.success && other.errors.empty()) success = false;
}

std::string ValidationResult::error_message() const {
    std::string message;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) message += "; ";
        message += errors[i];
    }
    return message;
}

// ---------------------------------------------------------------- Port

bool Port::is_compatible_with(const Port& target) const {
    if (direction != PortDirection::Output || target.direction != PortDirection::Input) {
        return false;
    }
    return data_type == target.data_type || data_type == ANY_TYPE || target.data_type == ANY_TYPE;
}

ValidationResult Port::validate() const {
    ValidationResult result;
    if (is_blank(id)) result.add_error("Port ID cannot be blank");
    if (is_blank(name)) result.add_error("Port name cannot be blank");
    if (is_blank(owning_node_id)) result.add_error("Port '" + name + "' has no owning node");
    return result;
}

Port Port::with_owner(std::string node_id) const {
    Port copy = *this;
    copy.owning_node_id = std::move(node_id);
    return copy;
}

Port Port::input(std::string id, std::string name, std::string data_type,
                 std::string owning_node_id, bool required) {
    return Port{std::move(id), std::move(name), PortDirection::Input,
                std::move(data_type), required, std::move(owning_node_id)};
}

Port Port::output(std::string id, std::string name, std::string data_type,
                  std::string owning_node_id) {
    return Port{std::move(id), std::move(name), PortDirection::Output,
                std::move(data_type), false, std::move(owning_node_id)};
}

// ---------------------------------------------------------------- Connection

ValidationResult Connection::validate() const {
    ValidationResult result;
    if (is_blank(id)) result.add_error("Connection ID cannot be blank");
    if (is_blank(source_node_id)) result.add_error("Source node ID cannot be blank");
    if (is_blank(source_port_id)) result.add_error("Source port ID cannot be blank");
    if (is_blank(target_node_id)) result.add_error("Target node ID cannot be blank");
    if (is_blank(target_port_id)) result.add_error("Target port ID cannot be blank");
    if (channel_capacity < UNBOUNDED) {
        result.add_error("Channel capacity must be >= -1, got " + std::to_string(channel_capacity));
    }
    if (is_self_loop()) result.add_error("Cannot create self-loop connection on same port");
    return result;
}

ValidationResult Connection::validate_with_ports(const Port& source, const Port& target) const {
    ValidationResult result = validate();
    if (source.id != source_port_id) {
        result.add_error("Source port ID mismatch: expected '" + source_port_id + "', got '" + source.id + "'");
    }
    if (target.id != target_port_id) {
        result.add_error("Target port ID mismatch: expected '" + target_port_id + "', got '" + target.id + "'");
    }
    if (!source.is_output()) {
        result.add_error("Source port '" + source.name + "' must be OUTPUT, got " + to_str(source.direction));
    }
    if (!target.is_input()) {
        result.add_error("Target port '" + target.name + "' must be INPUT, got " + to_str(target.direction));
    }
    if (source.is_output() && target.is_input() && !source.is_compatible_with(target)) {
        result.add_error("Incompatible port types: '" + source.name + "' (" + source.data_type +
                         ") cannot connect to '" + target.name + "' (" + target.data_type + ")");
    }
    return result;
}

Connection Connection::with_channel_capacity(int capacity) const {
    Connection copy = *this;
    copy.channel_capacity = capacity;
    return copy;
}

Connection Connection::with_type_tag(std::string tag) const {
    Connection copy = *this;
    copy.type_tag = std::move(tag);
    return copy;
}

// ---------------------------------------------------------------- ControlConfig

ValidationResult ControlConfig::validate() const {
    ValidationResult result;
    if (pause_buffer_size <= 0) {
        result.add_error("Pause buffer size must be positive, got " + std::to_string(pause_buffer_size));
    }
    if (speed_attenuation.count() < 0) {
        result.add_error("Speed attenuation cannot be negative, got " +
                         std::to_string(speed_attenuation.count()) + "ms");
    }
    return result;
}

bool operator==(const ControlConfig& a, const ControlConfig& b) {
    return a.independent_control == b.independent_control &&
           a.pause_buffer_size == b.pause_buffer_size &&
           a.speed_attenuation == b.speed_attenuation &&
           a.auto_resume_on_error == b.auto_resume_on_error;
}

// ---------------------------------------------------------------- CodeNode

const Port* CodeNode::find_input_port(const std::string& port_id) const {
    return find_in(input_ports, port_id);
}

const Port* CodeNode::find_output_port(const std::string& port_id) const {
    return find_in(output_ports, port_id);
}

const Port* CodeNode::find_port(const std::string& port_id) const {
    const Port* port = find_input_port(port_id);
    return port ? port : find_output_port(port_id);
}

const Port* CodeNode::find_port_by_name(const std::string& port_name) const {
    const Port* port = find_by_name(input_ports, port_name);
    return port ? port : find_by_name(output_ports, port_name);
}

ValidationResult CodeNode::validate() const {
    ValidationResult result;
    if (is_blank(id)) result.add_error("Node ID cannot be blank");
    if (is_blank(name)) result.add_error("Node name cannot be blank");

    std::set<std::string> seen;
    for (const auto& port : input_ports) {
        if (!port.is_input()) result.add_error("Input port '" + port.name + "' has OUTPUT direction");
        if (port.owning_node_id != id) result.add_error("Port '" + port.name + "' is not owned by node '" + id + "'");
        if (!seen.insert(port.id).second) result.add_error("Duplicate port ID '" + port.id + "'");
    }
    for (const auto& port : output_ports) {
        if (!port.is_output()) result.add_error("Output port '" + port.name + "' has INPUT direction");
        if (port.owning_node_id != id) result.add_error("Port '" + port.name + "' is not owned by node '" + id + "'");
        if (!seen.insert(port.id).second) result.add_error("Duplicate port ID '" + port.id + "'");
    }
    result.merge(control_config.validate());
    return result;
}

CodeNode CodeNode::with_execution_state(ExecutionState state) const {
    CodeNode copy = *this;
    copy.execution_state = state;
    return copy;
}

CodeNode CodeNode::with_control_config(const ControlConfig& config) const {
    CodeNode copy = *this;
    copy.control_config = config;
    return copy;
}

CodeNode CodeNode::with_parent(std::optional<std::string> parent_id) const {
    CodeNode copy = *this;
    copy.parent_node_id = std::move(parent_id);
    return copy;
}

CodeNode CodeNode::with_configuration(const std::string& key, const std::string& value) const {
    CodeNode copy = *this;
    copy.configuration[key] = value;
    return copy;
}

// ---------------------------------------------------------------- Node

Node::Node(CodeNode node) : _node(std::move(node)) {}

Node::Node(GraphNode node) : _node(std::make_shared<const GraphNode>(std::move(node))) {}

const CodeNode* Node::as_code_node() const {
    return std::get_if<CodeNode>(&_node);
}

const GraphNode* Node::as_graph_node() const {
    auto* graph = std::get_if<std::shared_ptr<const GraphNode>>(&_node);
    return graph ? graph->get() : nullptr;
}

const std::string& Node::id() const {
    return visit([](const auto& n) -> const std::string& { return n.id; });
}

const std::string& Node::name() const {
    return visit([](const auto& n) -> const std::string& { return n.name; });
}

const std::vector<Port>& Node::input_ports() const {
    return visit([](const auto& n) -> const std::vector<Port>& { return n.input_ports; });
}

const std::vector<Port>& Node::output_ports() const {
    return visit([](const auto& n) -> const std::vector<Port>& { return n.output_ports; });
}

const ControlConfig& Node::control_config() const {
    return visit([](const auto& n) -> const ControlConfig& { return n.control_config; });
}

ExecutionState Node::execution_state() const {
    return visit([](const auto& n) { return n.execution_state; });
}

const std::optional<std::string>& Node::parent_node_id() const {
    return visit([](const auto& n) -> const std::optional<std::string>& { return n.parent_node_id; });
}

const Port* Node::find_port(const std::string& port_id) const {
    return visit([&port_id](const auto& n) { return n.find_port(port_id); });
}

ValidationResult Node::validate() const {
    return visit([](const auto& n) { return n.validate(); });
}

Node Node::with_execution_state(ExecutionState state) const {
    if (const CodeNode* code = as_code_node()) return Node(code->with_execution_state(state));
    return Node(as_graph_node()->with_execution_state(state, true));
}

Node Node::with_control_config(const ControlConfig& config) const {
    if (const CodeNode* code = as_code_node()) return Node(code->with_control_config(config));
    return Node(as_graph_node()->with_control_config(config, true));
}

Node Node::with_parent(std::optional<std::string> parent_id) const {
    if (const CodeNode* code = as_code_node()) return Node(code->with_parent(std::move(parent_id)));
    GraphNode copy = *as_graph_node();
    copy.parent_node_id = std::move(parent_id);
    return Node(std::move(copy));
}

// ---------------------------------------------------------------- GraphNode

const Port* GraphNode::find_port(const std::string& port_id) const {
    const Port* port = find_in(input_ports, port_id);
    return port ? port : find_in(output_ports, port_id);
}

std::optional<Node> GraphNode::find_child(const std::string& child_id) const {
    for (const auto& child : child_nodes) {
        if (child.id() == child_id) return child;
    }
    return std::nullopt;
}

ValidationResult GraphNode::validate() const {
    ValidationResult result;
    if (is_blank(id)) result.add_error("Node ID cannot be blank");
    if (is_blank(name)) result.add_error("Node name cannot be blank");
    result.merge(control_config.validate());

    if (child_nodes.empty()) {
        result.add_error("GraphNode '" + name + "' must have at least one child node");
    }

    for (const auto& child : child_nodes) {
        ValidationResult child_result = child.validate();
        if (!child_result.success) {
            result.add_error("Invalid child node '" + child.name() + "': " + child_result.error_message());
        }
        if (child.parent_node_id() != id) {
            result.add_error("Child node '" + child.name() + "' has incorrect parent: expected '" + id +
                             "', got '" + child.parent_node_id().value_or("") + "'");
        }
    }

    if (parent_node_id && *parent_node_id == id) {
        result.add_error("GraphNode '" + name + "' has itself as parent");
    }

    std::vector<Node> descendants = get_all_descendants();
    std::set<std::string> descendant_ids;
    for (const auto& d : descendants) {
        descendant_ids.insert(d.id());
    }
    if (descendant_ids.count(id)) {
        result.add_error("Circular containment: GraphNode '" + name + "' appears in its own descendant tree");
    }
    if (parent_node_id && descendant_ids.count(*parent_node_id)) {
        result.add_error("Circular containment: GraphNode '" + name + "' has a descendant as parent");
    }

    for (const auto& [port_name, mapping] : port_mappings) {
        std::optional<Node> child = find_child(mapping.child_node_id);
        if (!child) {
            result.add_error("Port mapping '" + port_name + "' references non-existent child node '" +
                             mapping.child_node_id + "'");
            continue;
        }
        const Port* child_port = find_by_name(child->input_ports(), mapping.child_port_name);
        if (!child_port) child_port = find_by_name(child->output_ports(), mapping.child_port_name);
        if (!child_port) {
            result.add_error("Port mapping '" + port_name + "' references non-existent port '" +
                             mapping.child_port_name + "' on child node '" + mapping.child_node_id + "'");
            continue;
        }

        const Port* exposed = find_by_name(input_ports, port_name);
        if (!exposed) exposed = find_by_name(output_ports, port_name);
        if (!exposed) {
            result.add_error("Port mapping '" + port_name + "' references unknown port '" + port_name +
                             "' on GraphNode '" + name + "'");
            continue;
        }
        if (exposed->direction != child_port->direction) {
            result.add_error("Port mapping '" + port_name + "' direction " + to_str(exposed->direction) +
                             " does not match child port direction " + to_str(child_port->direction));
        } else if (exposed->data_type != child_port->data_type &&
                   exposed->data_type != ANY_TYPE && child_port->data_type != ANY_TYPE) {
            result.add_error("Port mapping '" + port_name + "' type '" + exposed->data_type +
                             "' is incompatible with child port type '" + child_port->data_type + "'");
        }
    }

    auto check_mapped = [&](const std::vector<Port>& ports) {
        for (const auto& port : ports) {
            if (!port_mappings.count(port.name)) {
                result.add_error("GraphNode port '" + port.name + "' has no mapping to a child port");
            }
        }
    };
    check_mapped(input_ports);
    check_mapped(output_ports);

    for (const auto& connection : internal_connections) {
        ValidationResult connection_result = connection.validate();
        if (!connection_result.success) {
            result.add_error("Invalid internal connection '" + connection.id + "': " +
                             connection_result.error_message());
        }
        std::optional<Node> source = find_child(connection.source_node_id);
        std::optional<Node> target = find_child(connection.target_node_id);
        if (!source) {
            result.add_error("Internal connection '" + connection.id + "' has source node '" +
                             connection.source_node_id + "' that is not a child of this GraphNode");
        }
        if (!target) {
            result.add_error("Internal connection '" + connection.id + "' has target node '" +
                             connection.target_node_id + "' that is not a child of this GraphNode");
        }
        if (source && target) {
            const Port* source_port = source->find_port(connection.source_port_id);
            const Port* target_port = target->find_port(connection.target_port_id);
            if (!source_port || !target_port) {
                result.add_error("Internal connection '" + connection.id + "' references a non-existent port");
            } else {
                ValidationResult port_result = connection.validate_with_ports(*source_port, *target_port);
                if (!port_result.success) {
                    result.add_error("Internal connection '" + connection.id + "': " + port_result.error_message());
                }
            }
        }
    }

    return result;
}

GraphNode GraphNode::with_execution_state(ExecutionState state, bool propagate) const {
    GraphNode copy = *this;
    copy.execution_state = state;
    if (propagate) {
        for (auto& child : copy.child_nodes) {
            if (child.control_config().independent_control) continue;
            child = child.with_execution_state(state);
        }
    }
    return copy;
}

GraphNode GraphNode::with_control_config(const ControlConfig& config, bool propagate) const {
    GraphNode copy = *this;
    copy.control_config = config;
    if (propagate) {
        for (auto& child : copy.child_nodes) {
            const bool independent = child.control_config().independent_control;
            child = child.with_control_config(config.with_independent_control(independent));
        }
    }
    return copy;
}

GraphNode GraphNode::add_child(Node child) const {
    GraphNode copy = *this;
    copy.child_nodes.push_back(child.with_parent(id));
    return copy;
}

GraphNode GraphNode::remove_child(const std::string& child_id) const {
    GraphNode copy = *this;
    copy.child_nodes.erase(
        std::remove_if(copy.child_nodes.begin(), copy.child_nodes.end(),
                       [&](const Node& n) { return n.id() == child_id; }),
        copy.child_nodes.end());
    copy.internal_connections.erase(
        std::remove_if(copy.internal_connections.begin(), copy.internal_connections.end(),
                       [&](const Connection& c) { return c.involves_node(child_id); }),
        copy.internal_connections.end());
    for (auto it = copy.port_mappings.begin(); it != copy.port_mappings.end();) {
        if (it->second.child_node_id == child_id) it = copy.port_mappings.erase(it);
        else ++it;
    }
    return copy;
}

GraphNode GraphNode::add_internal_connection(Connection connection) const {
    GraphNode copy = *this;
    connection.parent_scope_id = id;
    copy.internal_connections.push_back(std::move(connection));
    return copy;
}

GraphNode GraphNode::remove_internal_connection(const std::string& connection_id) const {
    GraphNode copy = *this;
    copy.internal_connections.erase(
        std::remove_if(copy.internal_connections.begin(), copy.internal_connections.end(),
                       [&](const Connection& c) { return c.id == connection_id; }),
        copy.internal_connections.end());
    return copy;
}

GraphNode GraphNode::add_port_mapping(const std::string& port_name, PortMapping mapping) const {
    GraphNode copy = *this;
    copy.port_mappings[port_name] = std::move(mapping);
    return copy;
}

std::vector<Node> GraphNode::get_all_descendants() const {
    std::vector<Node> out;
    collect_descendants(*this, out);
    return out;
}

std::vector<CodeNode> GraphNode::get_all_code_nodes() const {
    std::vector<CodeNode> out;
    for (const auto& node : get_all_descendants()) {
        if (const CodeNode* code = node.as_code_node()) out.push_back(*code);
    }
    return out;
}

size_t GraphNode::total_node_count() const {
    return get_all_descendants().size();
}

size_t GraphNode::max_depth() const {
    size_t deepest = 0;
    for (const auto& child : child_nodes) {
        if (const GraphNode* nested = child.as_graph_node()) {
            deepest = std::max(deepest, nested->max_depth());
        }
    }
    return deepest + 1;
}

// ---------------------------------------------------------------- FlowGraph

bool is_semantic_version(const std::string& version) {
    std::string core = version;
    std::string prerelease;
    std::string build;

    auto plus = core.find('+');
    if (plus != std::string::npos) {
        build = core.substr(plus + 1);
        core = core.substr(0, plus);
        if (!is_dot_separated(build)) return false;
    }
    auto dash = core.find('-');
    if (dash != std::string::npos) {
        prerelease = core.substr(dash + 1);
        core = core.substr(0, dash);
        if (!is_dot_separated(prerelease)) return false;
    }

    std::stringstream ss(core);
    std::string part;
    int parts = 0;
    while (std::getline(ss, part, '.')) {
        if (!is_numeric_identifier(part)) return false;
        ++parts;
    }
    return parts == 3 && core.back() != '.';
}

ValidationResult FlowGraph::validate() const {
    ValidationResult result;
    if (is_blank(id)) result.add_error("FlowGraph ID cannot be blank");
    if (is_blank(name)) result.add_error("FlowGraph name cannot be blank");
    if (is_blank(version)) {
        result.add_error("FlowGraph version cannot be blank");
    } else if (!is_semantic_version(version)) {
        result.add_error("FlowGraph version must be a semantic version (MAJOR.MINOR.PATCH), got: " + version);
    }

    for (const auto& node : root_nodes) {
        ValidationResult node_result = node.validate();
        if (!node_result.success) {
            result.add_error("Invalid root node '" + node.name() + "': " + node_result.error_message());
        }
        if (node.parent_node_id()) {
            result.add_error("Root node '" + node.name() + "' should not have a parent");
        }
    }

    std::vector<Node> all_nodes = get_all_nodes();

    for (const auto& connection : connections) {
        ValidationResult connection_result = connection.validate();
        if (!connection_result.success) {
            result.add_error("Invalid connection '" + connection.id + "': " + connection_result.error_message());
        }

        std::optional<Node> source = find_node(connection.source_node_id);
        std::optional<Node> target = find_node(connection.target_node_id);
        if (!source) {
            result.add_error("Connection '" + connection.id + "' references non-existent source node '" +
                             connection.source_node_id + "'");
        }
        if (!target) {
            result.add_error("Connection '" + connection.id + "' references non-existent target node '" +
                             connection.target_node_id + "'");
        }
        if (!source || !target) continue;

        const Port* source_port = source->find_port(connection.source_port_id);
        const Port* target_port = target->find_port(connection.target_port_id);
        if (!source_port) {
            result.add_error("Connection '" + connection.id + "' references non-existent source port '" +
                             connection.source_port_id + "'");
        }
        if (!target_port) {
            result.add_error("Connection '" + connection.id + "' references non-existent target port '" +
                             connection.target_port_id + "'");
        }
        if (source_port && target_port) {
            ValidationResult port_result = connection.validate_with_ports(*source_port, *target_port);
            if (!port_result.success) {
                result.add_error("Connection '" + connection.id + "': " + port_result.error_message());
            }
        }
    }

    std::map<std::string, int> id_counts;
    for (const auto& node : all_nodes) {
        ++id_counts[node.id()];
    }
    std::string duplicates;
    for (const auto& [node_id, count] : id_counts) {
        if (count > 1) duplicates += (duplicates.empty() ? "" : ", ") + node_id;
    }
    if (!duplicates.empty()) {
        result.add_error("Duplicate node IDs found: " + duplicates);
    }

    return result;
}

std::optional<Node> FlowGraph::find_node(const std::string& node_id) const {
    for (const auto& node : get_all_nodes()) {
        if (node.id() == node_id) return node;
    }
    return std::nullopt;
}

std::vector<Node> FlowGraph::get_all_nodes() const {
    std::vector<Node> out;
    for (const auto& node : root_nodes) {
        out.push_back(node);
        if (const GraphNode* graph = node.as_graph_node()) {
            collect_descendants(*graph, out);
        }
    }
    return out;
}

std::vector<CodeNode> FlowGraph::get_all_code_nodes() const {
    std::vector<CodeNode> out;
    for (const auto& node : get_all_nodes()) {
        if (const CodeNode* code = node.as_code_node()) out.push_back(*code);
    }
    return out;
}

std::vector<Connection> FlowGraph::get_connections_for_node(const std::string& node_id) const {
    std::vector<Connection> out;
    for (const auto& connection : connections) {
        if (connection.involves_node(node_id)) out.push_back(connection);
    }
    return out;
}

FlowGraph FlowGraph::with_nodes(std::vector<Node> nodes) const {
    FlowGraph copy = *this;
    copy.root_nodes = std::move(nodes);
    return copy;
}

FlowGraph FlowGraph::add_node(Node node) const {
    FlowGraph copy = *this;
    copy.root_nodes.push_back(std::move(node));
    return copy;
}

FlowGraph FlowGraph::remove_node(const std::string& node_id) const {
    FlowGraph copy = *this;
    copy.root_nodes.erase(
        std::remove_if(copy.root_nodes.begin(), copy.root_nodes.end(),
                       [&](const Node& n) { return n.id() == node_id; }),
        copy.root_nodes.end());
    copy.connections.erase(
        std::remove_if(copy.connections.begin(), copy.connections.end(),
                       [&](const Connection& c) { return c.involves_node(node_id); }),
        copy.connections.end());
    return copy;
}

FlowGraph FlowGraph::add_connection(Connection connection) const {
    FlowGraph copy = *this;
    copy.connections.push_back(std::move(connection));
    return copy;
}

FlowGraph FlowGraph::remove_connection(const std::string& connection_id) const {
    FlowGraph copy = *this;
    copy.connections.erase(
        std::remove_if(copy.connections.begin(), copy.connections.end(),
                       [&](const Connection& c) { return c.id == connection_id; }),
        copy.connections.end());
    return copy;
}

FlowGraph FlowGraph::with_metadata(const std::string& key, const std::string& value) const {
    FlowGraph copy = *this;
    copy.metadata[key] = value;
    return copy;
}

FlowExecutionStatus FlowGraph::execution_status() const {
    FlowExecutionStatus status;
    for (const auto& node : get_all_nodes()) {
        ++status.total_nodes;
        switch (node.execution_state()) {
            case ExecutionState::Idle: ++status.idle_count; break;
            case ExecutionState::Running: ++status.running_count; break;
            case ExecutionState::Paused: ++status.paused_count; break;
            case ExecutionState::Error: ++status.error_count; break;
        }
        if (node.control_config().independent_control) ++status.independent_control_count;
    }

    if (status.error_count > 0) status.overall_state = ExecutionState::Error;
    else if (status.running_count > 0) status.overall_state = ExecutionState::Running;
    else if (status.paused_count > 0) status.overall_state = ExecutionState::Paused;
    else status.overall_state = ExecutionState::Idle;
    return status;
}

} // namespace conduit
