#include <gtest/gtest.h>
#include "conduit_model.hpp"

using namespace conduit;

namespace {

CodeNode code_node(const std::string& id, const std::string& in_type = "Int",
                   const std::string& out_type = "Int") {
    CodeNode node;
    node.id = id;
    node.name = id;
    node.input_ports.push_back(Port::input(id + "_in", "in", in_type, id));
    node.output_ports.push_back(Port::output(id + "_out", "out", out_type, id));
    return node;
}

Connection connect(const std::string& id, const std::string& from, const std::string& to) {
    Connection c;
    c.id = id;
    c.source_node_id = from;
    c.source_port_id = from + "_out";
    c.target_node_id = to;
    c.target_port_id = to + "_in";
    return c;
}

// group { a -> b }, exposing a.in as "in" and b.out as "out"
GraphNode group(const std::string& id) {
    GraphNode g;
    g.id = id;
    g.name = id;
    g = g.add_child(code_node(id + "_a")).add_child(code_node(id + "_b"));
    g = g.add_internal_connection(connect(id + "_c", id + "_a", id + "_b"));
    g.input_ports.push_back(Port::input(id + "_in", "in", "Int", id));
    g.output_ports.push_back(Port::output(id + "_out", "out", "Int", id));
    g = g.add_port_mapping("in", PortMapping{id + "_a", "in"});
    g = g.add_port_mapping("out", PortMapping{id + "_b", "out"});
    return g;
}

} // namespace

class ModelTest : public ::testing::Test {};

TEST_F(ModelTest, PortCompatibility) {
    Port out = Port::output("o", "o", "Int", "n1");
    Port in = Port::input("i", "i", "Int", "n2");
    Port any_in = Port::input("a", "a", ANY_TYPE, "n2");
    Port str_in = Port::input("s", "s", "String", "n2");

    EXPECT_TRUE(out.is_compatible_with(in));
    EXPECT_TRUE(out.is_compatible_with(any_in));
    EXPECT_FALSE(out.is_compatible_with(str_in));
    EXPECT_FALSE(in.is_compatible_with(out));
    EXPECT_FALSE(out.is_compatible_with(out));

    EXPECT_TRUE(out.is_valid());
    EXPECT_FALSE(Port{}.is_valid());
    EXPECT_EQ(out.with_owner("n9").owning_node_id, "n9");
}

TEST_F(ModelTest, ConnectionCapacityKinds) {
    Connection c = connect("c", "a", "b");
    EXPECT_TRUE(c.is_rendezvous());
    EXPECT_TRUE(c.with_channel_capacity(8).is_buffered());
    EXPECT_TRUE(c.with_channel_capacity(Connection::UNBOUNDED).is_unbounded());
    EXPECT_TRUE(c.validate().success);
    EXPECT_FALSE(c.with_channel_capacity(-2).validate().success);
    EXPECT_EQ(c.with_type_tag("Int").type_tag, std::optional<std::string>("Int"));
}

TEST_F(ModelTest, ConnectionRejectsBlankIdsAndSelfLoop) {
    Connection blank;
    ValidationResult r = blank.validate();
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error_message().find("Connection ID cannot be blank"), std::string::npos);
    EXPECT_NE(r.error_message().find("Target port ID cannot be blank"), std::string::npos);

    Connection loop = connect("loop", "a", "a");
    loop.target_port_id = loop.source_port_id;
    EXPECT_FALSE(loop.validate().success);
}

TEST_F(ModelTest, ConnectionValidatesAgainstPorts) {
    Connection c = connect("c", "a", "b");
    Port src = Port::output("a_out", "out", "Int", "a");
    Port dst = Port::input("b_in", "in", "Int", "b");
    EXPECT_TRUE(c.validate_with_ports(src, dst).success);

    Port wrong_type = Port::input("b_in", "in", "String", "b");
    EXPECT_FALSE(c.validate_with_ports(src, wrong_type).success);

    Port wrong_direction = Port::output("b_in", "in", "Int", "b");
    ValidationResult r = c.validate_with_ports(src, wrong_direction);
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error_message().find("must be INPUT"), std::string::npos);
}

TEST_F(ModelTest, ControlConfigValidation) {
    ControlConfig config;
    EXPECT_TRUE(config.is_valid());
    EXPECT_FALSE(config.independent_control);
    EXPECT_FALSE(config.auto_resume_on_error);

    config.pause_buffer_size = 0;
    EXPECT_FALSE(config.is_valid());

    ControlConfig negative;
    negative.speed_attenuation = std::chrono::milliseconds(-1);
    EXPECT_FALSE(negative.is_valid());
}

TEST_F(ModelTest, CodeNodeValidation) {
    CodeNode node = code_node("n");
    EXPECT_TRUE(node.validate().success);
    EXPECT_NE(node.find_input_port("n_in"), nullptr);
    EXPECT_EQ(node.find_input_port("n_out"), nullptr);
    EXPECT_NE(node.find_port("n_out"), nullptr);

    CodeNode foreign = node;
    foreign.input_ports[0].owning_node_id = "other";
    EXPECT_FALSE(foreign.validate().success);

    CodeNode swapped = node;
    swapped.input_ports[0].direction = PortDirection::Output;
    EXPECT_FALSE(swapped.validate().success);
}

TEST_F(ModelTest, ValidGraphNode) {
    GraphNode g = group("g");
    ValidationResult r = g.validate();
    EXPECT_TRUE(r.success) << r.error_message();
    EXPECT_EQ(g.max_depth(), 1u);
    EXPECT_EQ(g.total_node_count(), 2u);
    EXPECT_EQ(g.internal_connections[0].parent_scope_id, std::optional<std::string>("g"));
}

TEST_F(ModelTest, GraphNodeNeedsChildren) {
    GraphNode g;
    g.id = "empty";
    g.name = "empty";
    EXPECT_FALSE(g.validate().success);
}

TEST_F(ModelTest, GraphNodeChecksChildParent) {
    GraphNode g = group("g");
    g.child_nodes.push_back(Node(code_node("stray")));
    EXPECT_FALSE(g.validate().success);
}

TEST_F(ModelTest, GraphNodeChecksPortMappings) {
    GraphNode missing_child = group("g").add_port_mapping("in", PortMapping{"nope", "in"});
    EXPECT_FALSE(missing_child.validate().success);

    GraphNode missing_port = group("g").add_port_mapping("in", PortMapping{"g_a", "nope"});
    EXPECT_FALSE(missing_port.validate().success);

    GraphNode wrong_direction = group("g").add_port_mapping("in", PortMapping{"g_a", "out"});
    EXPECT_FALSE(wrong_direction.validate().success);

    GraphNode unmapped = group("g");
    unmapped.port_mappings.erase("out");
    ValidationResult r = unmapped.validate();
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error_message().find("no mapping"), std::string::npos);
}

TEST_F(ModelTest, GraphNodeRejectsMappingForUndeclaredPort) {
    GraphNode g = group("g").add_port_mapping("extra", PortMapping{"g_a", "in"});
    ValidationResult r = g.validate();
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error_message().find("unknown port 'extra'"), std::string::npos);
}

TEST_F(ModelTest, GraphNodeInternalConnectionsOnlyLinkChildren) {
    GraphNode g = group("g").add_internal_connection(connect("x", "g_b", "outsider"));
    EXPECT_FALSE(g.validate().success);
}

TEST_F(ModelTest, StatePropagationSkipsIndependentSubtree) {
    GraphNode inner = group("inner");
    inner.control_config.independent_control = true;

    GraphNode outer;
    outer.id = "outer";
    outer.name = "outer";
    outer = outer.add_child(code_node("leaf")).add_child(inner);

    GraphNode running = outer.with_execution_state(ExecutionState::Running);
    EXPECT_EQ(running.execution_state, ExecutionState::Running);
    EXPECT_EQ(running.find_child("leaf")->execution_state(), ExecutionState::Running);

    auto kept = running.find_child("inner");
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(kept->execution_state(), ExecutionState::Idle);
    for (const auto& n : kept->as_graph_node()->child_nodes) {
        EXPECT_EQ(n.execution_state(), ExecutionState::Idle);
    }

    GraphNode only_self = outer.with_execution_state(ExecutionState::Paused, false);
    EXPECT_EQ(only_self.find_child("leaf")->execution_state(), ExecutionState::Idle);
}

TEST_F(ModelTest, ConfigPropagationKeepsChildIndependence) {
    GraphNode g = group("g");
    g.child_nodes[0] = Node(g.child_nodes[0].as_code_node()->with_control_config(
        ControlConfig{}.with_independent_control(true)));

    ControlConfig slow;
    slow.speed_attenuation = std::chrono::milliseconds(250);
    GraphNode updated = g.with_control_config(slow);

    EXPECT_EQ(updated.control_config, slow);
    EXPECT_TRUE(updated.child_nodes[0].control_config().independent_control);
    EXPECT_EQ(updated.child_nodes[0].control_config().speed_attenuation, std::chrono::milliseconds(250));
    EXPECT_FALSE(updated.child_nodes[1].control_config().independent_control);
}

TEST_F(ModelTest, NestedDepthAndDescendants) {
    GraphNode inner = group("inner");
    GraphNode outer;
    outer.id = "outer";
    outer.name = "outer";
    outer = outer.add_child(inner);

    EXPECT_EQ(outer.max_depth(), 2u);
    EXPECT_EQ(outer.get_all_descendants().size(), 3u);
    EXPECT_EQ(outer.get_all_code_nodes().size(), 2u);
}

TEST_F(ModelTest, SemanticVersions) {
    EXPECT_TRUE(is_semantic_version("1.0.0"));
    EXPECT_TRUE(is_semantic_version("10.20.30"));
    EXPECT_TRUE(is_semantic_version("1.0.0-alpha.1"));
    EXPECT_TRUE(is_semantic_version("1.0.0+build.5"));
    EXPECT_FALSE(is_semantic_version("1.0"));
    EXPECT_FALSE(is_semantic_version("1.0.0."));
    EXPECT_FALSE(is_semantic_version("01.0.0"));
    EXPECT_FALSE(is_semantic_version("a.b.c"));
    EXPECT_FALSE(is_semantic_version(""));
}

TEST_F(ModelTest, FlowGraphResolvesNestedReferences) {
    FlowGraph graph;
    graph.id = "flow";
    graph.name = "flow";
    graph = graph.add_node(code_node("src")).add_node(group("g"));
    graph = graph.add_connection(connect("c1", "src", "g_a"));

    ValidationResult r = graph.validate();
    EXPECT_TRUE(r.success) << r.error_message();
    EXPECT_EQ(graph.get_all_nodes().size(), 4u);
    EXPECT_TRUE(graph.find_node("g_b").has_value());
    EXPECT_EQ(graph.get_connections_for_node("src").size(), 1u);
}

TEST_F(ModelTest, FlowGraphRejectsDanglingConnection) {
    FlowGraph graph;
    graph.id = "flow";
    graph.name = "flow";
    graph = graph.add_node(code_node("a")).add_connection(connect("c", "a", "ghost"));
    EXPECT_FALSE(graph.validate().success);

    Connection bad_port = connect("c2", "a", "a");
    bad_port.target_port_id = "missing";
    FlowGraph other = graph.remove_connection("c").add_node(code_node("b"));
    bad_port.target_node_id = "b";
    EXPECT_FALSE(other.add_connection(bad_port).validate().success);
}

TEST_F(ModelTest, FlowGraphRejectsBadVersionAndDuplicates) {
    FlowGraph graph;
    graph.id = "flow";
    graph.name = "flow";
    graph.version = "1.0";
    graph = graph.add_node(code_node("a")).add_node(code_node("a"));

    ValidationResult r = graph.validate();
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error_message().find("semantic version"), std::string::npos);
    EXPECT_NE(r.error_message().find("Duplicate node IDs found: a"), std::string::npos);
}

TEST_F(ModelTest, RemoveNodeDropsItsConnections) {
    FlowGraph graph;
    graph.id = "flow";
    graph.name = "flow";
    graph = graph.add_node(code_node("a")).add_node(code_node("b")).add_connection(connect("c", "a", "b"));

    FlowGraph removed = graph.remove_node("b");
    EXPECT_EQ(removed.root_nodes.size(), 1u);
    EXPECT_TRUE(removed.connections.empty());
    EXPECT_EQ(graph.root_nodes.size(), 2u);
}

TEST_F(ModelTest, ExecutionStatusPriority) {
    FlowGraph graph;
    graph.id = "flow";
    graph.name = "flow";
    graph = graph.add_node(code_node("a").with_execution_state(ExecutionState::Paused))
                 .add_node(code_node("b"));
    EXPECT_EQ(graph.execution_status().overall_state, ExecutionState::Paused);

    graph = graph.add_node(code_node("c").with_execution_state(ExecutionState::Running));
    EXPECT_EQ(graph.execution_status().overall_state, ExecutionState::Running);

    graph = graph.add_node(code_node("d").with_execution_state(ExecutionState::Error));
    FlowExecutionStatus status = graph.execution_status();
    EXPECT_EQ(status.overall_state, ExecutionState::Error);
    EXPECT_EQ(status.total_nodes, 4u);
    EXPECT_EQ(status.idle_count, 1u);
    EXPECT_TRUE(status.has_errors());
}
