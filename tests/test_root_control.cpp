#include <gtest/gtest.h>
#include "conduit_registry.hpp"
#include "conduit_root_control.hpp"
#include "conduit_runtime.hpp"
#include "task_policies/conduit_desktop_tpolicy.hpp"
#include "test_helpers.hpp"
#include <memory>

using namespace conduit;
using test_helpers::idle_loop;
using test_helpers::make_node;

class RootControlTest : public ::testing::Test {
protected:
    // flow: root "a", root group "g" { "g1", independent "g2" }
    void SetUp() override {
        GraphNode group;
        group.id = "g";
        group.name = "group";
        group = group.add_child(make_node("g1")).add_child(make_node("g2", true));

        flow.id = "flow";
        flow.name = "flow";
        flow = flow.add_node(make_node("a")).add_node(group);
    }

    ExecutionState state_of(const FlowGraph& graph, const std::string& id) {
        auto node = graph.find_node(id);
        EXPECT_TRUE(node.has_value()) << id;
        return node ? node->execution_state() : ExecutionState::Error;
    }

    FlowGraph flow;
    DesktopTaskPolicy policy;
    RuntimeRegistry registry;
};

TEST_F(RootControlTest, CreateForGeneratesId) {
    RootControlNode controller = RootControlNode::create_for(flow);
    EXPECT_EQ(controller.id().rfind("controller_", 0), 0u);
    EXPECT_EQ(controller.name(), "Controller");
    EXPECT_GT(controller.created_at_ms(), 0);
    EXPECT_EQ(controller.flow_graph().id, "flow");
}

TEST_F(RootControlTest, StartAllSkipsIndependentSubtree) {
    RootControlNode controller("root", "root", flow);
    FlowGraph started = controller.start_all();

    EXPECT_EQ(state_of(started, "a"), ExecutionState::Running);
    EXPECT_EQ(state_of(started, "g"), ExecutionState::Running);
    EXPECT_EQ(state_of(started, "g1"), ExecutionState::Running);
    EXPECT_EQ(state_of(started, "g2"), ExecutionState::Idle);

    // the controller's own graph is unchanged
    EXPECT_EQ(state_of(controller.flow_graph(), "a"), ExecutionState::Idle);
}

TEST_F(RootControlTest, PauseResumeStop) {
    RootControlNode controller("root", "root", flow);
    RootControlNode paused = controller.with_flow_graph(controller.pause_all());
    EXPECT_EQ(paused.status().overall_state, ExecutionState::Paused);
    EXPECT_EQ(paused.status().idle_count, 1u);
    EXPECT_EQ(paused.status().independent_control_count, 1u);

    RootControlNode resumed = paused.with_flow_graph(paused.resume_all());
    EXPECT_EQ(state_of(resumed.flow_graph(), "g1"), ExecutionState::Running);

    RootControlNode stopped = resumed.with_flow_graph(resumed.stop_all());
    EXPECT_TRUE(stopped.status().all_idle());
    EXPECT_EQ(stopped.id(), "root");
}

TEST_F(RootControlTest, DrivesRegisteredRuntimes) {
    NodeRuntime a(make_node("a"), &registry);
    NodeRuntime g1(make_node("g1"), &registry);
    NodeRuntime g2(make_node("g2", true), &registry);
    a.start(policy, idle_loop());
    g1.start(policy, idle_loop());
    g2.start(policy, idle_loop());

    RootControlNode controller("root", "root", flow, &registry);
    controller.pause_all();
    EXPECT_TRUE(a.is_paused());
    EXPECT_TRUE(g1.is_paused());
    EXPECT_TRUE(g2.is_running());

    controller.start_all();
    EXPECT_TRUE(a.is_running());
    EXPECT_TRUE(g1.is_running());

    controller.stop_all();
    EXPECT_TRUE(a.is_idle());
    EXPECT_TRUE(g1.is_idle());
    EXPECT_TRUE(g2.is_running());
    EXPECT_EQ(registry.count(), 0u);
    g2.stop();
}

TEST_F(RootControlTest, SetNodeStateTargetsOneNode) {
    RootControlNode controller("root", "root", flow);
    auto result = controller.set_node_state("g1", ExecutionState::Paused);
    ASSERT_TRUE(result.is_ok());

    const FlowGraph& updated = result.unwrap();
    EXPECT_EQ(state_of(updated, "g1"), ExecutionState::Paused);
    EXPECT_EQ(state_of(updated, "g"), ExecutionState::Idle);
    EXPECT_EQ(state_of(updated, "a"), ExecutionState::Idle);
}

TEST_F(RootControlTest, SetNodeStateOnGroupPropagates) {
    RootControlNode controller("root", "root", flow);
    auto result = controller.set_node_state("g", ExecutionState::Running);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(state_of(result.unwrap(), "g1"), ExecutionState::Running);
    EXPECT_EQ(state_of(result.unwrap(), "g2"), ExecutionState::Idle);
}

TEST_F(RootControlTest, SetNodeConfig) {
    RootControlNode controller("root", "root", flow);
    ControlConfig config;
    config.speed_attenuation = std::chrono::milliseconds(50);

    auto result = controller.set_node_config("a", config);
    ASSERT_TRUE(result.is_ok());
    auto node = result.unwrap().find_node("a");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->control_config().speed_attenuation, std::chrono::milliseconds(50));
}

TEST_F(RootControlTest, UnknownNodeIsNotFound) {
    RootControlNode controller("root", "root", flow);
    auto state = controller.set_node_state("ghost", ExecutionState::Running);
    ASSERT_TRUE(state.is_err());
    EXPECT_EQ(state.unwrap_err(), Error::NotFound);

    auto config = controller.set_node_config("ghost", ControlConfig{});
    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.unwrap_err(), Error::NotFound);
}

TEST_F(RootControlTest, SetNodeConfigRejectsInvalidConfig) {
    RootControlNode controller("root", "root", flow);
    ControlConfig config;
    config.pause_buffer_size = 0;

    auto result = controller.set_node_config("a", config);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.unwrap_err(), Error::ValidationFailed);
    EXPECT_STREQ(to_str(Error::ValidationFailed), "Validation failed");

    auto node = controller.flow_graph().find_node("a");
    ASSERT_TRUE(node.has_value());
    EXPECT_GT(node->control_config().pause_buffer_size, 0);
}
