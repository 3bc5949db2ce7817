#include <gtest/gtest.h>
#include "conduit_registry.hpp"
#include "conduit_runtime.hpp"
#include "task_policies/conduit_desktop_tpolicy.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

using namespace conduit;
using test_helpers::idle_loop;
using test_helpers::make_node;
using test_helpers::wait_until;

namespace {

// Counts cycles that get past the pause gate
class CyclingRuntime : public NodeRuntime {
public:
    using NodeRuntime::NodeRuntime;
    ~CyclingRuntime() override { stop(); }

    void start(TaskPolicyBase& policy) {
        NodeRuntime::start(policy, [this]() {
            while (wait_while_paused()) {
                cycles++;
                this_task::sleep_for(std::chrono::milliseconds(1));
            }
        });
    }

    std::atomic<int> cycles{0};
};

struct ErrorRecord {
    std::atomic<int> calls{0};
    std::string what;
};

void record_error(NodeRuntime&, const char* what, void* context) {
    auto* record = static_cast<ErrorRecord*>(context);
    record->what = what;
    record->calls++;
}

// Refuses every task, as a policy out of threads would
struct ExhaustedTaskPolicy : DesktopTaskPolicy {
    void on_task_started(TaskContext&) override {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    }
};

} // namespace

class RuntimeLifecycleTest : public ::testing::Test {
protected:
    RuntimeConfig fast_config() {
        RuntimeConfig config;
        config.pause_poll_interval = std::chrono::milliseconds(1);
        return config;
    }

    DesktopTaskPolicy policy;
    RuntimeRegistry registry;
};

TEST_F(RuntimeLifecycleTest, StartsIdle) {
    NodeRuntime runtime(make_node("n"));
    EXPECT_TRUE(runtime.is_idle());
    EXPECT_EQ(runtime.id(), "n");
    EXPECT_TRUE(runtime.last_error().empty());
}

TEST_F(RuntimeLifecycleTest, InvalidConfigThrows) {
    CodeNode bad = make_node("bad");
    bad.control_config.pause_buffer_size = 0;
    EXPECT_THROW(NodeRuntime runtime(bad), std::invalid_argument);

    RuntimeConfig no_poll;
    no_poll.pause_poll_interval = std::chrono::milliseconds(0);
    EXPECT_THROW(NodeRuntime runtime(make_node("n"), nullptr, no_poll), std::invalid_argument);
}

TEST_F(RuntimeLifecycleTest, StartRegistersAndStopUnregisters) {
    NodeRuntime runtime(make_node("n"), &registry);
    runtime.start(policy, idle_loop());

    EXPECT_TRUE(runtime.is_running());
    EXPECT_TRUE(registry.is_registered("n"));
    EXPECT_EQ(registry.get("n"), &runtime);

    runtime.stop();
    EXPECT_TRUE(runtime.is_idle());
    EXPECT_FALSE(registry.is_registered("n"));
}

TEST_F(RuntimeLifecycleTest, PauseAndResumeAreIdempotent) {
    NodeRuntime runtime(make_node("n"));

    runtime.pause();
    EXPECT_TRUE(runtime.is_idle());
    runtime.resume();
    EXPECT_TRUE(runtime.is_idle());

    runtime.start(policy, idle_loop());
    runtime.resume();
    EXPECT_TRUE(runtime.is_running());

    runtime.pause();
    runtime.pause();
    EXPECT_TRUE(runtime.is_paused());

    runtime.resume();
    runtime.resume();
    EXPECT_TRUE(runtime.is_running());
    runtime.stop();
}

TEST_F(RuntimeLifecycleTest, PauseHoldsProcessingCycles) {
    CyclingRuntime runtime(make_node("n"), nullptr, fast_config());
    runtime.start(policy);
    ASSERT_TRUE(wait_until([&]() { return runtime.cycles.load() > 3; }));

    runtime.pause();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    const int held = runtime.cycles.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(runtime.cycles.load(), held);

    runtime.resume();
    EXPECT_TRUE(wait_until([&]() { return runtime.cycles.load() > held; }));
    runtime.stop();
}

TEST_F(RuntimeLifecycleTest, StopWhilePausedGoesIdle) {
    CyclingRuntime runtime(make_node("n"), &registry, fast_config());
    runtime.start(policy);
    runtime.pause();
    ASSERT_TRUE(runtime.is_paused());

    runtime.stop();
    EXPECT_TRUE(runtime.is_idle());
    EXPECT_FALSE(registry.is_registered("n"));

    runtime.resume();
    EXPECT_TRUE(runtime.is_idle());
}

TEST_F(RuntimeLifecycleTest, CompletedBlockReturnsToIdle) {
    NodeRuntime runtime(make_node("n"), &registry);
    std::atomic<bool> ran{false};
    runtime.start(policy, [&]() { ran = true; });

    ASSERT_TRUE(wait_until([&]() { return runtime.is_idle(); }));
    EXPECT_TRUE(ran.load());
    EXPECT_TRUE(wait_until([&]() { return !registry.is_registered("n"); }));
}

TEST_F(RuntimeLifecycleTest, ExceptionMovesToError) {
    NodeRuntime runtime(make_node("n"), &registry);
    ErrorRecord record;
    runtime.set_on_error_cb(record_error, &record);

    runtime.start(policy, []() { throw std::runtime_error("boom"); });

    ASSERT_TRUE(wait_until([&]() { return record.calls.load() == 1; }));
    EXPECT_TRUE(runtime.is_error());
    EXPECT_EQ(record.what, "boom");
    EXPECT_EQ(runtime.last_error(), "boom");
    EXPECT_TRUE(wait_until([&]() { return !registry.is_registered("n"); }));

    runtime.pause();
    EXPECT_TRUE(runtime.is_error());
}

TEST_F(RuntimeLifecycleTest, StartRecoversFromError) {
    NodeRuntime runtime(make_node("n"));
    runtime.start(policy, []() { throw std::runtime_error("boom"); });
    ASSERT_TRUE(wait_until([&]() { return runtime.is_error(); }));

    runtime.start(policy, idle_loop());
    EXPECT_TRUE(runtime.is_running());
    EXPECT_TRUE(runtime.last_error().empty());
    runtime.stop();
}

TEST_F(RuntimeLifecycleTest, StopFromErrorResetsToIdle) {
    NodeRuntime runtime(make_node("n"));
    runtime.start(policy, []() { throw std::runtime_error("boom"); });
    ASSERT_TRUE(wait_until([&]() { return runtime.is_error(); }));

    runtime.stop();
    EXPECT_TRUE(runtime.is_idle());
}

TEST_F(RuntimeLifecycleTest, RestartCancelsPreviousTask) {
    NodeRuntime runtime(make_node("n"), &registry);
    std::atomic<int> finished{0};

    struct ExitCounter {
        std::atomic<int>& count;
        ~ExitCounter() { count++; }
    };
    auto block = [&]() {
        ExitCounter counter{finished};
        while (true) {
            this_task::sleep_for(std::chrono::milliseconds(5));
        }
    };

    runtime.start(policy, block);
    runtime.start(policy, block);
    EXPECT_EQ(finished.load(), 1);
    EXPECT_TRUE(runtime.is_running());
    EXPECT_EQ(registry.count(), 1u);

    runtime.stop();
    EXPECT_EQ(finished.load(), 2);
}

TEST_F(RuntimeLifecycleTest, SetExecutionStateOverridesLifecycle) {
    NodeRuntime runtime(make_node("n"));
    runtime.set_execution_state(ExecutionState::Paused);
    EXPECT_TRUE(runtime.is_paused());
    runtime.resume();
    EXPECT_TRUE(runtime.is_running());
    runtime.set_execution_state(ExecutionState::Idle);
    EXPECT_TRUE(runtime.is_idle());
}

TEST_F(RuntimeLifecycleTest, FailedTaskCreationLeavesRuntimeIdle) {
    NodeRuntime runtime(make_node("n"), &registry);
    ExhaustedTaskPolicy exhausted;

    EXPECT_THROW(runtime.start(exhausted, idle_loop()), std::system_error);
    EXPECT_TRUE(runtime.is_idle());
    EXPECT_FALSE(registry.is_registered("n"));
    EXPECT_EQ(registry.count(), 0u);

    runtime.start(policy, idle_loop());
    EXPECT_TRUE(runtime.is_running());
    EXPECT_TRUE(registry.is_registered("n"));
    runtime.stop();
    EXPECT_EQ(registry.count(), 0u);
}
