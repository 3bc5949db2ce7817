#pragma once

#include "conduit_config.hpp"
#include "conduit_model.hpp"
#include "conduit_task.hpp"
#include "task_policies/conduit_task_policy_base.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace conduit {

    class RuntimeRegistry;

    // Lifecycle of one scheduled node, independent of the data it moves.
    //
    //   Idle --start--> Running --pause--> Paused --resume--> Running
    //   Running|Paused|Error --stop--> Idle
    //   Running --processing function throws--> Error --start--> Running
    //
    // pause/resume/stop are silent no-ops from states where they do not apply.
    // Typed runtimes own their channels; this class only owns the task.
    class NodeRuntime {
    public:
        using OnErrorCallback = void (*)(NodeRuntime& runtime, const char* what, void* context);

        explicit NodeRuntime(CodeNode node, RuntimeRegistry* registry = nullptr,
                             RuntimeConfig config = RuntimeConfig{});
        virtual ~NodeRuntime();

        NodeRuntime(const NodeRuntime&) = delete;
        NodeRuntime& operator=(const NodeRuntime&) = delete;
        NodeRuntime(NodeRuntime&&) = delete;
        NodeRuntime& operator=(NodeRuntime&&) = delete;

        // Cancels (and waits for) any previous task, registers with the registry,
        // moves to Running and schedules processing_block on policy.
        void start(TaskPolicyBase& policy, std::function<void()> processing_block);

        void stop();
        void pause();
        void resume();

        ExecutionState execution_state() const {
            return _state.load(std::memory_order_acquire);
        }
        // Direct assignment from outside the lifecycle, e.g. restoring a model state
        void set_execution_state(ExecutionState state);

        bool is_running() const { return execution_state() == ExecutionState::Running; }
        bool is_paused() const { return execution_state() == ExecutionState::Paused; }
        bool is_idle() const { return execution_state() == ExecutionState::Idle; }
        bool is_error() const { return execution_state() == ExecutionState::Error; }

        const CodeNode& node() const { return _node; }
        const std::string& id() const { return _node.id; }
        const std::string& name() const { return _node.name; }
        const ControlConfig& control_config() const { return _node.control_config; }
        const RuntimeConfig& config() const { return _config; }

        RuntimeRegistry* registry() const { return _registry; }
        void set_registry(RuntimeRegistry* registry);

        void set_on_error_cb(OnErrorCallback cb, void* context) {
            _on_error_cb = cb;
            _on_error_context = context;
        }

        // Message of the exception that moved this runtime to Error, if any
        std::string last_error() const;

    protected:
        // Blocks while Paused. Returns false once the runtime left Running/Paused.
        bool wait_while_paused();

        // Called after pause(), resume() and set_execution_state() so blocked
        // receives re-check their gate
        virtual void on_state_changed() {}

    private:
        void run_task(std::uint64_t generation, const std::function<void()>& block);
        void finish_task(std::uint64_t generation);
        void enter_error(std::uint64_t generation, const char* what);

        CodeNode _node;
        RuntimeRegistry* _registry;
        RuntimeConfig _config;
        std::atomic<ExecutionState> _state{ExecutionState::Idle};

        mutable std::mutex _task_mutex;
        Task _task;
        std::uint64_t _generation = 0;
        std::string _last_error;

        OnErrorCallback _on_error_cb = nullptr;
        void* _on_error_context = nullptr;
    };

} // namespace conduit
