#include "conduit_runtime.hpp"
#include "conduit_registry.hpp"
#include "zf_log.h"

#include <exception>
#include <stdexcept>

namespace conduit {

NodeRuntime::NodeRuntime(CodeNode node, RuntimeRegistry* registry, RuntimeConfig config)
    : _node(std::move(node)), _registry(registry), _config(config) {
    ValidationResult control = _node.control_config.validate();
    if (!control.success) {
        throw std::invalid_argument("Invalid control config for node '" + _node.name + "': " +
                                    control.error_message());
    }
    if (_config.pause_poll_interval.count() <= 0) {
        throw std::invalid_argument("Pause poll interval must be positive.");
    }
}

NodeRuntime::~NodeRuntime() {
    stop();
}

void NodeRuntime::start(TaskPolicyBase& policy, std::function<void()> processing_block) {
    Task previous;
    {
        std::lock_guard<std::mutex> lock(_task_mutex);
        previous = std::move(_task);
        ++_generation;
    }
    if (previous.valid()) {
        previous.cancel();
        if (previous.is_current()) previous.detach();
        else previous.join();
    }

    std::lock_guard<std::mutex> lock(_task_mutex);
    const std::uint64_t generation = ++_generation;
    _last_error.clear();
    if (_registry) _registry->register_runtime(*this);
    // Running before the task exists, rolled back if it cannot be created
    _state.store(ExecutionState::Running, std::memory_order_release);
    try {
        _task = policy.create_task([this, generation, block = std::move(processing_block)]() {
            run_task(generation, block);
        });
    } catch (const std::exception& e) {
        _state.store(ExecutionState::Idle, std::memory_order_release);
        if (_registry) _registry->unregister_runtime(*this);
        ZF_LOGE("node '%s': could not create task: %s", _node.name.c_str(), e.what());
        throw;
    }
    ZF_LOGD("node '%s' (%s) started", _node.name.c_str(), _node.id.c_str());
}

void NodeRuntime::stop() {
    Task task;
    {
        std::lock_guard<std::mutex> lock(_task_mutex);
        if (is_idle() && !_task.valid()) return;
        task = std::move(_task);
        ++_generation;
        _state.store(ExecutionState::Idle, std::memory_order_release);
        if (_registry) _registry->unregister_runtime(*this);
    }
    if (task.valid()) {
        task.cancel();
        if (task.is_current()) task.detach();
        else task.join();
    }
    ZF_LOGD("node '%s' stopped", _node.name.c_str());
}

void NodeRuntime::pause() {
    ExecutionState expected = ExecutionState::Running;
    if (_state.compare_exchange_strong(expected, ExecutionState::Paused, std::memory_order_acq_rel)) {
        ZF_LOGD("node '%s' paused", _node.name.c_str());
        on_state_changed();
    }
}

void NodeRuntime::resume() {
    ExecutionState expected = ExecutionState::Paused;
    if (_state.compare_exchange_strong(expected, ExecutionState::Running, std::memory_order_acq_rel)) {
        ZF_LOGD("node '%s' resumed", _node.name.c_str());
        on_state_changed();
    }
}

void NodeRuntime::set_execution_state(ExecutionState state) {
    _state.store(state, std::memory_order_release);
    on_state_changed();
}

void NodeRuntime::set_registry(RuntimeRegistry* registry) {
    std::lock_guard<std::mutex> lock(_task_mutex);
    if (_registry && _task.valid()) {
        _registry->unregister_runtime(*this);
        if (registry) registry->register_runtime(*this);
    }
    _registry = registry;
}

std::string NodeRuntime::last_error() const {
    std::lock_guard<std::mutex> lock(_task_mutex);
    return _last_error;
}

bool NodeRuntime::wait_while_paused() {
    while (true) {
        switch (execution_state()) {
            case ExecutionState::Running: return true;
            case ExecutionState::Paused: break;
            default: return false;
        }
        this_task::sleep_for(_config.pause_poll_interval);
    }
}

void NodeRuntime::run_task(std::uint64_t generation, const std::function<void()>& block) {
    try {
        block();
    } catch (const TaskCancelled&) {
        ZF_LOGD("node '%s' cancelled", _node.name.c_str());
    } catch (const std::exception& e) {
        enter_error(generation, e.what());
    } catch (...) {
        enter_error(generation, "non-standard exception");
    }
    finish_task(generation);
}

void NodeRuntime::enter_error(std::uint64_t generation, const char* what) {
    {
        std::lock_guard<std::mutex> lock(_task_mutex);
        if (generation != _generation) return;
        _state.store(ExecutionState::Error, std::memory_order_release);
        _last_error = what;
    }
    ZF_LOGE("node '%s' failed: %s", _node.name.c_str(), what);
    if (_on_error_cb) {
        _on_error_cb(*this, what, _on_error_context);
    }
}

void NodeRuntime::finish_task(std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(_task_mutex);
    if (generation != _generation) return;
    if (!is_error()) {
        _state.store(ExecutionState::Idle, std::memory_order_release);
    }
    if (_registry) _registry->unregister_runtime(*this);
}

} // namespace conduit
