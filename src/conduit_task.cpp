#include "conduit_task.hpp"
#include "task_policies/conduit_task_policy_base.hpp"

#include <system_error>

namespace {
    thread_local conduit::TaskContext* _current_context = nullptr;
}

namespace conduit {

void TaskContext::request_cancel() {
    _cancelled.store(true, std::memory_order_release);
    {
        // Wakers run under the lock so a waiting primitive cannot unregister
        // (and be destroyed) while its waker is executing.
        std::lock_guard<std::mutex> lock(_waker_mutex);
        for (auto& entry : _wakers) {
            entry.second();
        }
    }
    _policy.on_unpark(*this);
}

TaskContext::WakerId TaskContext::add_waker(std::function<void()> waker) {
    std::lock_guard<std::mutex> lock(_waker_mutex);
    WakerId id = _next_waker_id++;
    _wakers.emplace_back(id, std::move(waker));
    return id;
}

void TaskContext::remove_waker(WakerId id) {
    std::lock_guard<std::mutex> lock(_waker_mutex);
    for (auto it = _wakers.begin(); it != _wakers.end(); ++it) {
        if (it->first == id) {
            _wakers.erase(it);
            return;
        }
    }
}

void TaskContext::park_begin() {
    _policy.on_park(*this);
}

void TaskContext::park_end() {
    _policy.on_unpark(*this);
}

Task& Task::operator=(Task&& other) noexcept {
    if (this != &other) {
        if (_thread.joinable()) {
            cancel();
            if (is_current()) _thread.detach();
            else _thread.join();
        }
        _thread = std::move(other._thread);
        _context = std::move(other._context);
    }
    return *this;
}

Task::~Task() {
    if (_thread.joinable()) {
        cancel();
        if (is_current()) _thread.detach();
        else _thread.join();
    }
}

Task TaskPolicyBase::create_task(std::function<void()> func) {
    auto context = std::make_shared<TaskContext>(*this);

    // Counted as live before the thread exists so schedulers never see a gap
    on_task_started(*context);

    struct FinishGuard {
        TaskPolicyBase& policy;
        TaskContext& context;
        ~FinishGuard() {
            detail::set_current_context(nullptr);
            policy.on_task_finished(context);
        }
    };

    try {
        std::thread thread([this, context, func = std::move(func)]() {
            detail::set_current_context(context.get());
            FinishGuard guard{*this, *context};
            func();
        });
        return Task(std::move(thread), context);
    } catch (const std::system_error&) {
        on_task_finished(*context);
        throw;
    }
}

namespace detail {

void set_current_context(TaskContext* context) noexcept {
    _current_context = context;
}

} // namespace detail

namespace this_task {

TaskContext* context() noexcept {
    return _current_context;
}

bool cancel_requested() noexcept {
    return _current_context && _current_context->cancel_requested();
}

void sleep_for(std::chrono::nanoseconds duration) {
    if (_current_context) {
        _current_context->policy().sleep_for(*_current_context, duration);
    } else if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

void yield() {
    if (_current_context) {
        _current_context->throw_if_cancelled();
        _current_context->policy().yield();
    } else {
        std::this_thread::yield();
    }
}

} // namespace this_task

} // namespace conduit
