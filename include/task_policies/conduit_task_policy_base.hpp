#pragma once

#include "../conduit_task.hpp"
#include <chrono>
#include <functional>
#include <thread>

namespace conduit {

// Scheduler handed to NodeRuntime::start(). One std::thread per task; derived
// policies decide what time means and how a task sleeps.
// A policy must outlive every task it created.
class TaskPolicyBase {
public:
    virtual ~TaskPolicyBase() = default;

    TaskPolicyBase(const TaskPolicyBase&) = delete;
    TaskPolicyBase& operator=(const TaskPolicyBase&) = delete;

    Task create_task(std::function<void()> func);

    static void join_task(Task& t) {
        t.join();
    }

    virtual void yield() {
        std::this_thread::yield();
    }

    // Blocks the calling task for `duration` of this policy's time.
    // Throws TaskCancelled if the task is cancelled while sleeping.
    virtual void sleep_for(TaskContext& context, std::chrono::nanoseconds duration) = 0;

    virtual std::chrono::nanoseconds now() const = 0;

    // Bookkeeping hooks, used by schedulers that need to know when every task is blocked
    virtual void on_task_started(TaskContext& context) { (void)context; }
    virtual void on_task_finished(TaskContext& context) { (void)context; }
    virtual void on_park(TaskContext& context) { (void)context; }
    virtual void on_unpark(TaskContext& context) { (void)context; }

protected:
    TaskPolicyBase() = default;
};

} // namespace conduit
