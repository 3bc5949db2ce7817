#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace conduit {

    class TaskPolicyBase;

    // Thrown out of blocking operations once the owning task has been cancelled.
    // Not derived from std::exception, catch (const std::exception&) lets it through.
    struct TaskCancelled {
        const char* what() const noexcept { return "task cancelled"; }
    };

    // Per-task cancellation state. Blocking primitives register a waker while
    // they wait so request_cancel() can interrupt them.
    class TaskContext {
    public:
        using WakerId = std::size_t;

        explicit TaskContext(TaskPolicyBase& policy) : _policy(policy) {}

        TaskContext(const TaskContext&) = delete;
        TaskContext& operator=(const TaskContext&) = delete;

        TaskPolicyBase& policy() const { return _policy; }

        bool cancel_requested() const {
            return _cancelled.load(std::memory_order_acquire);
        }

        void throw_if_cancelled() const {
            if (cancel_requested()) throw TaskCancelled{};
        }

        void request_cancel();

        WakerId add_waker(std::function<void()> waker);
        void remove_waker(WakerId id);

        // Marks the task as blocked (or no longer blocked) for the scheduler.
        void park_begin();
        void park_end();

    private:
        TaskPolicyBase& _policy;
        std::atomic<bool> _cancelled{false};
        std::mutex _waker_mutex;
        std::vector<std::pair<WakerId, std::function<void()>>> _wakers;
        WakerId _next_waker_id = 0;
    };

    // Registers a waker for the lifetime of a blocking wait.
    // Must be constructed before the waiting primitive takes its own lock.
    class WakerGuard {
    public:
        WakerGuard(TaskContext* context, std::function<void()> waker)
            : _context(context) {
            if (_context) _id = _context->add_waker(std::move(waker));
        }
        ~WakerGuard() {
            if (_context) _context->remove_waker(_id);
        }
        WakerGuard(const WakerGuard&) = delete;
        WakerGuard& operator=(const WakerGuard&) = delete;

    private:
        TaskContext* _context;
        TaskContext::WakerId _id = 0;
    };

    class Task {
    public:
        Task() = default;
        Task(std::thread thread, std::shared_ptr<TaskContext> context)
            : _thread(std::move(thread)), _context(std::move(context)) {}

        Task(Task&&) noexcept = default;
        Task& operator=(Task&& other) noexcept;
        Task(const Task&) = delete;
        Task& operator=(const Task&) = delete;

        // Cancels and joins, unless called from the task itself.
        ~Task();

        bool valid() const { return _thread.joinable(); }
        bool is_current() const { return _thread.get_id() == std::this_thread::get_id(); }
        TaskContext* context() const { return _context.get(); }

        void cancel() {
            if (_context) _context->request_cancel();
        }

        void join() {
            if (_thread.joinable()) _thread.join();
        }

        void detach() {
            if (_thread.joinable()) _thread.detach();
        }

    private:
        std::thread _thread;
        std::shared_ptr<TaskContext> _context;
    };

    namespace detail {
        void set_current_context(TaskContext* context) noexcept;
    } // namespace detail

    // Cancellation-aware helpers for code running inside a scheduled task.
    // Off-task they fall back to plain std::this_thread behavior.
    namespace this_task {

        TaskContext* context() noexcept;

        bool cancel_requested() noexcept;

        void sleep_for(std::chrono::nanoseconds duration);

        template<typename Rep, typename Period>
        void sleep_for(const std::chrono::duration<Rep, Period>& duration) {
            sleep_for(std::chrono::duration_cast<std::chrono::nanoseconds>(duration));
        }

        void yield();

    } // namespace this_task

} // namespace conduit
