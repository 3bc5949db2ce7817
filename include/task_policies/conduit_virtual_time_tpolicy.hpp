#pragma once

#include "conduit_task_policy_base.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <vector>

namespace conduit {

// Deterministic clock for timing-sensitive flows and tests.
// Tasks run on real threads, but sleep_for() blocks on a virtual clock that only
// moves inside advance_by(). Before each step advance_by() waits until every live
// task is parked (sleeping, blocked on a channel, or finished).
class VirtualTimeTaskPolicy : public TaskPolicyBase {
public:
    VirtualTimeTaskPolicy() = default;
    ~VirtualTimeTaskPolicy() override = default;

    void sleep_for(TaskContext& context, std::chrono::nanoseconds duration) override;
    std::chrono::nanoseconds now() const override;

    // Moves virtual time forward, waking sleepers in deadline order.
    void advance_by(std::chrono::nanoseconds duration);

    template<typename Rep, typename Period>
    void advance_by(const std::chrono::duration<Rep, Period>& duration) {
        advance_by(std::chrono::duration_cast<std::chrono::nanoseconds>(duration));
    }

    // Waits until every live task is parked without moving the clock.
    void run_until_parked();

    std::size_t live_tasks() const;
    std::size_t parked_tasks() const;

    // Real time advance_by() waits for tasks to park before it gives up and steps anyway
    void set_settle_timeout(std::chrono::milliseconds timeout) { _settle_timeout = timeout; }

    void on_task_started(TaskContext& context) override;
    void on_task_finished(TaskContext& context) override;
    void on_park(TaskContext& context) override;
    void on_unpark(TaskContext& context) override;

private:
    struct Sleeper {
        std::chrono::nanoseconds deadline;
        std::uint64_t seq;
        TaskContext* context;
        bool woken;
    };

    bool settled_locked() const { return _parked.size() >= _live.size(); }
    void wait_settled_locked(std::unique_lock<std::mutex>& lock);

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::chrono::nanoseconds _now{0};
    std::uint64_t _next_seq = 0;
    std::set<TaskContext*> _live;
    std::set<TaskContext*> _parked;
    std::vector<Sleeper*> _sleepers;
    std::chrono::milliseconds _settle_timeout{5000};
};

} // namespace conduit
