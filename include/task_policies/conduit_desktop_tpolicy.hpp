#pragma once

#include "conduit_task_policy_base.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace conduit {

struct DesktopTaskPolicy : TaskPolicyBase {
    DesktopTaskPolicy() = default;

    void sleep_for(TaskContext& context, std::chrono::nanoseconds duration) override {
        if (duration.count() <= 0) {
            context.throw_if_cancelled();
            return;
        }

        std::mutex m;
        std::condition_variable cv;
        {
            WakerGuard guard(&context, [&m, &cv]() {
                std::lock_guard<std::mutex> lock(m);
                cv.notify_all();
            });
            std::unique_lock<std::mutex> lock(m);
            cv.wait_for(lock, duration, [&context]() { return context.cancel_requested(); });
        }
        context.throw_if_cancelled();
    }

    std::chrono::nanoseconds now() const override {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch());
    }
};

} // namespace conduit
