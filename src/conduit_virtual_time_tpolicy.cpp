#include "task_policies/conduit_virtual_time_tpolicy.hpp"
#include "zf_log.h"

#include <algorithm>

namespace conduit {

void VirtualTimeTaskPolicy::sleep_for(TaskContext& context, std::chrono::nanoseconds duration) {
    if (duration.count() <= 0) {
        context.throw_if_cancelled();
        return;
    }

    {
        WakerGuard guard(&context, [this]() {
            std::lock_guard<std::mutex> lock(_mutex);
            _cv.notify_all();
        });

        std::unique_lock<std::mutex> lock(_mutex);
        Sleeper sleeper{_now + duration, _next_seq++, &context, false};
        _sleepers.push_back(&sleeper);
        _parked.insert(&context);
        _cv.notify_all();

        _cv.wait(lock, [&]() { return sleeper.woken || context.cancel_requested(); });

        _sleepers.erase(std::remove(_sleepers.begin(), _sleepers.end(), &sleeper), _sleepers.end());
        _parked.erase(&context);
        _cv.notify_all();
    }
    context.throw_if_cancelled();
}

std::chrono::nanoseconds VirtualTimeTaskPolicy::now() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _now;
}

void VirtualTimeTaskPolicy::wait_settled_locked(std::unique_lock<std::mutex>& lock) {
    if (!_cv.wait_for(lock, _settle_timeout, [this]() { return settled_locked(); })) {
        ZF_LOGW("virtual clock: %zu of %zu tasks still busy after %lld ms, advancing anyway",
            _live.size() - _parked.size(), _live.size(),
            static_cast<long long>(_settle_timeout.count()));
    }
}

void VirtualTimeTaskPolicy::advance_by(std::chrono::nanoseconds duration) {
    std::unique_lock<std::mutex> lock(_mutex);
    const auto target = _now + duration;

    while (true) {
        wait_settled_locked(lock);

        Sleeper* next = nullptr;
        for (Sleeper* s : _sleepers) {
            if (s->woken || s->deadline > target) continue;
            if (!next || s->deadline < next->deadline ||
                (s->deadline == next->deadline && s->seq < next->seq)) {
                next = s;
            }
        }
        if (!next) break;

        _now = std::max(_now, next->deadline);
        for (Sleeper* s : _sleepers) {
            if (!s->woken && s->deadline <= _now) {
                s->woken = true;
                _parked.erase(s->context);
            }
        }
        _cv.notify_all();
    }

    _now = std::max(_now, target);
}

void VirtualTimeTaskPolicy::run_until_parked() {
    std::unique_lock<std::mutex> lock(_mutex);
    wait_settled_locked(lock);
}

std::size_t VirtualTimeTaskPolicy::live_tasks() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _live.size();
}

std::size_t VirtualTimeTaskPolicy::parked_tasks() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _parked.size();
}

void VirtualTimeTaskPolicy::on_task_started(TaskContext& context) {
    std::lock_guard<std::mutex> lock(_mutex);
    _live.insert(&context);
}

void VirtualTimeTaskPolicy::on_task_finished(TaskContext& context) {
    std::lock_guard<std::mutex> lock(_mutex);
    _live.erase(&context);
    _parked.erase(&context);
    _cv.notify_all();
}

void VirtualTimeTaskPolicy::on_park(TaskContext& context) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_live.count(&context)) {
        _parked.insert(&context);
        _cv.notify_all();
    }
}

void VirtualTimeTaskPolicy::on_unpark(TaskContext& context) {
    std::lock_guard<std::mutex> lock(_mutex);
    _parked.erase(&context);
    _cv.notify_all();
}

} // namespace conduit
