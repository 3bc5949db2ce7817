#pragma once

#include "conduit_task.hpp"
#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace conduit {

    // Point-to-point channel between two runtimes.
    //   capacity == 0  : rendezvous, send() returns only once a receiver took the value
    //   capacity  > 0  : bounded buffer, send() blocks while full (backpressure)
    //   capacity == -1 : unbounded, send() never blocks
    // After close() no new values are accepted; buffered values can still be drained.
    // Blocking calls made from a scheduled task throw TaskCancelled when it is stopped.
    template <typename T>
    class Channel {
    public:
        static constexpr int RENDEZVOUS = 0;
        static constexpr int UNBOUNDED = -1;

        explicit Channel(int capacity = RENDEZVOUS) : _capacity(capacity) {
            if (capacity < UNBOUNDED) {
                throw std::invalid_argument("Channel capacity must be >= -1.");
            }
        }

        Channel(const Channel&) = delete;
        Channel& operator=(const Channel&) = delete;
        Channel(Channel&&) = delete;
        Channel& operator=(Channel&&) = delete;

        // Returns false if the channel is closed.
        bool send(T value) {
            TaskContext* ctx = this_task::context();
            WakerGuard guard(ctx, [this]() { wake_all(); });
            std::unique_lock<std::mutex> lock(_mutex);

            if (_closed) return false;
            if (_capacity > 0) {
                wait_locked(lock, ctx, [this]() {
                    return _closed || _buffer.size() < static_cast<size_t>(_capacity);
                });
            } else if (_capacity == RENDEZVOUS) {
                // one pending handoff at a time
                wait_locked(lock, ctx, [this]() { return _closed || _buffer.empty(); });
            }
            if (_closed) return false;

            _buffer.push_back(std::move(value));
            const std::uint64_t ticket = ++_pushed;
            notify_locked();

            if (_capacity == RENDEZVOUS) {
                try {
                    wait_locked(lock, ctx, [this, ticket]() { return _popped >= ticket; });
                } catch (const TaskCancelled&) {
                    if (_popped < ticket) {
                        _buffer.pop_back();
                        --_pushed;
                        notify_locked();
                    }
                    throw;
                }
            }
            return true;
        }

        // Non-blocking send. On a rendezvous channel it only succeeds when a
        // receiver is already waiting with its gate open. Gates are re-evaluated
        // on notify(), so a gate closed without a notify() still counts as open.
        bool try_send(const T& value) {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_closed) return false;
            if (_capacity > 0 && _buffer.size() >= static_cast<size_t>(_capacity)) return false;
            if (_capacity == RENDEZVOUS && (_ready_receivers == 0 || !_buffer.empty())) return false;

            _buffer.push_back(value);
            ++_pushed;
            notify_locked();
            return true;
        }

        // Returns std::nullopt once the channel is closed and drained.
        std::optional<T> receive() {
            return receive_when([]() { return true; });
        }

        // Like receive(), but only takes a value while gate() is true.
        // The gate is evaluated under the channel lock; call notify() when its
        // result may have changed.
        template <typename Gate>
        std::optional<T> receive_when(Gate&& gate) {
            return receive_when(std::forward<Gate>(gate), []() { return false; });
        }

        // As above, and gives up with std::nullopt as soon as abandon() is true.
        template <typename Gate, typename Abandon>
        std::optional<T> receive_when(Gate&& gate, Abandon&& abandon) {
            TaskContext* ctx = this_task::context();
            WakerGuard guard(ctx, [this]() { wake_all(); });
            std::unique_lock<std::mutex> lock(_mutex);

            // counted in _ready_receivers while waiting with an open gate
            struct ReadyReceiver {
                size_t& count;
                bool ready = false;
                void set(bool open) {
                    if (open == ready) return;
                    ready = open;
                    if (open) ++count;
                    else --count;
                }
                ~ReadyReceiver() { set(false); }
            } receiver{_ready_receivers};

            bool abandoned = false;
            wait_locked(lock, ctx, [&]() {
                if (_closed && _buffer.empty()) return true;
                if (abandon()) {
                    abandoned = true;
                    return true;
                }
                const bool open = gate();
                receiver.set(open);
                return open && !_buffer.empty();
            });

            if (abandoned || _buffer.empty()) return std::nullopt;
            return pop_locked();
        }

        std::optional<T> try_receive() {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_buffer.empty()) return std::nullopt;
            return pop_locked();
        }

        void close() {
            std::lock_guard<std::mutex> lock(_mutex);
            _closed = true;
            notify_locked();
        }

        bool is_closed() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _closed;
        }

        bool is_closed_for_receive() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _closed && _buffer.empty();
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _buffer.size();
        }

        bool empty() const { return size() == 0; }

        int capacity() const { return _capacity; }

        // Wakes blocked callers so they re-evaluate their wait conditions.
        void notify() { wake_all(); }

    private:
        T pop_locked() {
            T value = std::move(_buffer.front());
            _buffer.pop_front();
            ++_popped;
            notify_locked();
            return value;
        }

        void wake_all() {
            std::lock_guard<std::mutex> lock(_mutex);
            notify_locked();
        }

        void notify_locked() {
            for (TaskContext* waiter : _waiters) {
                waiter->park_end();
            }
            _cv.notify_all();
        }

        template <typename Pred>
        void wait_locked(std::unique_lock<std::mutex>& lock, TaskContext* ctx, Pred pred) {
            if (!ctx) {
                _cv.wait(lock, pred);
                return;
            }
            while (!pred()) {
                ctx->throw_if_cancelled();
                _waiters.push_back(ctx);
                ctx->park_begin();
                _cv.wait(lock);
                _waiters.erase(std::find(_waiters.begin(), _waiters.end(), ctx));
                ctx->park_end();
            }
        }

        mutable std::mutex _mutex;
        std::condition_variable _cv;
        std::deque<T> _buffer;
        const int _capacity;
        bool _closed = false;
        std::uint64_t _pushed = 0;
        std::uint64_t _popped = 0;
        size_t _ready_receivers = 0;
        std::vector<TaskContext*> _waiters;
    };

} // namespace conduit
