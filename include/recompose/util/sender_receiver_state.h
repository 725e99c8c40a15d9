#ifndef RECOMPOSE_SENDER_RECEIVER_STATE_H
#define RECOMPOSE_SENDER_RECEIVER_STATE_H

#include <recompose/util/errors.h>

#include <deque>
#include <mutex>
#include <optional>

namespace recompose {
    /**
     * A thread-safe FIFO used to hand work from any thread (task wakers, mutation handles) to the driving thread.
     * Once stopped, enqueue raises and try_enqueue reports false, draining is still permitted.
     */
    template<typename T>
    struct SenderReceiverState {
        using LockType = std::recursive_mutex;
        using LockGuard = std::lock_guard<LockType>;
        using value_type = T;

        SenderReceiverState() = default;

        SenderReceiverState(const SenderReceiverState &) = delete;

        SenderReceiverState &operator=(const SenderReceiverState &) = delete;

        void operator()(value_type value) { enqueue(std::move(value)); }

        void enqueue(value_type value) {
            LockGuard guard(_lock);
            if (_stopped) { throw_error("Cannot enqueue into a stopped receiver"); }
            _queue.push_back(std::move(value));
        }

        void enqueue_front(value_type value) {
            LockGuard guard(_lock);
            if (_stopped) { throw_error("Cannot enqueue into a stopped receiver"); }
            _queue.push_front(std::move(value));
        }

        /**
         * Enqueue unless stopped, returns true when the value was accepted.
         */
        [[nodiscard]] bool try_enqueue(value_type value) {
            LockGuard guard(_lock);
            if (_stopped) { return false; }
            _queue.push_back(std::move(value));
            return true;
        }

        std::optional<value_type> dequeue() {
            LockGuard guard(_lock);
            if (_queue.empty()) { return std::nullopt; }
            std::optional<value_type> value{std::move(_queue.front())};
            _queue.pop_front();
            return value;
        }

        explicit operator bool() const {
            LockGuard guard(_lock);
            return !_queue.empty();
        }

        [[nodiscard]] size_t size() const {
            LockGuard guard(_lock);
            return _queue.size();
        }

        void clear() {
            LockGuard guard(_lock);
            _queue.clear();
        }

        [[nodiscard]] bool stopped() const {
            LockGuard guard(_lock);
            return _stopped;
        }

        void mark_stopped() {
            LockGuard guard(_lock);
            _stopped = true;
        }

        void mark_running() {
            LockGuard guard(_lock);
            _stopped = false;
        }

    private:
        mutable LockType _lock;
        std::deque<value_type> _queue;
        bool _stopped{false};
    };
} // namespace recompose

#endif // RECOMPOSE_SENDER_RECEIVER_STATE_H
