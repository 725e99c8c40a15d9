#include <recompose/runtime/update.h>

namespace recompose {
    Update::Update(std::function<void()> fn) : _fn{std::move(fn)} {}

    void Update::apply() {
        if (_fn) { _fn(); }
    }

    QueuedUpdater::QueuedUpdater(std::weak_ptr<UpdateQueue> queue) : _queue{std::move(queue)} {}

    void QueuedUpdater::update(Update update) {
        auto queue = _queue.lock();
        if (!queue) { return; }
        // A stopped queue belongs to a composer that is shutting down, the update has nowhere to go.
        [[maybe_unused]] bool accepted = queue->try_enqueue(std::move(update));
    }
} // namespace recompose
