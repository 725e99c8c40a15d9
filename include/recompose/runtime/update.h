#ifndef RECOMPOSE_RUNTIME_UPDATE_H
#define RECOMPOSE_RUNTIME_UPDATE_H

#include <recompose/recompose_export.h>
#include <recompose/recompose_forward_declarations.h>
#include <recompose/util/sender_receiver_state.h>

#include <functional>
#include <memory>

namespace recompose {

    /**
     * A deferred state mutation. An empty update carries no mutation, it only asks the host for another pass.
     */
    class RECOMPOSE_EXPORT Update {
    public:
        Update() = default;

        explicit Update(std::function<void()> fn);

        void apply();

        explicit operator bool() const noexcept { return static_cast<bool>(_fn); }

    private:
        std::function<void()> _fn;
    };

    /**
     * The host-loop boundary, accepts a pending update and guarantees it is applied before or during the next pass.
     * Implementations may be called from any thread.
     */
    struct RECOMPOSE_EXPORT Updater {
        virtual ~Updater() = default;

        virtual void update(Update update) = 0;
    };

    using UpdateQueue = SenderReceiverState<Update>;

    /**
     * The default updater, queues updates on the runtime's update queue where the composer drains them at the start
     * of the next pass. Updates arriving after the queue is stopped are discarded.
     */
    class RECOMPOSE_EXPORT QueuedUpdater final : public Updater {
    public:
        explicit QueuedUpdater(std::weak_ptr<UpdateQueue> queue);

        void update(Update update) override;

    private:
        std::weak_ptr<UpdateQueue> _queue;
    };

} // namespace recompose

#endif // RECOMPOSE_RUNTIME_UPDATE_H
