#ifndef RECOMPOSE_RUNTIME_RUNTIME_H
#define RECOMPOSE_RUNTIME_RUNTIME_H

#include <recompose/recompose_export.h>
#include <recompose/runtime/compose_observer.h>
#include <recompose/runtime/task.h>
#include <recompose/runtime/update.h>
#include <recompose/types/scope_arena.h>
#include <recompose/util/lifecycle.h>
#include <recompose/util/sender_receiver_state.h>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace recompose {

    using ReadyQueue = SenderReceiverState<TaskKey>;

    /**
     * The ambient state shared by every node of one composer's tree.
     *
     * Holds the scope arena, the local task table, the ready queue (fed by task wakers, possibly from other threads),
     * the update queue and the write guard. Updates take the guard exclusively while applying, the composer holds it
     * exclusively while driving the tree and executor tasks hold it shared while polling, so mutations never overlap a
     * drive.
     *
     * Stopping the runtime stops both queues, late wake-ups and updates are then discarded.
     */
    class RECOMPOSE_EXPORT Runtime final : public ComponentLifeCycle, public std::enable_shared_from_this<Runtime> {
    public:
        using ptr = std::shared_ptr<Runtime>;

        /**
         * @param updater Receives every update, when null a QueuedUpdater feeding this runtime's update queue is used.
         * @param observers Notified of compose events.
         */
        static ptr create(updater_ptr updater = nullptr, std::vector<observer_ptr> observers = {});

        Runtime(const Runtime &) = delete;

        Runtime &operator=(const Runtime &) = delete;

        ~Runtime() override;

        [[nodiscard]] ScopeArena &scopes() noexcept { return _scopes; }

        [[nodiscard]] const ScopeArena &scopes() const noexcept { return _scopes; }

        // Updates

        /**
         * Hand ``fn`` to the updater, wrapped so it runs under the exclusive write guard.
         */
        void update(std::function<void()> fn);

        /**
         * Ask the host for another pass without mutating anything.
         */
        void request_pass();

        /**
         * Apply the updates queued so far, in order. Updates queued while applying wait for the next call.
         * Returns the number applied. An update that throws stops the batch, the exception propagates.
         */
        size_t apply_queued_updates();

        /**
         * As above, but an update that throws is recorded in ``failures`` and the rest of the batch is still applied.
         */
        size_t apply_queued_updates(std::vector<Error> &failures);

        [[nodiscard]] size_t pending_update_count() const { return _update_queue->size(); }

        /**
         * Set whenever a scope is marked changed, cleared by the composer before it drives the tree.
         */
        void note_changed() noexcept { _has_changes = true; }

        [[nodiscard]] bool has_changes() const noexcept { return _has_changes; }

        void clear_changes() noexcept { _has_changes = false; }

        [[nodiscard]] const updater_ptr &updater() const noexcept { return _updater; }

        [[nodiscard]] const std::shared_ptr<UpdateQueue> &update_queue() const noexcept { return _update_queue; }

        [[nodiscard]] const std::shared_ptr<std::shared_mutex> &write_guard() const noexcept { return _write_guard; }

        // Local tasks

        /**
         * Register a task polled on the driving thread, it is queued as ready immediately.
         */
        TaskKey spawn_local(TaskFn task);

        /**
         * Remove a local task, a no-op if it already completed.
         */
        void cancel_local(TaskKey key) noexcept;

        [[nodiscard]] Waker waker_for(TaskKey key) const;

        /**
         * Poll, once each, the local tasks that were ready when the call started. Returns the number polled.
         * A task that throws is removed and the exception propagates.
         */
        size_t poll_ready_tasks();

        /**
         * As above, but a task that throws is removed, recorded in ``failures`` and the remaining tasks are polled.
         */
        size_t poll_ready_tasks(std::vector<Error> &failures);

        [[nodiscard]] size_t task_count() const noexcept { return _tasks.size(); }

        [[nodiscard]] size_t ready_task_count() const { return _ready_queue->size(); }

        // Observers

        void add_observer(observer_ptr observer);

        [[nodiscard]] const std::vector<observer_ptr> &observers() const noexcept { return _observers; }

        void notify_before_pass(std::uint64_t pass) const;

        void notify_after_pass(std::uint64_t pass) const;

        void notify_before_compose(const ScopeState &scope) const;

        void notify_after_compose(const ScopeState &scope) const;

        void notify_skip_compose(const ScopeState &scope) const;

        void notify_mount(const ScopeState &scope) const;

        void notify_unmount(const ScopeState &scope) const noexcept;

        void notify_error(const ScopeState &scope, const Error &error) const;

    protected:
        void initialise() override;

        void start() override;

        void stop() override;

        void dispose() override;

    private:
        size_t apply_updates(std::vector<Error> *failures);

        size_t poll_tasks(std::vector<Error> *failures);

        Runtime(updater_ptr updater, std::vector<observer_ptr> observers);

        std::shared_ptr<UpdateQueue> _update_queue;
        std::shared_ptr<ReadyQueue> _ready_queue;
        std::shared_ptr<std::shared_mutex> _write_guard;
        updater_ptr _updater;
        std::vector<observer_ptr> _observers;

        bool _has_changes{false};
        TaskKey _next_task{1};
        ankerl::unordered_dense::map<TaskKey, TaskFn> _tasks;

        // Declared last so scopes are torn down while the rest of the runtime is still intact.
        ScopeArena _scopes;
    };

} // namespace recompose

#endif // RECOMPOSE_RUNTIME_RUNTIME_H
