#ifndef RECOMPOSE_RUNTIME_TASK_H
#define RECOMPOSE_RUNTIME_TASK_H

#include <recompose/recompose_export.h>
#include <recompose/recompose_forward_declarations.h>

#include <cstdint>
#include <functional>
#include <memory>

namespace recompose {

    enum class TaskStatus : std::uint8_t { PENDING, READY };

    /**
     * Signals that a task can make progress and should be polled again. Copyable and safe to use from any thread.
     */
    class RECOMPOSE_EXPORT Waker {
    public:
        Waker() = default;

        explicit Waker(std::function<void()> wake);

        void wake() const;

        explicit operator bool() const noexcept { return static_cast<bool>(_wake); }

    private:
        std::shared_ptr<const std::function<void()>> _wake;
    };

    /**
     * One poll of an asynchronous unit of work. Returning PENDING means the task has arranged for the waker to be
     * called once it can progress, READY means it has completed and will not be polled again.
     */
    using TaskFn = std::function<TaskStatus(const Waker &)>;

    /**
     * The executor boundary used by use_task. Spawn must not poll the task synchronously, the first poll happens on
     * the executor's own schedule.
     */
    struct RECOMPOSE_EXPORT Executor {
        virtual ~Executor() = default;

        virtual void spawn(TaskFn task) = 0;
    };

    /**
     * Context entry through which use_task finds its executor.
     */
    struct ExecutorContext {
        executor_ptr executor;
    };

} // namespace recompose

#endif // RECOMPOSE_RUNTIME_TASK_H
