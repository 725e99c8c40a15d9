#ifndef RECOMPOSE_LIFECYCLE_H
#define RECOMPOSE_LIFECYCLE_H

#include <recompose/recompose_export.h>

namespace recompose {
    struct ComponentLifeCycle;

    void RECOMPOSE_EXPORT initialise_component(ComponentLifeCycle &component);

    void RECOMPOSE_EXPORT start_component(ComponentLifeCycle &component);

    void RECOMPOSE_EXPORT stop_component(ComponentLifeCycle &component);

    void RECOMPOSE_EXPORT dispose_component(ComponentLifeCycle &component);

    struct TransitionGuard;

    /**
     * Stops and disposes a component that has been initialised and started, never throwing.
     * Failures are reported to stderr, this is intended for destructors of owning objects.
     */
    void RECOMPOSE_EXPORT stop_and_dispose_noexcept(ComponentLifeCycle &component) noexcept;

    /**
     * The Life-cycle and associated method calls are as follows:
     *
     * * The component is constructed, additional properties may be set after this.
     *
     * * initialise is called once, before any other life-cycle call.
     *
     * * start is called prior to normal operation, stop once normal operation is expected to cease.
     *   Start and stop may be called numerous times, the component must be able to start again cleanly
     *   after stop. Stop is not dispose.
     *
     * * dispose is called once the component is no longer required, full clean-up happens here.
     */
    struct RECOMPOSE_EXPORT ComponentLifeCycle {
        virtual ~ComponentLifeCycle() = default;

        /**
         * The componented is started (true) or stopped (false).
         * By default, this is stopped.
         */
        [[nodiscard]] bool is_started() const;

        [[nodiscard]] bool is_starting() const;

        [[nodiscard]] bool is_stopping() const;

    protected:
        virtual void initialise() = 0;

        virtual void start() = 0;

        virtual void stop() = 0;

        virtual void dispose() = 0;

    private:
        bool _started{false};
        bool _transitioning{false};

        friend TransitionGuard;

        friend void initialise_component(ComponentLifeCycle &component);

        friend void start_component(ComponentLifeCycle &component);

        friend void stop_component(ComponentLifeCycle &component);

        friend void dispose_component(ComponentLifeCycle &component);
    };
} // namespace recompose

#endif // RECOMPOSE_LIFECYCLE_H
