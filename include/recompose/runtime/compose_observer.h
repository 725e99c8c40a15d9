#ifndef RECOMPOSE_RUNTIME_COMPOSE_OBSERVER_H
#define RECOMPOSE_RUNTIME_COMPOSE_OBSERVER_H

#include <recompose/recompose_export.h>
#include <recompose/recompose_forward_declarations.h>

#include <cstdint>

namespace recompose {

    /**
     * Receives notifications as the composer walks the tree. All calls are made on the driving thread.
     */
    struct RECOMPOSE_EXPORT ComposeLifeCycleObserver {
        virtual ~ComposeLifeCycleObserver() = default;

        virtual void on_before_pass(std::uint64_t pass) {}

        virtual void on_after_pass(std::uint64_t pass) {}

        /**
         * A node is about to run its compose body (or, for a container, drive its elements).
         */
        virtual void on_before_compose(const ScopeState &scope) {}

        virtual void on_after_compose(const ScopeState &scope) {}

        /**
         * Neither the node nor its ancestors changed, the body was not run.
         */
        virtual void on_skip_compose(const ScopeState &scope) {}

        /**
         * First drive of a newly created scope.
         */
        virtual void on_mount(const ScopeState &scope) {}

        virtual void on_unmount(const ScopeState &scope) {}

        virtual void on_error(const ScopeState &scope, const Error &error) {}
    };

} // namespace recompose

#endif // RECOMPOSE_RUNTIME_COMPOSE_OBSERVER_H
