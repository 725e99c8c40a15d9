#ifndef RECOMPOSE_FORWARD_DECLARATIONS_H
#define RECOMPOSE_FORWARD_DECLARATIONS_H

#include <cstdint>
#include <memory>

namespace recompose {
    using ScopeKey = std::uint64_t;
    using TaskKey = std::uint64_t;

    inline constexpr ScopeKey NO_SCOPE = 0;

    struct TypeId;
    class AnyCompose;
    class ScopeState;
    class ScopeHandle;
    class ScopeArena;

    struct Unit;
    class Error;
    struct CatchContext;

    class Update;
    struct Updater;
    class QueuedUpdater;
    class Waker;
    struct Executor;
    struct ExecutorContext;

    class Runtime;
    class Composer;
    struct ComposerConfig;
    struct ComposeLifeCycleObserver;

    using updater_ptr = std::shared_ptr<Updater>;
    using executor_ptr = std::shared_ptr<Executor>;
    using observer_ptr = std::shared_ptr<ComposeLifeCycleObserver>;
} // namespace recompose

#endif // RECOMPOSE_FORWARD_DECLARATIONS_H
