#ifndef RECOMPOSE_TYPES_HOOKS_H
#define RECOMPOSE_TYPES_HOOKS_H

#include <recompose/runtime/runtime.h>
#include <recompose/runtime/task.h>
#include <recompose/types/scope_state.h>
#include <recompose/util/errors.h>
#include <recompose/util/type_name.h>

#include <fmt/format.h>

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <utility>

/*
 * Hooks are the only way a compose body reaches persistent state. They are positional: a node must call the same
 * hooks, in the same order, every time it composes (no hooks inside conditions or loops whose trip count varies).
 */
namespace recompose {

    template<typename F>
    using hook_value_t = std::remove_cvref_t<std::invoke_result_t<F &>>;

    /**
     * A value created once by ``make`` on the first compose and returned unchanged on every later one.
     */
    template<typename F>
    hook_value_t<F> &use_ref(ScopeState &cx, F &&make) {
        return cx.use_hook<hook_value_t<F>>(std::forward<F>(make));
    }

    template<typename T>
    struct MutCell {
        T value;
        std::uint64_t generation{0};
    };

    /**
     * Handle to a use_mut slot.
     *
     * Reads (``get``, ``*``, ``->``, ``generation``) are for the driving thread. They look the slot up through the
     * runtime on every call and throw std::logic_error once the owning scope is gone. ``update`` and ``with`` may be
     * called from any thread, the mutation is deferred through the runtime and applied before the next drive. Both
     * become no-ops once the runtime or the owning scope is gone.
     */
    template<typename T>
    class Mut {
    public:
        using data_fields = std::tuple<std::weak_ptr<Runtime>, ScopeKey, size_t>;

        Mut(std::weak_ptr<Runtime> runtime, ScopeKey scope, size_t slot)
            : _runtime{std::move(runtime)}, _scope{scope}, _slot{slot} {}

        [[nodiscard]] const T &get() const { return cell().value; }

        const T &operator*() const { return cell().value; }

        const T *operator->() const { return &cell().value; }

        /**
         * Incremented by every applied ``update``, usable as a memo dependency.
         */
        [[nodiscard]] std::uint64_t generation() const { return cell().generation; }

        /**
         * False once the owning scope has been torn down (or the runtime has gone), reads would then throw.
         */
        [[nodiscard]] bool is_live() const noexcept { return find_cell() != nullptr; }

        /**
         * Mutate the value with ``f(T&)`` and mark the owning scope changed.
         */
        template<typename F>
        void update(F &&f) const {
            enqueue(std::forward<F>(f), true);
        }

        /**
         * Mutate the value with ``f(T&)`` without marking the owning scope changed.
         */
        template<typename F>
        void with(F &&f) const {
            enqueue(std::forward<F>(f), false);
        }

    private:
        MutCell<T> *find_cell() const noexcept {
            auto runtime = _runtime.lock();
            if (!runtime) { return nullptr; }
            auto *state = runtime->scopes().find(_scope);
            return state == nullptr ? nullptr : state->template hook_at<MutCell<T>>(_slot);
        }

        const MutCell<T> &cell() const {
            auto *cell = find_cell();
            if (cell == nullptr) { throw_error<std::logic_error>("Mut<{}> read after its scope was torn down", type_name<T>()); }
            return *cell;
        }

        template<typename F>
        void enqueue(F &&f, bool mark_changed) const {
            auto runtime = _runtime.lock();
            if (!runtime) { return; }
            runtime->update([weak = _runtime, scope = _scope, slot = _slot, f = std::forward<F>(f), mark_changed]() mutable {
                auto rt = weak.lock();
                if (!rt) { return; }
                auto *state = rt->scopes().find(scope);
                if (state == nullptr) { return; }
                auto *cell = state->hook_at<MutCell<T>>(slot);
                if (cell == nullptr) { return; }
                f(cell->value);
                if (mark_changed) {
                    ++cell->generation;
                    state->bump_generation();
                    state->set_changed();
                }
            });
        }

        std::weak_ptr<Runtime> _runtime;
        ScopeKey _scope;
        size_t _slot;
    };

    /**
     * Like use_ref, but the value is only mutated through the returned handle, via the update queue.
     */
    template<typename F>
    Mut<hook_value_t<F>> use_mut(ScopeState &cx, F &&make) {
        using T = hook_value_t<F>;
        cx.use_hook<MutCell<T>>([&make] { return MutCell<T>{std::forward<F>(make)(), 0}; });
        return Mut<T>{cx.runtime().weak_from_this(), cx.key(), cx.last_hook_index()};
    }

    /**
     * The nearest ancestor provided value of type T.
     */
    template<typename T>
    std::expected<std::shared_ptr<T>, ContextError> use_context(const ScopeState &cx) {
        if (auto value = cx.find_context<T>()) { return value; }
        return std::unexpected(ContextError{fmt::format("Context value not found for type: {}", type_name<T>())});
    }

    /**
     * Provide a value, created once by ``make``, to every descendant. A nearer provider of the same type shadows
     * this one.
     */
    template<typename F>
    hook_value_t<F> &use_provider(ScopeState &cx, F &&make) {
        using T = hook_value_t<F>;
        auto &value = use_ref(cx, [&make] { return std::make_shared<T>(std::forward<F>(make)()); });
        cx.provide_context(std::type_index{typeid(T)}, value);
        return *value;
    }

    template<typename D, typename T>
    struct MemoCell {
        D dependency;
        std::optional<T> value;
    };

    /**
     * A value recomputed by ``make`` only when ``dependency`` no longer compares equal to the one it was computed
     * from.
     */
    template<typename D, typename F>
    const hook_value_t<F> &use_memo(ScopeState &cx, D dependency, F &&make) {
        using T = hook_value_t<F>;
        bool created = false;
        auto &cell = cx.use_hook<MemoCell<D, T>>([&] {
            created = true;
            return MemoCell<D, T>{dependency, std::optional<T>{make()}};
        });
        if (!created && !(cell.dependency == dependency)) {
            cell.value.emplace(make());
            cell.dependency = std::move(dependency);
        }
        return *cell.value;
    }

    /**
     * Run ``f`` once, when this scope is torn down. The callback supplied on the latest compose is the one run.
     */
    template<typename F>
    void use_drop(ScopeState &cx, F &&f) {
        bool created = false;
        auto &drop = cx.use_hook<DropCallback>([&created] {
            created = true;
            return DropCallback{};
        });
        if (created) { cx.register_drop(cx.last_hook_index()); }
        drop.fn = std::forward<F>(f);
    }

    template<typename Sig>
    class Callback;

    /**
     * A callable handle whose identity never changes while the function it forwards to is replaced every compose.
     * Equality is identity.
     */
    template<typename R, typename... Args>
    class Callback<R(Args...)> {
    public:
        using data_fields = std::tuple<std::shared_ptr<std::function<R(Args...)>>>;

        Callback() = default;

        explicit Callback(std::shared_ptr<std::function<R(Args...)>> target) : _target{std::move(target)} {}

        R operator()(Args... args) const { return (*_target)(std::forward<Args>(args)...); }

        explicit operator bool() const noexcept { return _target && *_target; }

        friend bool operator==(const Callback &a, const Callback &b) noexcept { return a._target == b._target; }

    private:
        std::shared_ptr<std::function<R(Args...)>> _target;
    };

    template<typename Sig, typename F>
    Callback<Sig> use_callback(ScopeState &cx, F &&f) {
        auto &target = use_ref(cx, [] { return std::make_shared<std::function<Sig>>(); });
        *target = std::forward<F>(f);
        return Callback<Sig>{target};
    }

    /**
     * Register a task, built once by ``make``, that is polled on the driving thread at the start of a pass whenever
     * its waker fired. It is removed when it completes or when this scope is torn down.
     */
    template<typename F>
    void use_local_task(ScopeState &cx, F &&make) {
        Runtime &runtime = cx.runtime();
        const TaskKey key = use_ref(cx, [&] { return runtime.spawn_local(TaskFn{std::forward<F>(make)()}); });
        use_drop(cx, [weak = runtime.weak_from_this(), key] {
            if (auto rt = weak.lock()) { rt->cancel_local(key); }
        });
    }

    /**
     * Spawn a task, built once by ``make``, on the executor provided through ExecutorContext. Each poll holds the
     * write guard shared. Once this scope is torn down the task reports completion on its next poll without running.
     */
    template<typename F>
    void use_task(ScopeState &cx, F &&make) {
        auto &alive = use_ref(cx, [&] {
            auto context = use_context<ExecutorContext>(cx);
            if (!context) { throw context.error(); }
            if (!(*context)->executor) { throw_error<std::invalid_argument>("ExecutorContext holds no executor"); }
            auto flag = std::make_shared<std::atomic_bool>(true);
            (*context)->executor->spawn(
                [flag, guard = cx.runtime().write_guard(), task = TaskFn{std::forward<F>(make)()}](const Waker &waker) {
                    if (!flag->load()) { return TaskStatus::READY; }
                    std::shared_lock lock{*guard};
                    return task(waker);
                });
            return flag;
        });
        use_drop(cx, [flag = alive] { flag->store(false); });
    }

} // namespace recompose

#endif // RECOMPOSE_TYPES_HOOKS_H
