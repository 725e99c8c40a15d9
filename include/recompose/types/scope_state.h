#ifndef RECOMPOSE_TYPES_SCOPE_STATE_H
#define RECOMPOSE_TYPES_SCOPE_STATE_H

#include <recompose/recompose_export.h>
#include <recompose/types/any_compose.h>
#include <recompose/util/errors.h>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace recompose {

    /**
     * Owns one scope in the runtime's arena, destroying the handle tears the scope (and everything below it) down.
     */
    class RECOMPOSE_EXPORT ScopeHandle {
    public:
        ScopeHandle() noexcept = default;

        ScopeHandle(ScopeArena &arena, ScopeKey key, ScopeState *state) noexcept;

        ScopeHandle(ScopeHandle &&other) noexcept;

        ScopeHandle &operator=(ScopeHandle &&other) noexcept;

        ScopeHandle(const ScopeHandle &) = delete;

        ScopeHandle &operator=(const ScopeHandle &) = delete;

        ~ScopeHandle();

        void reset() noexcept;

        explicit operator bool() const noexcept { return _state != nullptr; }

        [[nodiscard]] ScopeKey key() const noexcept { return _key; }

        [[nodiscard]] ScopeState *get() const noexcept { return _state; }

        ScopeState &operator*() const noexcept { return *_state; }

        ScopeState *operator->() const noexcept { return _state; }

    private:
        ScopeArena *_arena{nullptr};
        ScopeKey _key{NO_SCOPE};
        ScopeState *_state{nullptr};
    };

    struct HookSlot {
        virtual ~HookSlot() = default;

        [[nodiscard]] virtual TypeId type() const noexcept = 0;
    };

    template<typename T>
    struct TypedHookSlot final : HookSlot {
        template<typename F>
        explicit TypedHookSlot(F &&make) : value(std::forward<F>(make)()) {}

        [[nodiscard]] TypeId type() const noexcept override { return type_id_of<T>(); }

        T value;
    };

    /**
     * Backing slot of use_drop, the latest callback supplied is the one run at teardown.
     */
    struct DropCallback {
        std::function<void()> fn;
    };

    using ContextMap = ankerl::unordered_dense::map<std::type_index, std::shared_ptr<void>>;

    /**
     * The persistent state of one node position in the tree.
     *
     * Hooks are positional: a node must request the same hook types, in the same order, every time it composes.
     * A violation is detected and reported as HookOrderError.
     *
     * The inherited context map is refreshed from the parent whenever the parent composes, the provided map holds
     * values this node makes visible to its descendants.
     */
    class RECOMPOSE_EXPORT ScopeState {
    public:
        struct ChildSlot {
            AnyCompose compose;
            ScopeHandle scope;
        };

        ScopeState(Runtime &runtime, ScopeKey key, ScopeKey parent);

        ScopeState(const ScopeState &) = delete;

        ScopeState &operator=(const ScopeState &) = delete;

        ~ScopeState();

        [[nodiscard]] ScopeKey key() const noexcept { return _key; }

        [[nodiscard]] ScopeKey parent() const noexcept { return _parent; }

        [[nodiscard]] Runtime &runtime() const noexcept { return _runtime; }

        [[nodiscard]] const std::string &name() const noexcept { return _name; }

        void set_name(std::string_view name) { _name = name; }

        /**
         * Request this node recomposes on the next pass, the runtime then reports pending work.
         */
        void set_changed() noexcept;

        [[nodiscard]] bool is_changed() const noexcept { return _changed; }

        /**
         * Read and clear the changed flag.
         */
        bool take_changed() noexcept { return std::exchange(_changed, false); }

        [[nodiscard]] bool is_parent_changed() const noexcept { return _parent_changed; }

        void set_parent_changed(bool changed) noexcept { _parent_changed = changed; }

        [[nodiscard]] bool is_container() const noexcept { return _container; }

        void set_container(bool container) noexcept { _container = container; }

        [[nodiscard]] bool is_empty() const noexcept { return _empty; }

        void set_empty(bool empty) noexcept { _empty = empty; }

        [[nodiscard]] bool has_composed() const noexcept { return _composed; }

        [[nodiscard]] std::uint64_t generation() const noexcept { return _generation; }

        void bump_generation() noexcept { ++_generation; }

        // Hooks

        /**
         * The hook at the cursor, created with ``make()`` the first time this position is reached.
         */
        template<typename T, typename F>
        T &use_hook(F &&make) {
            const size_t index = _hook_cursor++;
            if (index < _hooks.size()) {
                HookSlot &slot = *_hooks[index];
                if (!(slot.type() == type_id_of<T>())) {
                    throw_error<HookOrderError>("Hook {} of '{}' holds '{}' but '{}' was requested", index, _name,
                                                slot.type().name(), type_name<T>());
                }
                return static_cast<TypedHookSlot<T> &>(slot).value;
            }
            if (_hooks_sealed) {
                throw_error<HookOrderError>("'{}' called more hooks than on its first compose ({})", _name,
                                            _hooks.size());
            }
            auto &slot = _hooks.emplace_back(std::make_unique<TypedHookSlot<T>>(std::forward<F>(make)));
            return static_cast<TypedHookSlot<T> &>(*slot).value;
        }

        /**
         * Direct access to an existing hook, used by deferred updates that captured the slot index.
         */
        template<typename T>
        T *hook_at(size_t index) noexcept {
            if (index >= _hooks.size() || !(_hooks[index]->type() == type_id_of<T>())) { return nullptr; }
            return &static_cast<TypedHookSlot<T> &>(*_hooks[index]).value;
        }

        /**
         * Index of the hook most recently returned by use_hook.
         */
        [[nodiscard]] size_t last_hook_index() const noexcept { return _hook_cursor - 1; }

        [[nodiscard]] size_t hook_count() const noexcept { return _hooks.size(); }

        void begin_compose() noexcept { _hook_cursor = 0; }

        /**
         * Completes a compose, verifying the hook count matches the first completed compose.
         */
        void end_compose();

        /**
         * The compose body raised, the node will compose again on the next pass.
         */
        void abandon_compose() noexcept { _composed = false; }

        void register_drop(size_t hook_index) { _drop_slots.push_back(hook_index); }

        // Contexts

        template<typename T>
        [[nodiscard]] std::shared_ptr<T> find_context() const {
            auto it = _contexts.find(std::type_index{typeid(T)});
            if (it == _contexts.end()) { return nullptr; }
            return std::static_pointer_cast<T>(it->second);
        }

        void provide_context(std::type_index type, std::shared_ptr<void> value);

        /**
         * Make ``value`` visible to this scope (used to seed the root).
         */
        void seed_context(std::type_index type, std::shared_ptr<void> value);

        /**
         * Replace the inherited map with the parent's inherited values overlaid by what the parent provides.
         */
        void inherit_contexts(const ScopeState &parent);

        [[nodiscard]] const ContextMap &contexts() const noexcept { return _contexts; }

        [[nodiscard]] const ContextMap &provided_contexts() const noexcept { return _provided; }

        // Child slot and children

        [[nodiscard]] bool has_child() const noexcept { return _child.has_value(); }

        [[nodiscard]] ChildSlot &child() { return *_child; }

        /**
         * Install ``compose`` as this node's child, reborrowing into the current child when the structural ids match
         * and otherwise tearing the current child down and mounting a fresh scope.
         * Returns true when the existing child scope was preserved.
         */
        bool mount_child(AnyCompose compose);

        void clear_child() noexcept { _child.reset(); }

        /**
         * Create a scope owned by this node (held by a combinator hook or the child slot).
         */
        [[nodiscard]] ScopeHandle create_child_scope();

        /**
         * Keys of live scopes created by this node, in creation order.
         */
        [[nodiscard]] const std::vector<ScopeKey> &children() const noexcept { return _children; }

    private:
        friend class ScopeArena;

        template<typename C>
        friend void drive_node(const C &me, ScopeState &cx);

        void run_drops() noexcept;

        Runtime &_runtime;
        ScopeKey _key;
        ScopeKey _parent;
        std::string _name;

        bool _changed{false};
        bool _parent_changed{false};
        bool _container{false};
        bool _empty{false};
        bool _composed{false};
        bool _hooks_sealed{false};
        std::uint64_t _generation{0};

        std::vector<std::unique_ptr<HookSlot>> _hooks;
        size_t _hook_cursor{0};
        std::vector<size_t> _drop_slots;

        ContextMap _contexts;
        ContextMap _provided;

        std::vector<ScopeKey> _children;
        std::optional<ChildSlot> _child;
    };

} // namespace recompose

#endif // RECOMPOSE_TYPES_SCOPE_STATE_H
