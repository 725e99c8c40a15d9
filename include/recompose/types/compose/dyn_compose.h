#ifndef RECOMPOSE_TYPES_COMPOSE_DYN_COMPOSE_H
#define RECOMPOSE_TYPES_COMPOSE_DYN_COMPOSE_H

#include <recompose/types/any_compose.h>
#include <recompose/types/compose.h>
#include <recompose/types/hooks.h>

#include <tuple>
#include <type_traits>
#include <utility>

namespace recompose {

    /**
     * A composable whose concrete type is chosen at runtime.
     *
     * The supplied value is consumed the first time it is driven. A value with the same structural id as the one
     * mounted is exchanged in place (its scope and hooks survive), any other value replaces the mount, tearing the old
     * scope down first. When nothing new was supplied the current mount is driven again.
     */
    class DynCompose {
    public:
        using data_fields = std::tuple<AnyCompose>;

        DynCompose() = default;

        template<typename C>
            requires (!std::same_as<C, DynCompose> && Composable<C>)
        explicit DynCompose(C content) : _pending{std::move(content)} {}

        DynCompose(DynCompose &&) noexcept = default;

        DynCompose &operator=(DynCompose &&) noexcept = default;

        [[nodiscard]] bool has_pending() const noexcept { return _pending.has_value(); }

        [[nodiscard]] TypeId type() const noexcept { return _pending.type(); }

        /**
         * Removes the supplied value, leaving this empty.
         */
        [[nodiscard]] AnyCompose take() const noexcept { return std::move(_pending); }

    private:
        mutable AnyCompose _pending;
    };

    template<Composable C>
    DynCompose dyn_compose(C content) {
        return DynCompose{std::move(content)};
    }

    struct DynMount {
        AnyCompose compose;
        ScopeHandle scope;
    };

    template<>
    struct compose_traits<DynCompose> {
        static constexpr bool composable = true;
        static constexpr bool container = true;

        static void drive(const DynCompose &me, ScopeState &cx) {
            auto &mount = use_ref(cx, [] { return DynMount{}; });
            bool parent_changed = cx.is_parent_changed();
            if (me.has_pending()) {
                AnyCompose incoming = me.take();
                if (!mount.compose.reborrow(incoming)) {
                    mount.scope.reset();
                    mount.compose = std::move(incoming);
                    mount.scope = cx.create_child_scope();
                }
                parent_changed = true;
            }
            if (!mount.compose.has_value()) { return; }
            mount.scope->inherit_contexts(cx);
            mount.scope->set_parent_changed(parent_changed);
            mount.compose.drive(*mount.scope);
        }
    };

} // namespace recompose

#endif // RECOMPOSE_TYPES_COMPOSE_DYN_COMPOSE_H
