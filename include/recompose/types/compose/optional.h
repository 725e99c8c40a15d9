#ifndef RECOMPOSE_TYPES_COMPOSE_OPTIONAL_H
#define RECOMPOSE_TYPES_COMPOSE_OPTIONAL_H

#include <recompose/types/compose.h>
#include <recompose/types/hooks.h>

#include <optional>

namespace recompose {

    /**
     * Zero or one child. Becoming empty tears the child down, the next value mounts a fresh scope.
     */
    template<Composable C>
    struct compose_traits<std::optional<C>> {
        static constexpr bool composable = true;
        static constexpr bool container = true;

        static void drive(const std::optional<C> &me, ScopeState &cx) {
            auto &scope = use_ref(cx, [] { return ScopeHandle{}; });
            if (!me) {
                scope.reset();
                return;
            }
            if (!scope) { scope = cx.create_child_scope(); }
            drive_element(*me, cx, *scope, cx.is_parent_changed());
        }
    };

} // namespace recompose

#endif // RECOMPOSE_TYPES_COMPOSE_OPTIONAL_H
