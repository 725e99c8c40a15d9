#ifndef RECOMPOSE_TYPES_COMPOSE_H
#define RECOMPOSE_TYPES_COMPOSE_H

#include <recompose/runtime/runtime.h>
#include <recompose/types/any_compose.h>
#include <recompose/types/compose_traits.h>
#include <recompose/types/error.h>
#include <recompose/types/scope_state.h>

#include <exception>
#include <optional>
#include <type_traits>

namespace recompose {

    namespace detail {
        template<typename C>
        void compose_and_mount(const C &me, ScopeState &cx) {
            using Child = child_t<C>;
            static_assert(Composable<Child>,
                          "The child returned by compose must be composable and must not hold pass scoped references");

            Runtime &runtime = cx.runtime();
            runtime.notify_before_compose(cx);
            std::optional<Child> child;
            try {
                if constexpr (std::is_void_v<decltype(compose_traits<C>::compose(me, cx))>) {
                    compose_traits<C>::compose(me, cx);
                    child.emplace();
                } else {
                    child.emplace(compose_traits<C>::compose(me, cx));
                }
                cx.end_compose();
            } catch (const HookOrderError &) {
                throw;
            } catch (const std::exception &) {
                // The failing subtree is dropped so the next pass rebuilds it.
                cx.abandon_compose();
                cx.clear_child();
                runtime.notify_after_compose(cx);
                report_error(cx, Error::current());
                return;
            }
            runtime.notify_after_compose(cx);

            if constexpr (std::is_same_v<Child, Unit>) {
                cx.set_empty(true);
                cx.clear_child();
            } else {
                cx.set_empty(false);
                cx.mount_child(AnyCompose{std::move(*child)});
                auto &scope = *cx.child().scope;
                scope.inherit_contexts(cx);
                scope.set_parent_changed(true);
            }
        }
    } // namespace detail

    /**
     * Drive one node against its scope.
     *
     * A container always drives its elements, an exception raised while it does is reported like one raised by a
     * compose body. Any other node runs its compose body when it has not yet completed a
     * compose, when it marked itself changed (the flag is cleared here) or when its parent ran. A node that skips still
     * drives its mounted child, with the child's parent changed flag cleared, so a descendant that marked itself
     * changed recomposes without its ancestors doing so.
     */
    template<typename C>
    void drive_node(const C &me, ScopeState &cx) {
        static_assert(Composable<C>, "Composable fields must not hold pass scoped references");
        Runtime &runtime = cx.runtime();
        if (cx._name.empty()) {
            cx._name = compose_name<C>();
            runtime.notify_mount(cx);
        }
        cx.begin_compose();

        if constexpr (is_container_v<C>) {
            cx._container = true;
            runtime.notify_before_compose(cx);
            try {
                compose_traits<C>::drive(me, cx);
                cx.end_compose();
            } catch (const HookOrderError &) {
                throw;
            } catch (const std::exception &) {
                // Elements already in place are kept, the container runs again on the next pass.
                cx.abandon_compose();
                runtime.notify_after_compose(cx);
                report_error(cx, Error::current());
                return;
            }
            runtime.notify_after_compose(cx);
        } else {
            const bool changed = cx.take_changed();
            if (changed || !cx._composed || cx._parent_changed) {
                detail::compose_and_mount(me, cx);
            } else {
                runtime.notify_skip_compose(cx);
                if (cx._child) { cx._child->scope->set_parent_changed(false); }
            }
            if (cx._child) { cx._child->compose.drive(*cx._child->scope); }
        }
    }

    /**
     * Drive an element owned in place by a container, in its dedicated scope.
     */
    template<typename C>
    void drive_element(const C &element, const ScopeState &parent, ScopeState &scope, bool parent_changed) {
        scope.inherit_contexts(parent);
        scope.set_parent_changed(parent_changed);
        drive_node(element, scope);
    }

} // namespace recompose

#endif // RECOMPOSE_TYPES_COMPOSE_H
