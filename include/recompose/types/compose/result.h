#ifndef RECOMPOSE_TYPES_COMPOSE_RESULT_H
#define RECOMPOSE_TYPES_COMPOSE_RESULT_H

#include <recompose/types/compose.h>
#include <recompose/types/error.h>
#include <recompose/types/hooks.h>

#include <expected>
#include <functional>
#include <tuple>

namespace recompose {

    /**
     * A fallible composable, the error is reported to the nearest ancestor catch context.
     */
    template<typename C>
    using Result = std::expected<C, Error>;

    template<Composable C>
    struct compose_traits<std::expected<C, Error>> {
        static constexpr bool composable = true;
        static constexpr bool container = true;

        static void drive(const std::expected<C, Error> &me, ScopeState &cx) {
            const bool runs = cx.is_parent_changed() || !cx.has_composed();
            auto &scope = use_ref(cx, [] { return ScopeHandle{}; });
            if (!me) {
                scope.reset();
                // Reported once per value, a failure carried over unchanged from the previous pass is not repeated.
                if (runs) { report_error(cx, me.error()); }
                return;
            }
            if (!scope) { scope = cx.create_child_scope(); }
            drive_element(*me, cx, *scope, cx.is_parent_changed());
        }
    };

    /**
     * Intercepts errors reported anywhere below ``content``, until a nearer catch is encountered.
     */
    template<Composable C>
    struct Catch {
        // on_error is checked where it is built, in catch_errors.
        using data_fields = std::tuple<C>;

        std::function<void(const Error &)> on_error;
        C content;
    };

    template<typename F, Composable C>
    Catch<C> catch_errors(F on_error, C content) {
        static_assert(Data<F>, "catch_errors expects a captureless handler, bind state with data_fn");
        return Catch<C>{std::function<void(const Error &)>{std::move(on_error)}, std::move(content)};
    }

    template<Composable C>
    struct compose_traits<Catch<C>> {
        static constexpr bool composable = true;
        static constexpr bool container = true;

        static void drive(const Catch<C> &me, ScopeState &cx) {
            auto &context = use_provider(cx, [] { return CatchContext{}; });
            context.on_error = me.on_error;
            auto &scope = use_ref(cx, [&cx] { return cx.create_child_scope(); });
            drive_element(me.content, cx, *scope, cx.is_parent_changed());
        }
    };

} // namespace recompose

#endif // RECOMPOSE_TYPES_COMPOSE_RESULT_H
