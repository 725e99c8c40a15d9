#ifndef RECOMPOSE_TYPES_COMPOSE_FROM_FN_H
#define RECOMPOSE_TYPES_COMPOSE_FROM_FN_H

#include <recompose/types/data.h>
#include <recompose/types/scope_state.h>

#include <functional>
#include <tuple>
#include <type_traits>

namespace recompose {

    /**
     * A composable whose body is ``f(ScopeState &)``.
     */
    template<typename F>
        requires std::invocable<const F &, ScopeState &>
    struct FromFn {
        using data_fields = std::tuple<F>;

        F f;

        auto compose(ScopeState &cx) const { return std::invoke(f, cx); }
    };

    /**
     * ``f`` must be captureless, state it needs is passed as ``captures`` and handed to it ahead of the scope:
     * ``from_fn([](const Label &label, ScopeState &cx) { ... }, label)``.
     */
    template<typename F, typename... Captures>
    auto from_fn(F &&f, Captures &&...captures) {
        if constexpr (sizeof...(Captures) == 0) {
            static_assert(Data<std::decay_t<F>>, "from_fn expects a captureless closure, pass state as captures");
            return FromFn<std::decay_t<F>>{std::forward<F>(f)};
        } else {
            auto bound = data_fn(std::forward<F>(f), std::forward<Captures>(captures)...);
            return FromFn<decltype(bound)>{std::move(bound)};
        }
    }

} // namespace recompose

#endif // RECOMPOSE_TYPES_COMPOSE_FROM_FN_H
