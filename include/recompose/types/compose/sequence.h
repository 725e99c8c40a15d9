#ifndef RECOMPOSE_TYPES_COMPOSE_SEQUENCE_H
#define RECOMPOSE_TYPES_COMPOSE_SEQUENCE_H

#include <recompose/types/compose.h>
#include <recompose/types/hooks.h>

#include <array>
#include <tuple>
#include <utility>
#include <vector>

namespace recompose {

    /**
     * A fixed arity sequence, each element owns a scope keyed by its position.
     */
    template<typename... Cs>
        requires (Composable<Cs> && ...)
    struct compose_traits<std::tuple<Cs...>> {
        static constexpr bool composable = true;
        static constexpr bool container = true;

        static void drive(const std::tuple<Cs...> &me, ScopeState &cx) {
            auto &scopes = use_ref(cx, [&cx] {
                std::array<ScopeHandle, sizeof...(Cs)> handles;
                for (auto &handle : handles) { handle = cx.create_child_scope(); }
                return handles;
            });
            const bool parent_changed = cx.is_parent_changed();
            [&]<size_t... I>(std::index_sequence<I...>) {
                (drive_element(std::get<I>(me), cx, *scopes[I], parent_changed), ...);
            }(std::index_sequence_for<Cs...>{});
        }
    };

    /**
     * A runtime sized sequence. Entries are addressed by position, growing mounts fresh scopes at the tail and
     * shrinking tears the tail down.
     */
    template<Composable C, typename Alloc>
    struct compose_traits<std::vector<C, Alloc>> {
        static constexpr bool composable = true;
        static constexpr bool container = true;

        static void drive(const std::vector<C, Alloc> &me, ScopeState &cx) {
            auto &scopes = use_ref(cx, [] { return std::vector<ScopeHandle>{}; });
            while (scopes.size() > me.size()) { scopes.pop_back(); }
            while (scopes.size() < me.size()) { scopes.push_back(cx.create_child_scope()); }
            const bool parent_changed = cx.is_parent_changed();
            for (size_t i = 0; i < me.size(); ++i) { drive_element(me[i], cx, *scopes[i], parent_changed); }
        }
    };

} // namespace recompose

#endif // RECOMPOSE_TYPES_COMPOSE_SEQUENCE_H
