#ifndef RECOMPOSE_TYPES_COMPOSE_MEMO_H
#define RECOMPOSE_TYPES_COMPOSE_MEMO_H

#include <recompose/types/compose.h>
#include <recompose/types/hooks.h>

#include <concepts>
#include <optional>
#include <tuple>

namespace recompose {

    /**
     * Shields ``content`` from its ancestors recomposing: the content is only forced to run when ``dependency``
     * changes. The content still recomposes on its own when it marks itself changed.
     */
    template<std::equality_comparable D, Composable C>
        requires std::copy_constructible<D>
    struct Memo {
        using data_fields = std::tuple<D, C>;

        D dependency;
        C content;
    };

    template<std::equality_comparable D, Composable C>
        requires std::copy_constructible<D>
    Memo<D, C> memo(D dependency, C content) {
        return Memo<D, C>{std::move(dependency), std::move(content)};
    }

    template<typename D>
    struct MemoState {
        std::optional<D> last;
        ScopeHandle scope;
    };

    template<std::equality_comparable D, Composable C>
        requires std::copy_constructible<D>
    struct compose_traits<Memo<D, C>> {
        static constexpr bool composable = true;
        static constexpr bool container = true;

        static void drive(const Memo<D, C> &me, ScopeState &cx) {
            auto &state = use_ref(cx, [&cx] { return MemoState<D>{std::nullopt, cx.create_child_scope()}; });
            bool force = false;
            if (!state.last || !(*state.last == me.dependency)) {
                state.last.emplace(me.dependency);
                force = true;
            }
            drive_element(me.content, cx, *state.scope, force);
        }
    };

} // namespace recompose

#endif // RECOMPOSE_TYPES_COMPOSE_MEMO_H
