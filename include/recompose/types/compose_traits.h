#ifndef RECOMPOSE_TYPES_COMPOSE_TRAITS_H
#define RECOMPOSE_TYPES_COMPOSE_TRAITS_H

#include <recompose/types/data.h>

#include <concepts>
#include <type_traits>

namespace recompose {

    /**
     * The terminal composable, a node whose compose returns Unit (or void) has no child.
     */
    struct Unit {
        friend constexpr bool operator==(Unit, Unit) noexcept { return true; }
    };

    inline constexpr Unit unit{};

    template<typename T>
    concept has_compose_member = requires(const T &me, ScopeState &cx) { me.compose(cx); };

    /**
     * Customisation point for the compose capability.
     *
     * The default covers types with a ``compose(ScopeState &) const`` member, the returned value is the single child.
     * Combinators specialise this with ``container = true`` and a ``drive`` function, they own and drive their
     * children directly rather than producing one.
     */
    template<typename T>
    struct compose_traits {
        static constexpr bool composable = false;
    };

    template<has_compose_member T>
    struct compose_traits<T> {
        static constexpr bool composable = true;
        static constexpr bool container = false;

        static decltype(auto) compose(const T &me, ScopeState &cx) { return me.compose(cx); }
    };

    template<>
    struct compose_traits<Unit> {
        static constexpr bool composable = true;
        static constexpr bool container = false;

        static void compose(const Unit &, ScopeState &) {}
    };

    template<typename T>
    concept Composable = Data<T> && compose_traits<T>::composable;

    template<typename T>
    inline constexpr bool is_container_v = compose_traits<T>::container;

    /**
     * The child type produced by a non-container composable, void is normalised to Unit.
     */
    template<typename T>
    using child_t = std::conditional_t<
        std::is_void_v<decltype(compose_traits<T>::compose(std::declval<const T &>(), std::declval<ScopeState &>()))>,
        Unit,
        std::remove_cvref_t<decltype(compose_traits<T>::compose(std::declval<const T &>(),
                                                                std::declval<ScopeState &>()))>>;

} // namespace recompose

#endif // RECOMPOSE_TYPES_COMPOSE_TRAITS_H
