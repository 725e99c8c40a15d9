#ifndef RECOMPOSE_TYPES_DATA_H
#define RECOMPOSE_TYPES_DATA_H

#include <recompose/recompose_forward_declarations.h>

#include <array>
#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace recompose {

    /**
     * True for values whose validity is bounded by the current pass: references, object pointers and non-owning views.
     * Such values must never be stored in a composable, since composables are kept in long lived node slots.
     * Specialise this for your own view types.
     */
    template<typename T>
    struct is_pass_scoped
        : std::bool_constant<std::is_reference_v<T> ||
                             (std::is_pointer_v<T> && !std::is_function_v<std::remove_pointer_t<T>>)> {};

    template<typename CharT, typename Traits>
    struct is_pass_scoped<std::basic_string_view<CharT, Traits>> : std::true_type {};

    template<typename T, std::size_t Extent>
    struct is_pass_scoped<std::span<T, Extent>> : std::true_type {};

    template<typename T>
    struct is_pass_scoped<std::reference_wrapper<T>> : std::true_type {};

    template<typename T>
    inline constexpr bool is_pass_scoped_v = is_pass_scoped<T>::value;

    template<typename T>
    struct is_data;

    template<typename T>
    inline constexpr bool is_data_v = is_data<std::remove_cv_t<T>>::value;

    template<typename T>
    concept has_data_fields = requires { typename T::data_fields; };

    namespace detail {
        template<typename Tuple>
        struct fields_are_data;

        template<typename... Fs>
        struct fields_are_data<std::tuple<Fs...>> : std::bool_constant<(is_data_v<Fs> && ...)> {};

        template<typename T>
        constexpr bool compute_is_data() {
            if constexpr (is_pass_scoped_v<T>) {
                return false;
            } else if constexpr (has_data_fields<T>) {
                return fields_are_data<typename T::data_fields>::value;
            } else if constexpr (std::is_class_v<T> || std::is_union_v<T>) {
                return std::is_empty_v<T>;
            } else {
                return std::is_scalar_v<T>;
            }
        }
    } // namespace detail

    /**
     * The data-safety marker.
     *
     * Scalars are data unless pass scoped. A class is data only when it holds nothing (a captureless closure, a tag)
     * or declares ``using data_fields = std::tuple<...>`` naming the type of every field it holds, in which case it
     * is data when each of them is. Owning standard types are specialised below, anything else (including closures
     * with captures) must opt in by declaring its fields or specialising is_data.
     */
    template<typename T>
    struct is_data : std::bool_constant<detail::compute_is_data<T>()> {};

    template<typename CharT, typename Traits, typename Alloc>
    struct is_data<std::basic_string<CharT, Traits, Alloc>> : std::true_type {};

    template<typename T, std::size_t N>
    struct is_data<std::array<T, N>> : std::bool_constant<is_data_v<T>> {};

    template<typename... Ts>
    struct is_data<std::tuple<Ts...>> : std::bool_constant<(is_data_v<Ts> && ...)> {};

    template<typename A, typename B>
    struct is_data<std::pair<A, B>> : std::bool_constant<is_data_v<A> && is_data_v<B>> {};

    template<typename T>
    struct is_data<std::optional<T>> : std::bool_constant<is_data_v<T>> {};

    template<typename... Ts>
    struct is_data<std::variant<Ts...>> : std::bool_constant<(is_data_v<Ts> && ...)> {};

    template<>
    struct is_data<std::monostate> : std::true_type {};

    template<typename T, typename Alloc>
    struct is_data<std::vector<T, Alloc>> : std::bool_constant<is_data_v<T>> {};

    template<typename T>
    struct is_data<std::shared_ptr<T>> : std::bool_constant<!is_pass_scoped_v<std::remove_cv_t<T>>> {};

    template<typename T>
    struct is_data<std::weak_ptr<T>> : std::bool_constant<!is_pass_scoped_v<std::remove_cv_t<T>>> {};

    template<typename T, typename D>
    struct is_data<std::unique_ptr<T, D>> : std::bool_constant<is_data_v<std::remove_cv_t<T>>> {};

    template<>
    struct is_data<std::exception_ptr> : std::true_type {};

    template<typename T, typename E>
    struct is_data<std::expected<T, E>> : std::bool_constant<is_data_v<T> && is_data_v<E>> {};

    template<typename T>
    concept Data = std::is_object_v<T> && std::move_constructible<T> && is_data_v<T>;

    /**
     * A captureless callable bound to data captures, ``f(captures..., args...)``. This is how a closure that needs
     * state is kept in a composable: the captures are checked like any other field.
     */
    template<typename F, typename... Captures>
    struct DataFn {
        static_assert(std::is_empty_v<F>, "data_fn expects a captureless callable, pass state as captures");

        using data_fields = std::tuple<Captures...>;

        F f;
        std::tuple<Captures...> captures;

        template<typename... Args>
        decltype(auto) operator()(Args &&...args) const {
            return std::apply(
                [&](const Captures &...bound) -> decltype(auto) {
                    return std::invoke(f, bound..., std::forward<Args>(args)...);
                },
                captures);
        }
    };

    template<typename F, typename... Captures>
    DataFn<std::decay_t<F>, std::decay_t<Captures>...> data_fn(F &&f, Captures &&...captures) {
        return {std::forward<F>(f), {std::forward<Captures>(captures)...}};
    }

} // namespace recompose

#endif // RECOMPOSE_TYPES_DATA_H
