#ifndef RECOMPOSE_UTIL_ERRORS
#define RECOMPOSE_UTIL_ERRORS

#include <recompose/recompose_export.h>

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace recompose {

    /**
     * A node called a different sequence of hooks than it did on its first completed compose.
     * This is a programming defect, it is never routed to a catch context and always leaves the pass.
     */
    struct RECOMPOSE_EXPORT HookOrderError : std::logic_error {
        using std::logic_error::logic_error;
    };

    /**
     * No ancestor provided a context value of the requested type.
     */
    struct RECOMPOSE_EXPORT ContextError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(std::string_view msg,
                                            std::source_location loc = std::source_location::current()) {
        throw Error{fmt::format("{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(),
                                loc.function_name())};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace recompose

#endif // RECOMPOSE_UTIL_ERRORS
