#ifndef RECOMPOSE_TYPES_ERROR_H
#define RECOMPOSE_TYPES_ERROR_H

#include <recompose/recompose_export.h>
#include <recompose/recompose_forward_declarations.h>

#include <concepts>
#include <exception>
#include <functional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace recompose {

    /**
     * An opaque, copyable error reported by a composable, either as the failure of a ``Result`` or by an exception
     * escaping a compose body. It is delivered to the nearest ancestor catch context.
     */
    class RECOMPOSE_EXPORT Error {
    public:
        using data_fields = std::tuple<std::exception_ptr, std::string>;

        explicit Error(std::exception_ptr exception);

        /**
         * Wraps ``message`` in a std::runtime_error.
         */
        explicit Error(std::string message);

        template<typename E>
            requires std::derived_from<std::remove_cvref_t<E>, std::exception>
        static Error make(E &&error) {
            return Error{std::make_exception_ptr(std::forward<E>(error))};
        }

        /**
         * The exception currently being handled, only valid inside a catch block.
         */
        static Error current();

        [[nodiscard]] const std::string &message() const noexcept { return _message; }

        [[nodiscard]] const std::exception_ptr &exception() const noexcept { return _exception; }

        [[noreturn]] void rethrow() const;

    private:
        std::exception_ptr _exception;
        std::string _message;
    };

    /**
     * Provided by ``catch_errors`` (and by the composer at the root), receives errors reported by descendants.
     */
    struct CatchContext {
        std::function<void(const Error &)> on_error;
    };

    /**
     * Deliver ``error`` to the nearest catch context visible from ``cx``. When there is none the error is rethrown.
     */
    RECOMPOSE_EXPORT void report_error(ScopeState &cx, const Error &error);

} // namespace recompose

#endif // RECOMPOSE_TYPES_ERROR_H
