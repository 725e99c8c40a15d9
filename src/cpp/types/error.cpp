#include <recompose/runtime/runtime.h>
#include <recompose/types/error.h>
#include <recompose/types/scope_state.h>

#include <stdexcept>

namespace recompose {

    namespace {
        std::string message_of(const std::exception_ptr &exception) {
            if (!exception) { return "<no error>"; }
            try {
                std::rethrow_exception(exception);
            } catch (const std::exception &e) {
                return e.what();
            } catch (...) {
                // The exception_ptr is retained by the Error, only the description is unavailable.
                return "unknown error";
            }
        }
    } // namespace

    Error::Error(std::exception_ptr exception) : _exception{std::move(exception)}, _message{message_of(_exception)} {}

    Error::Error(std::string message)
        : _exception{std::make_exception_ptr(std::runtime_error{message})}, _message{std::move(message)} {}

    Error Error::current() { return Error{std::current_exception()}; }

    void Error::rethrow() const {
        if (_exception) { std::rethrow_exception(_exception); }
        throw std::runtime_error{_message};
    }

    void report_error(ScopeState &cx, const Error &error) {
        cx.runtime().notify_error(cx, error);
        auto handler = cx.find_context<CatchContext>();
        if (!handler || !handler->on_error) { error.rethrow(); }
        handler->on_error(error);
    }

} // namespace recompose
