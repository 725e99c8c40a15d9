#ifndef RECOMPOSE_UTIL_SCOPE_H
#define RECOMPOSE_UTIL_SCOPE_H

#include <utility>

namespace recompose {
    /**
     * Runs the supplied callable when the guard leaves scope, unless released.
     * Keeps observer brackets balanced when a pass throws.
     */
    template<class F>
    class scope_exit {
    public:
        explicit scope_exit(F &&f) noexcept : _fn(std::move(f)) {}

        scope_exit(scope_exit &&other) noexcept : _fn(std::move(other._fn)), _active(other._active) { other.release(); }

        scope_exit(const scope_exit &) = delete;

        scope_exit &operator=(const scope_exit &) = delete;

        scope_exit &operator=(scope_exit &&) = delete;

        ~scope_exit() {
            if (_active) { _fn(); }
        }

        void release() noexcept { _active = false; }

    private:
        F _fn;
        bool _active{true};
    };

    template<class F>
    [[nodiscard]] scope_exit<F> make_scope_exit(F &&f) { return scope_exit<F>(std::forward<F>(f)); }

} // namespace recompose
#endif // RECOMPOSE_UTIL_SCOPE_H
