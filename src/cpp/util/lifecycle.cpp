#include <recompose/util/lifecycle.h>

#include <fmt/format.h>

#include <exception>

namespace recompose {
    bool ComponentLifeCycle::is_started() const { return _started; }

    bool ComponentLifeCycle::is_starting() const { return _transitioning && !_started; }

    bool ComponentLifeCycle::is_stopping() const { return _transitioning && _started; }

    struct TransitionGuard {
        explicit TransitionGuard(ComponentLifeCycle &component) : _component{component} { _component._transitioning = true; }
        ~TransitionGuard() { _component._transitioning = false; }

    private:
        ComponentLifeCycle &_component;
    };

    void initialise_component(ComponentLifeCycle &component) { component.initialise(); }

    /*
     * NOTE the LifeCycle methods are expected to be called on the driving thread, so the simple guard clauses
     * used here are sufficient to ensure we don't accidentally start/stop more than once.
     */

    void start_component(ComponentLifeCycle &component) {
        if (component.is_started() || component.is_starting()) { return; }
        TransitionGuard guard{component};
        component.start();
        // If start throws we do not land up setting the started flag.
        component._started = true;
    }

    void stop_component(ComponentLifeCycle &component) {
        if (!component.is_started() || component.is_stopping()) { return; }
        TransitionGuard guard{component};
        component.stop();
        component._started = false;
    }

    void dispose_component(ComponentLifeCycle &component) { component.dispose(); }

    void stop_and_dispose_noexcept(ComponentLifeCycle &component) noexcept {
        try {
            stop_component(component);
        } catch (const std::exception &e) {
            fmt::print(stderr, "Warning: exception during stop_component: {}\n", e.what());
        }
        try {
            dispose_component(component);
        } catch (const std::exception &e) {
            fmt::print(stderr, "Warning: exception during dispose_component: {}\n", e.what());
        }
    }
} // namespace recompose
