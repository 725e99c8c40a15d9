#include <recompose/runtime/task.h>

namespace recompose {
    Waker::Waker(std::function<void()> wake)
        : _wake{std::make_shared<const std::function<void()>>(std::move(wake))} {}

    void Waker::wake() const {
        if (_wake && *_wake) { (*_wake)(); }
    }
} // namespace recompose
