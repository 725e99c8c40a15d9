#include <recompose/runtime/observers/compose_trace.h>
#include <recompose/types/error.h>
#include <recompose/types/scope_state.h>

#include <fmt/format.h>

#include <cstdio>

namespace recompose {

    bool ComposeTrace::_use_stderr = true;

    ComposeTrace::ComposeTrace(const std::optional<std::string> &filter, bool pass, bool compose, bool mount)
        : _filter(filter), _pass(pass), _compose(compose), _mount(mount) {}

    void ComposeTrace::set_use_stderr(bool value) { _use_stderr = value; }

    void ComposeTrace::_print(const std::string &msg) const {
        fmt::print(_use_stderr ? stderr : stdout, "[pass {}] {}\n", _current_pass, msg);
    }

    void ComposeTrace::_print_node(const ScopeState &scope, const std::string &msg) const {
        _print(fmt::format("[{}:{}] {}", scope.name(), scope.key(), msg));
    }

    bool ComposeTrace::_should_log_node(const ScopeState &scope) const {
        if (!_filter.has_value()) { return true; }
        return scope.name().find(_filter.value()) != std::string::npos;
    }

    void ComposeTrace::on_before_pass(std::uint64_t pass) {
        _current_pass = pass;
        if (_pass) { _print(fmt::format("{} Pass Start {}", std::string(20, '>'), std::string(20, '>'))); }
    }

    void ComposeTrace::on_after_pass(std::uint64_t pass) {
        if (_pass) { _print(fmt::format("{} Pass Done {}", std::string(20, '<'), std::string(20, '<'))); }
    }

    void ComposeTrace::on_before_compose(const ScopeState &scope) {
        if (_compose && !scope.is_container() && _should_log_node(scope)) {
            _print_node(scope, scope.is_parent_changed() ? "Compose (parent changed)" : "Compose");
        }
    }

    void ComposeTrace::on_skip_compose(const ScopeState &scope) {
        if (_compose && _should_log_node(scope)) { _print_node(scope, "Skip"); }
    }

    void ComposeTrace::on_mount(const ScopeState &scope) {
        if (_mount && _should_log_node(scope)) { _print_node(scope, fmt::format("Mount under {}", scope.parent())); }
    }

    void ComposeTrace::on_unmount(const ScopeState &scope) {
        if (_mount && _should_log_node(scope)) { _print_node(scope, "Unmount"); }
    }

    void ComposeTrace::on_error(const ScopeState &scope, const Error &error) {
        // Errors are always reported, regardless of the event switches.
        if (_should_log_node(scope)) { _print_node(scope, fmt::format("Error: {}", error.message())); }
    }

} // namespace recompose
