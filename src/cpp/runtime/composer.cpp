#include <recompose/runtime/composer.h>
#include <recompose/util/scope.h>

#include <fmt/format.h>

#include <mutex>

namespace recompose {

    namespace {
        std::string failure_message(const std::vector<Error> &errors) {
            std::string message = fmt::format("{} uncaught composable error(s)", errors.size());
            for (const auto &error : errors) { message += fmt::format("\n  {}", error.message()); }
            return message;
        }

        void dump_tree(const ScopeArena &arena, const ScopeState &scope, size_t depth, std::string &out) {
            const bool shown = !scope.is_container() && !scope.name().empty();
            if (shown) { out += fmt::format("{:{}}{}\n", "", depth * 2, scope.name()); }
            for (auto key : scope.children()) {
                if (auto *child = arena.find(key)) { dump_tree(arena, *child, shown ? depth + 1 : depth, out); }
            }
        }
    } // namespace

    ComposeFailure::ComposeFailure(std::vector<Error> errors)
        : std::runtime_error{failure_message(errors)}, _errors{std::move(errors)} {}

    const ComposeFailure &TryComposeError::failure() const {
        if (!_failure) { throw_error<std::logic_error>("try_compose was pending, no pass ran"); }
        return *_failure;
    }

    Composer::Composer(AnyCompose content, ComposerConfig config)
        : _runtime{Runtime::create(std::move(config.updater), std::move(config.observers))},
          _uncaught{std::make_shared<std::vector<Error>>()}, _root{std::move(content)} {
        if (!_root.has_value()) { throw_error<std::invalid_argument>("Composer requires a root composable"); }
        initialise_component(*_runtime);
        start_component(*_runtime);
        _root_scope = _runtime->scopes().create(NO_SCOPE);
        _root_scope->seed_context(std::type_index{typeid(CatchContext)},
                                  std::make_shared<CatchContext>(CatchContext{[uncaught = _uncaught](const Error &error) {
                                      uncaught->push_back(error);
                                  }}));
    }

    Composer::~Composer() {
        // Tear the tree down first so drop callbacks still see a running runtime.
        _root_scope.reset();
        _root.reset();
        stop_and_dispose_noexcept(*_runtime);
    }

    std::expected<void, ComposeFailure> Composer::compose() {
        const auto pass = ++_pass_count;
        _uncaught->clear();
        _runtime->notify_before_pass(pass);
        auto after_pass = make_scope_exit([this, pass] { _runtime->notify_after_pass(pass); });

        std::vector<Error> failures;
        _runtime->poll_ready_tasks(failures);
        _runtime->apply_queued_updates(failures);
        {
            std::unique_lock lock{*_runtime->write_guard()};
            for (const auto &failure : failures) { report_error(*_root_scope, failure); }
            _runtime->clear_changes();
            _root.drive(*_root_scope);
        }

        if (_uncaught->empty()) { return {}; }
        return std::unexpected(ComposeFailure{std::exchange(*_uncaught, {})});
    }

    std::expected<void, TryComposeError> Composer::try_compose() {
        if (!has_pending_work()) { return std::unexpected(TryComposeError::pending()); }
        if (auto result = compose(); !result) { return std::unexpected(TryComposeError{std::move(result.error())}); }
        return {};
    }

    bool Composer::has_pending_work() const {
        return _pass_count == 0 || _runtime->has_changes() || _runtime->pending_update_count() > 0 ||
               _runtime->ready_task_count() > 0;
    }

    std::string Composer::to_string() const {
        std::string out;
        dump_tree(_runtime->scopes(), *_root_scope, 0, out);
        return out;
    }

} // namespace recompose
