#ifndef RECOMPOSE_RUNTIME_COMPOSER_H
#define RECOMPOSE_RUNTIME_COMPOSER_H

#include <recompose/recompose_export.h>
#include <recompose/runtime/runtime.h>
#include <recompose/types/any_compose.h>
#include <recompose/types/compose.h>
#include <recompose/types/error.h>
#include <recompose/types/scope_state.h>

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <vector>

namespace recompose {

    /**
     * Every error of one pass that reached the root without being caught.
     */
    class RECOMPOSE_EXPORT ComposeFailure : public std::runtime_error {
    public:
        explicit ComposeFailure(std::vector<Error> errors);

        [[nodiscard]] const std::vector<Error> &errors() const noexcept { return _errors; }

    private:
        std::vector<Error> _errors;
    };

    /**
     * Why try_compose did not complete a pass: either there was nothing to do, or the pass failed.
     */
    class RECOMPOSE_EXPORT TryComposeError {
    public:
        static TryComposeError pending() { return TryComposeError{}; }

        explicit TryComposeError(ComposeFailure failure) : _failure{std::move(failure)} {}

        [[nodiscard]] bool is_pending() const noexcept { return !_failure.has_value(); }

        /**
         * The failed pass, throws std::logic_error when pending.
         */
        [[nodiscard]] const ComposeFailure &failure() const;

    private:
        TryComposeError() = default;

        std::optional<ComposeFailure> _failure;
    };

    struct ComposerConfig {
        /**
         * Receives every update. When null updates are queued on the runtime and applied by compose().
         */
        updater_ptr updater{};
        std::vector<observer_ptr> observers{};
    };

    /**
     * Owns a composition: the runtime, the root node and the root scope.
     *
     * Each call to compose() runs one pass: the local tasks that were woken are polled, the queued updates are applied,
     * then the tree is driven from the root while holding the write guard exclusively. A task or update that throws is
     * reported with the pass's uncaught errors.
     */
    class RECOMPOSE_EXPORT Composer {
    public:
        template<typename C>
            requires Composable<C>
        explicit Composer(C content, ComposerConfig config = {})
            : Composer(AnyCompose{std::move(content)}, std::move(config)) {}

        Composer(AnyCompose content, ComposerConfig config);

        Composer(const Composer &) = delete;

        Composer &operator=(const Composer &) = delete;

        ~Composer();

        /**
         * Run one pass, errors that no catch intercepted are returned together.
         */
        [[nodiscard]] std::expected<void, ComposeFailure> compose();

        /**
         * Run a pass only when there is work: the first pass, a woken local task, a queued update or a scope marked
         * changed. Otherwise nothing is driven and the error is pending.
         */
        [[nodiscard]] std::expected<void, TryComposeError> try_compose();

        /**
         * True when try_compose would run a pass.
         */
        [[nodiscard]] bool has_pending_work() const;

        /**
         * Make ``value`` visible to the whole tree, for example an ExecutorContext.
         */
        template<typename T>
        void provide_context(std::shared_ptr<T> value) {
            _root_scope->seed_context(std::type_index{typeid(T)}, std::move(value));
        }

        [[nodiscard]] Runtime &runtime() const noexcept { return *_runtime; }

        [[nodiscard]] ScopeState &root_scope() const noexcept { return *_root_scope; }

        [[nodiscard]] std::uint64_t pass_count() const noexcept { return _pass_count; }

        /**
         * The tree of node names, one per line and indented by depth. Containers are transparent.
         */
        [[nodiscard]] std::string to_string() const;

    private:
        Runtime::ptr _runtime;
        std::shared_ptr<std::vector<Error>> _uncaught;
        AnyCompose _root;
        ScopeHandle _root_scope;
        std::uint64_t _pass_count{0};
    };

} // namespace recompose

#endif // RECOMPOSE_RUNTIME_COMPOSER_H
