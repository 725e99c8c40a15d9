#pragma once

#include <recompose/runtime/compose_observer.h>

#include <cstdint>
#include <optional>
#include <string>

namespace recompose {

    /**
     * @brief Logs out the different steps as the composer walks the tree.
     *
     * This is voluminous but can be helpful tracing down unexpected recompositions.
     */
    class RECOMPOSE_EXPORT ComposeTrace : public ComposeLifeCycleObserver {
    public:
        /**
         * @brief Construct a new Compose Trace object
         *
         * @param filter Used to restrict which node events to report (substring match on the node name)
         * @param pass Log pass boundaries
         * @param compose Log compose and skip events
         * @param mount Log mount and unmount events
         */
        explicit ComposeTrace(const std::optional<std::string> &filter = std::nullopt, bool pass = true,
                              bool compose = true, bool mount = true);

        void on_before_pass(std::uint64_t pass) override;
        void on_after_pass(std::uint64_t pass) override;
        void on_before_compose(const ScopeState &scope) override;
        void on_skip_compose(const ScopeState &scope) override;
        void on_mount(const ScopeState &scope) override;
        void on_unmount(const ScopeState &scope) override;
        void on_error(const ScopeState &scope, const Error &error) override;

        // Static configuration
        static void set_use_stderr(bool value);

    private:
        std::optional<std::string> _filter;
        bool _pass;
        bool _compose;
        bool _mount;
        std::uint64_t _current_pass{0};

        static bool _use_stderr;

        void _print(const std::string &msg) const;
        void _print_node(const ScopeState &scope, const std::string &msg) const;
        bool _should_log_node(const ScopeState &scope) const;
    };

} // namespace recompose
