#pragma once

#include <recompose/runtime/compose_observer.h>

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace recompose {

    /**
     * @brief Counts and times compose activity per node name.
     *
     * Useful to confirm a change recomposes only what it should, and to find expensive nodes.
     */
    class RECOMPOSE_EXPORT ComposeProfiler : public ComposeLifeCycleObserver {
    public:
        struct Stats {
            std::uint64_t composed{0};
            std::uint64_t skipped{0};
            std::uint64_t mounted{0};
            std::uint64_t unmounted{0};
            std::uint64_t errors{0};
            std::chrono::nanoseconds elapsed{0};
        };

        /**
         * @param print_each_pass Print the summary after every pass
         */
        explicit ComposeProfiler(bool print_each_pass = false);

        void on_before_pass(std::uint64_t pass) override;
        void on_after_pass(std::uint64_t pass) override;
        void on_before_compose(const ScopeState &scope) override;
        void on_after_compose(const ScopeState &scope) override;
        void on_skip_compose(const ScopeState &scope) override;
        void on_mount(const ScopeState &scope) override;
        void on_unmount(const ScopeState &scope) override;
        void on_error(const ScopeState &scope, const Error &error) override;

        /**
         * Statistics for nodes with this name, all zero when never seen.
         */
        [[nodiscard]] Stats stats(std::string_view name) const;

        [[nodiscard]] std::uint64_t total_composed() const;

        [[nodiscard]] std::uint64_t passes() const noexcept { return _passes; }

        void reset();

        [[nodiscard]] std::string summary() const;

    private:
        using clock = std::chrono::steady_clock;

        bool _print_each_pass;
        std::uint64_t _passes{0};
        ankerl::unordered_dense::map<std::string, Stats> _stats;
        std::vector<clock::time_point> _starts;
    };

} // namespace recompose
