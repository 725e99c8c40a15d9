#include <recompose/runtime/observers/compose_profiler.h>
#include <recompose/types/scope_state.h>

#include <fmt/format.h>

#include <algorithm>

namespace recompose {

    ComposeProfiler::ComposeProfiler(bool print_each_pass) : _print_each_pass(print_each_pass) {}

    void ComposeProfiler::on_before_pass(std::uint64_t) {
        ++_passes;
        _starts.clear();
    }

    void ComposeProfiler::on_after_pass(std::uint64_t pass) {
        if (_print_each_pass) { fmt::print("[pass {}]\n{}", pass, summary()); }
    }

    void ComposeProfiler::on_before_compose(const ScopeState &) { _starts.push_back(clock::now()); }

    void ComposeProfiler::on_after_compose(const ScopeState &scope) {
        auto &stats = _stats[scope.name()];
        ++stats.composed;
        if (_starts.empty()) { return; }
        stats.elapsed += std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - _starts.back());
        _starts.pop_back();
    }

    void ComposeProfiler::on_skip_compose(const ScopeState &scope) { ++_stats[scope.name()].skipped; }

    void ComposeProfiler::on_mount(const ScopeState &scope) { ++_stats[scope.name()].mounted; }

    void ComposeProfiler::on_unmount(const ScopeState &scope) { ++_stats[scope.name()].unmounted; }

    void ComposeProfiler::on_error(const ScopeState &scope, const Error &) { ++_stats[scope.name()].errors; }

    ComposeProfiler::Stats ComposeProfiler::stats(std::string_view name) const {
        auto it = _stats.find(std::string{name});
        return it == _stats.end() ? Stats{} : it->second;
    }

    std::uint64_t ComposeProfiler::total_composed() const {
        std::uint64_t total = 0;
        for (const auto &[name, stats] : _stats) { total += stats.composed; }
        return total;
    }

    void ComposeProfiler::reset() {
        _passes = 0;
        _stats.clear();
        _starts.clear();
    }

    std::string ComposeProfiler::summary() const {
        std::vector<std::pair<std::string, Stats>> rows{_stats.begin(), _stats.end()};
        std::sort(rows.begin(), rows.end(), [](const auto &a, const auto &b) { return a.first < b.first; });
        std::string out;
        for (const auto &[name, s] : rows) {
            out += fmt::format("{:<24} composed={:<6} skipped={:<6} mounted={:<4} unmounted={:<4} errors={:<4} {}us\n",
                               name.empty() ? "<unnamed>" : name, s.composed, s.skipped, s.mounted, s.unmounted,
                               s.errors, std::chrono::duration_cast<std::chrono::microseconds>(s.elapsed).count());
        }
        return out;
    }

} // namespace recompose
