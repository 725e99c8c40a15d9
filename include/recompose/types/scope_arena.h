#ifndef RECOMPOSE_TYPES_SCOPE_ARENA_H
#define RECOMPOSE_TYPES_SCOPE_ARENA_H

#include <recompose/types/scope_state.h>

#include <ankerl/unordered_dense.h>

#include <memory>

namespace recompose {

    /**
     * Owns every scope of one runtime, addressed by keys that are never reused.
     * Parent and child links are keys, ownership is expressed by ScopeHandle.
     */
    class RECOMPOSE_EXPORT ScopeArena {
    public:
        explicit ScopeArena(Runtime &runtime);

        ScopeArena(const ScopeArena &) = delete;

        ScopeArena &operator=(const ScopeArena &) = delete;

        ~ScopeArena();

        [[nodiscard]] ScopeHandle create(ScopeKey parent);

        [[nodiscard]] ScopeState *find(ScopeKey key) const noexcept;

        /**
         * Tear down the scope. The entry is detached from the arena before it is destroyed, so teardown may
         * recursively remove descendants.
         */
        void remove(ScopeKey key) noexcept;

        /**
         * Tear down every remaining scope.
         */
        void clear() noexcept;

        [[nodiscard]] size_t size() const noexcept { return _scopes.size(); }

    private:
        Runtime &_runtime;
        ScopeKey _next_key{NO_SCOPE + 1};
        ankerl::unordered_dense::map<ScopeKey, std::unique_ptr<ScopeState>> _scopes;
    };

} // namespace recompose

#endif // RECOMPOSE_TYPES_SCOPE_ARENA_H
