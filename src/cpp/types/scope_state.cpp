#include <recompose/runtime/runtime.h>
#include <recompose/types/scope_arena.h>
#include <recompose/types/scope_state.h>

#include <fmt/format.h>

namespace recompose {

    ScopeHandle::ScopeHandle(ScopeArena &arena, ScopeKey key, ScopeState *state) noexcept
        : _arena{&arena}, _key{key}, _state{state} {}

    ScopeHandle::ScopeHandle(ScopeHandle &&other) noexcept
        : _arena{std::exchange(other._arena, nullptr)}, _key{std::exchange(other._key, NO_SCOPE)},
          _state{std::exchange(other._state, nullptr)} {}

    ScopeHandle &ScopeHandle::operator=(ScopeHandle &&other) noexcept {
        if (this != &other) {
            reset();
            _arena = std::exchange(other._arena, nullptr);
            _key = std::exchange(other._key, NO_SCOPE);
            _state = std::exchange(other._state, nullptr);
        }
        return *this;
    }

    ScopeHandle::~ScopeHandle() { reset(); }

    void ScopeHandle::reset() noexcept {
        if (_arena == nullptr) { return; }
        auto *arena = std::exchange(_arena, nullptr);
        auto key = std::exchange(_key, NO_SCOPE);
        _state = nullptr;
        arena->remove(key);
    }

    ScopeState::ScopeState(Runtime &runtime, ScopeKey key, ScopeKey parent)
        : _runtime{runtime}, _key{key}, _parent{parent} {}

    ScopeState::~ScopeState() {
        _runtime.notify_unmount(*this);
        run_drops();
        // The child slot and any scopes held in hooks cascade from here.
    }

    void ScopeState::set_changed() noexcept {
        _changed = true;
        _runtime.note_changed();
    }

    void ScopeState::run_drops() noexcept {
        for (auto index : _drop_slots) {
            auto *drop = hook_at<DropCallback>(index);
            if (drop == nullptr || !drop->fn) { continue; }
            auto fn = std::exchange(drop->fn, nullptr);
            try {
                fn();
            } catch (const std::exception &e) {
                fmt::print(stderr, "Warning: exception in drop callback of '{}': {}\n", _name, e.what());
            }
        }
        _drop_slots.clear();
    }

    void ScopeState::end_compose() {
        if (_hooks_sealed && _hook_cursor != _hooks.size()) {
            throw_error<HookOrderError>("'{}' called {} hooks but {} on its first compose", _name, _hook_cursor,
                                        _hooks.size());
        }
        _hooks_sealed = true;
        _composed = true;
    }

    void ScopeState::provide_context(std::type_index type, std::shared_ptr<void> value) {
        _provided.insert_or_assign(type, std::move(value));
    }

    void ScopeState::seed_context(std::type_index type, std::shared_ptr<void> value) {
        _contexts.insert_or_assign(type, std::move(value));
    }

    void ScopeState::inherit_contexts(const ScopeState &parent) {
        _contexts = parent._contexts;
        for (const auto &[type, value] : parent._provided) { _contexts.insert_or_assign(type, value); }
    }

    bool ScopeState::mount_child(AnyCompose compose) {
        // On a successful reborrow ``compose`` holds the previous value and is discarded on return.
        if (_child && _child->compose.reborrow(compose)) { return true; }
        _child.reset();
        auto scope = create_child_scope();
        _child.emplace(ChildSlot{std::move(compose), std::move(scope)});
        return false;
    }

    ScopeHandle ScopeState::create_child_scope() { return _runtime.scopes().create(_key); }

    ScopeArena::ScopeArena(Runtime &runtime) : _runtime{runtime} {}

    ScopeArena::~ScopeArena() { clear(); }

    void ScopeArena::clear() noexcept {
        // Handles still held by torn down parents find their key gone and do nothing.
        while (!_scopes.empty()) { remove(_scopes.begin()->first); }
    }

    ScopeHandle ScopeArena::create(ScopeKey parent) {
        const ScopeKey key = _next_key++;
        auto state = std::make_unique<ScopeState>(_runtime, key, parent);
        auto *ptr = state.get();
        _scopes.emplace(key, std::move(state));
        if (auto *p = find(parent)) { p->_children.push_back(key); }
        return ScopeHandle{*this, key, ptr};
    }

    ScopeState *ScopeArena::find(ScopeKey key) const noexcept {
        auto it = _scopes.find(key);
        return it == _scopes.end() ? nullptr : it->second.get();
    }

    void ScopeArena::remove(ScopeKey key) noexcept {
        auto it = _scopes.find(key);
        if (it == _scopes.end()) { return; }
        std::unique_ptr<ScopeState> state = std::move(it->second);
        _scopes.erase(it);
        if (auto *p = find(state->parent())) { std::erase(p->_children, key); }
        state.reset();
    }

} // namespace recompose
