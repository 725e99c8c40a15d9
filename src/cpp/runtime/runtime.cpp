#include <recompose/runtime/runtime.h>
#include <recompose/types/error.h>

#include <fmt/format.h>

#include <mutex>

namespace recompose {

    Runtime::ptr Runtime::create(updater_ptr updater, std::vector<observer_ptr> observers) {
        return ptr{new Runtime(std::move(updater), std::move(observers))};
    }

    Runtime::Runtime(updater_ptr updater, std::vector<observer_ptr> observers)
        : _update_queue{std::make_shared<UpdateQueue>()}, _ready_queue{std::make_shared<ReadyQueue>()},
          _write_guard{std::make_shared<std::shared_mutex>()}, _updater{std::move(updater)},
          _observers{std::move(observers)}, _scopes{*this} {
        if (!_updater) { _updater = std::make_shared<QueuedUpdater>(_update_queue); }
    }

    Runtime::~Runtime() { _scopes.clear(); }

    void Runtime::update(std::function<void()> fn) {
        _updater->update(Update{[guard = _write_guard, fn = std::move(fn)] {
            std::unique_lock lock{*guard};
            fn();
        }});
    }

    void Runtime::request_pass() { _updater->update(Update{}); }

    size_t Runtime::apply_queued_updates() { return apply_updates(nullptr); }

    size_t Runtime::apply_queued_updates(std::vector<Error> &failures) { return apply_updates(&failures); }

    size_t Runtime::apply_updates(std::vector<Error> *failures) {
        size_t applied = 0;
        for (size_t pending = _update_queue->size(); pending > 0; --pending) {
            auto update = _update_queue->dequeue();
            if (!update) { break; }
            try {
                update->apply();
            } catch (const std::exception &) {
                if (failures == nullptr) { throw; }
                failures->push_back(Error::current());
                continue;
            }
            ++applied;
        }
        return applied;
    }

    TaskKey Runtime::spawn_local(TaskFn task) {
        if (!task) { throw_error<std::invalid_argument>("Cannot spawn an empty task"); }
        const TaskKey key = _next_task++;
        _tasks.emplace(key, std::move(task));
        _ready_queue->enqueue(key);
        return key;
    }

    void Runtime::cancel_local(TaskKey key) noexcept { _tasks.erase(key); }

    Waker Runtime::waker_for(TaskKey key) const {
        return Waker{[queue = std::weak_ptr<ReadyQueue>{_ready_queue}, updater = std::weak_ptr<Updater>{_updater}, key] {
            auto ready = queue.lock();
            if (!ready || !ready->try_enqueue(key)) { return; }
            if (auto u = updater.lock()) { u->update(Update{}); }
        }};
    }

    size_t Runtime::poll_ready_tasks() { return poll_tasks(nullptr); }

    size_t Runtime::poll_ready_tasks(std::vector<Error> &failures) { return poll_tasks(&failures); }

    size_t Runtime::poll_tasks(std::vector<Error> *failures) {
        size_t polled = 0;
        for (size_t pending = _ready_queue->size(); pending > 0; --pending) {
            auto key = _ready_queue->dequeue();
            if (!key) { break; }
            auto it = _tasks.find(*key);
            // Cancelled, completed or woken twice.
            if (it == _tasks.end() || !it->second) { continue; }

            // The task is moved out while it runs, it may spawn or cancel other tasks.
            TaskFn task = std::move(it->second);
            TaskStatus status;
            try {
                status = task(waker_for(*key));
            } catch (const std::exception &) {
                _tasks.erase(*key);
                if (failures == nullptr) { throw; }
                failures->push_back(Error::current());
                continue;
            }
            ++polled;

            auto current = _tasks.find(*key);
            if (current == _tasks.end()) { continue; }
            if (status == TaskStatus::READY) {
                _tasks.erase(current);
            } else {
                current->second = std::move(task);
            }
        }
        return polled;
    }

    void Runtime::add_observer(observer_ptr observer) { _observers.push_back(std::move(observer)); }

    void Runtime::notify_before_pass(std::uint64_t pass) const {
        for (const auto &observer : _observers) { observer->on_before_pass(pass); }
    }

    void Runtime::notify_after_pass(std::uint64_t pass) const {
        for (const auto &observer : _observers) { observer->on_after_pass(pass); }
    }

    void Runtime::notify_before_compose(const ScopeState &scope) const {
        for (const auto &observer : _observers) { observer->on_before_compose(scope); }
    }

    void Runtime::notify_after_compose(const ScopeState &scope) const {
        for (const auto &observer : _observers) { observer->on_after_compose(scope); }
    }

    void Runtime::notify_skip_compose(const ScopeState &scope) const {
        for (const auto &observer : _observers) { observer->on_skip_compose(scope); }
    }

    void Runtime::notify_mount(const ScopeState &scope) const {
        for (const auto &observer : _observers) { observer->on_mount(scope); }
    }

    void Runtime::notify_unmount(const ScopeState &scope) const noexcept {
        for (const auto &observer : _observers) {
            try {
                observer->on_unmount(scope);
            } catch (const std::exception &e) {
                fmt::print(stderr, "Warning: exception in on_unmount observer: {}\n", e.what());
            }
        }
    }

    void Runtime::notify_error(const ScopeState &scope, const Error &error) const {
        for (const auto &observer : _observers) { observer->on_error(scope, error); }
    }

    void Runtime::initialise() {}

    void Runtime::start() {
        _update_queue->mark_running();
        _ready_queue->mark_running();
    }

    void Runtime::stop() {
        _update_queue->mark_stopped();
        _ready_queue->mark_stopped();
    }

    void Runtime::dispose() {
        _scopes.clear();
        _tasks.clear();
        _update_queue->clear();
        _ready_queue->clear();
    }

} // namespace recompose
