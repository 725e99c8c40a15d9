#include <recompose/recompose.h>
#include <recompose/runtime/observers/compose_profiler.h>

#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

using namespace recompose;

namespace {

    template<typename T>
    using MutSlot = std::shared_ptr<std::optional<Mut<T>>>;

    template<typename T>
    MutSlot<T> make_slot() {
        return std::make_shared<std::optional<Mut<T>>>();
    }

    using Log = std::shared_ptr<std::vector<std::string>>;

    struct Leaf {
        using data_fields = std::tuple<Log>;

        Log log;

        void compose(ScopeState &cx) const {
            auto &id = use_ref(cx, [] { return std::make_shared<int>(0); });
            log->push_back(fmt::format("leaf {}", ++*id));
        }
    };

    struct Fallible {
        using data_fields = std::tuple<Log, MutSlot<bool>>;

        Log log;
        MutSlot<bool> handle;

        Result<Leaf> compose(ScopeState &cx) const {
            auto fail = use_mut(cx, [] { return true; });
            *handle = fail;
            if (*fail) { return std::unexpected(Error{"fallible failed"}); }
            return Leaf{log};
        }
    };

    struct Throwing {
        using data_fields = std::tuple<Log, MutSlot<bool>, std::shared_ptr<int>>;

        Log log;
        MutSlot<bool> handle;
        std::shared_ptr<int> attempts;

        Leaf compose(ScopeState &cx) const {
            ++*attempts;
            auto fail = use_mut(cx, [] { return false; });
            *handle = fail;
            if (*fail) { throw std::runtime_error("throwing failed"); }
            return Leaf{log};
        }
    };

    struct Guarded {
        using data_fields = std::tuple<Log, MutSlot<bool>>;

        Log log;
        MutSlot<bool> handle;

        Catch<Fallible> compose(ScopeState &) const {
            return catch_errors(
                data_fn([](const Log &bound, const Error &error) { bound->push_back("caught " + error.message()); }, log),
                Fallible{log, handle});
        }
    };

    struct Nested {
        using data_fields = std::tuple<Log, MutSlot<bool>>;

        Log log;
        MutSlot<bool> handle;

        Catch<Catch<Fallible>> compose(ScopeState &) const {
            return catch_errors(data_fn([](const Log &bound, const Error &) { bound->push_back("outer"); }, log),
                                catch_errors(data_fn([](const Log &bound, const Error &) { bound->push_back("inner"); }, log),
                                             Fallible{log, handle}));
        }
    };

    struct Numbered {
        using data_fields = std::tuple<int, Log>;

        int value;
        Log log;

        void compose(ScopeState &) const { log->push_back(fmt::format("item {}", value)); }
    };

    // Builds its items with a function that throws for the value held in ``failing``.
    struct Expanding {
        using data_fields = std::tuple<Log, std::shared_ptr<int>>;

        Log log;
        std::shared_ptr<int> failing;

        auto compose(ScopeState &) const {
            return from_iter(std::vector<int>{1, 2, 3},
                             data_fn(
                                 [](const Log &bound, const std::shared_ptr<int> &fail_on, const int &value) {
                                     if (value == *fail_on) { throw std::runtime_error("make_item failed"); }
                                     return Numbered{value, bound};
                                 },
                                 log, failing));
        }
    };

    auto logging_handler(const Log &log) {
        return data_fn([](const Log &bound, const Error &error) { bound->push_back("caught " + error.message()); },
                       log);
    }

} // namespace

TEST_CASE("A failed result is delivered to the nearest catch", "[errors]") {
    auto log = std::make_shared<std::vector<std::string>>();
    auto handle = make_slot<bool>();
    Composer composer{Guarded{log, handle}};
    REQUIRE(composer.compose());
    REQUIRE(*log == std::vector<std::string>{"caught fallible failed"});

    SECTION("an unchanged failure is not reported again") {
        REQUIRE(composer.compose());
        REQUIRE(log->size() == 1);
    }

    SECTION("recovery mounts the content") {
        handle->value().update([](bool &v) { v = false; });
        REQUIRE(composer.compose());
        REQUIRE(log->back() == "leaf 1");
    }
}

TEST_CASE("Only the nearest catch receives an error", "[errors]") {
    auto log = std::make_shared<std::vector<std::string>>();
    auto handle = make_slot<bool>();
    Composer composer{Nested{log, handle}};
    REQUIRE(composer.compose());
    REQUIRE(*log == std::vector<std::string>{"inner"});
}

TEST_CASE("Uncaught errors fail the pass", "[errors]") {
    auto log = std::make_shared<std::vector<std::string>>();
    auto handle = make_slot<bool>();
    auto profiler = std::make_shared<ComposeProfiler>();
    Composer composer{Fallible{log, handle}, ComposerConfig{.observers = {profiler}}};

    auto result = composer.compose();
    REQUIRE_FALSE(result);
    REQUIRE(result.error().errors().size() == 1);
    REQUIRE(result.error().errors().front().message() == "fallible failed");
    REQUIRE(std::string{result.error().what()}.starts_with("1 uncaught composable error(s)"));
    REQUIRE(profiler->stats("expected").errors == 1);

    handle->value().update([](bool &v) { v = false; });
    REQUIRE(composer.compose());
    REQUIRE(*log == std::vector<std::string>{"leaf 1"});
}

TEST_CASE("An exception from a compose body is routed and the node runs again", "[errors]") {
    auto log = std::make_shared<std::vector<std::string>>();
    auto handle = make_slot<bool>();
    auto attempts = std::make_shared<int>(0);
    Composer composer{Throwing{log, handle, attempts}};
    REQUIRE(composer.compose());
    REQUIRE(*log == std::vector<std::string>{"leaf 1"});
    const auto healthy_scopes = composer.runtime().scopes().size();

    handle->value().update([](bool &v) { v = true; });
    auto failed = composer.compose();
    REQUIRE_FALSE(failed);
    REQUIRE(failed.error().errors().front().message() == "throwing failed");
    REQUIRE_FALSE(composer.root_scope().has_child());
    REQUIRE(composer.runtime().scopes().size() == healthy_scopes - 1);

    // Not marked changed, the failed body is retried regardless.
    REQUIRE_FALSE(composer.compose());
    REQUIRE(*attempts == 3);

    handle->value().update([](bool &v) { v = false; });
    REQUIRE(composer.compose());
    // The child was rebuilt with fresh hook state.
    REQUIRE(*log == std::vector<std::string>{"leaf 1", "leaf 1"});
    REQUIRE(composer.runtime().scopes().size() == healthy_scopes);
}

TEST_CASE("Errors keep their original exception", "[errors]") {
    auto error = Error::make(std::invalid_argument{"bad argument"});
    REQUIRE(error.message() == "bad argument");
    REQUIRE_THROWS_AS(error.rethrow(), std::invalid_argument);

    Error from_message{"plain"};
    REQUIRE_THROWS_AS(from_message.rethrow(), std::runtime_error);
}

TEST_CASE("An exception raised while a container drives reaches the nearest catch", "[errors]") {
    auto log = std::make_shared<std::vector<std::string>>();
    auto failing = std::make_shared<int>(2);
    Composer composer{catch_errors(logging_handler(log), Expanding{log, failing})};

    REQUIRE(composer.compose());
    REQUIRE(*log == std::vector<std::string>{"caught make_item failed"});

    // The container was not completed, so it builds its items again on the next pass.
    *failing = 0;
    REQUIRE(composer.compose());
    REQUIRE(*log == std::vector<std::string>{"caught make_item failed", "item 1", "item 2", "item 3"});
    REQUIRE(composer.to_string() == "Expanding\n  Numbered\n  Numbered\n  Numbered\n");
}

TEST_CASE("An uncaught container exception fails the pass", "[errors]") {
    auto log = std::make_shared<std::vector<std::string>>();
    auto failing = std::make_shared<int>(3);
    Composer composer{Expanding{log, failing}};

    auto result = composer.compose();
    REQUIRE_FALSE(result);
    REQUIRE(result.error().errors().size() == 1);
    REQUIRE(result.error().errors().front().message() == "make_item failed");

    *failing = 0;
    REQUIRE(composer.compose());
    REQUIRE(*log == std::vector<std::string>{"item 1", "item 2", "item 3"});
}
