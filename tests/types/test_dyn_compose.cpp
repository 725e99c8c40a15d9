#include <recompose/recompose.h>

#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace recompose;

namespace {

    using Log = std::shared_ptr<std::vector<std::string>>;

    struct A {
        using data_fields = std::tuple<Log, std::shared_ptr<int>>;

        Log log;
        std::shared_ptr<int> instances;

        void compose(ScopeState &cx) const {
            const int id = use_ref(cx, [this] { return ++*instances; });
            log->push_back(fmt::format("A{}", id));
            use_drop(cx, [log = log, id] { log->push_back(fmt::format("drop A{}", id)); });
        }
    };

    struct B {
        using data_fields = std::tuple<Log, std::shared_ptr<int>>;

        Log log;
        std::shared_ptr<int> instances;

        void compose(ScopeState &cx) const {
            const int id = use_ref(cx, [this] { return ++*instances; });
            log->push_back(fmt::format("B{}", id));
            use_drop(cx, [log = log, id] { log->push_back(fmt::format("drop B{}", id)); });
        }
    };

    struct Switcher {
        using data_fields = std::tuple<Log, std::shared_ptr<int>, std::shared_ptr<std::optional<Mut<char>>>>;

        Log log;
        std::shared_ptr<int> instances;
        std::shared_ptr<std::optional<Mut<char>>> handle;

        DynCompose compose(ScopeState &cx) const {
            auto choice = use_mut(cx, [] { return 'A'; });
            *handle = choice;
            if (*choice == 'A') { return dyn_compose(A{log, instances}); }
            return dyn_compose(B{log, instances});
        }
    };

    struct Fixture {
        Log log{std::make_shared<std::vector<std::string>>()};
        std::shared_ptr<int> instances{std::make_shared<int>(0)};
        std::shared_ptr<std::optional<Mut<char>>> handle{std::make_shared<std::optional<Mut<char>>>()};

        void choose(char choice) const {
            handle->value().update([choice](char &v) { v = choice; });
        }
    };

} // namespace

TEST_CASE("Switching the dynamic type tears down the old content", "[dyn_compose]") {
    Fixture f;
    Composer composer{Switcher{f.log, f.instances, f.handle}};
    REQUIRE(composer.compose());
    REQUIRE(*f.log == std::vector<std::string>{"A1"});
    REQUIRE(composer.to_string() == "Switcher\n  A\n");

    f.choose('B');
    REQUIRE(composer.compose());
    REQUIRE(*f.log == std::vector<std::string>{"A1", "drop A1", "B2"});
    REQUIRE(composer.to_string() == "Switcher\n  B\n");

    f.choose('A');
    REQUIRE(composer.compose());
    REQUIRE(*f.log == std::vector<std::string>{"A1", "drop A1", "B2", "drop B2", "A3"});
}

TEST_CASE("A dynamic value of the same type keeps its hooks", "[dyn_compose]") {
    Fixture f;
    Composer composer{Switcher{f.log, f.instances, f.handle}};
    REQUIRE(composer.compose());

    composer.root_scope().set_changed();
    REQUIRE(composer.compose());
    REQUIRE(*f.log == std::vector<std::string>{"A1", "A1"});
    REQUIRE(*f.instances == 1);
}

TEST_CASE("A dynamic node without a new value drives its current content", "[dyn_compose]") {
    Fixture f;
    Composer composer{Switcher{f.log, f.instances, f.handle}};
    REQUIRE(composer.compose());
    REQUIRE(composer.compose());
    REQUIRE(composer.compose());
    REQUIRE(*f.log == std::vector<std::string>{"A1"});
}

TEST_CASE("DynCompose can be the root", "[dyn_compose]") {
    Fixture f;
    {
        Composer composer{dyn_compose(B{f.log, f.instances})};
        REQUIRE(composer.compose());
        REQUIRE(composer.compose());
        REQUIRE(*f.log == std::vector<std::string>{"B1"});
    }
    REQUIRE(*f.log == std::vector<std::string>{"B1", "drop B1"});
}

TEST_CASE("DynCompose hands its value over once", "[dyn_compose]") {
    Fixture f;
    auto dyn = dyn_compose(A{f.log, f.instances});
    REQUIRE(dyn.has_pending());
    REQUIRE(dyn.type() == type_id_of<A>());

    AnyCompose taken = dyn.take();
    REQUIRE_FALSE(dyn.has_pending());
    REQUIRE(taken.get_if<A>() != nullptr);
}
