#include <recompose/recompose.h>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

using namespace recompose;

namespace {

    struct Plain {
        using data_fields = std::tuple<int>;

        int value{0};

        void compose(ScopeState &) const {}
    };

    struct Borrowing {
        using data_fields = std::tuple<std::string_view>;

        std::string_view label;

        void compose(ScopeState &) const {}
    };

    struct Owning {
        using data_fields = std::tuple<std::string, std::vector<int>>;

        std::string label;
        std::vector<int> values;

        Plain compose(ScopeState &) const { return Plain{static_cast<int>(values.size())}; }
    };

    struct NotComposable {
        int value{0};
    };

    struct Undeclared {
        std::string label;

        void compose(ScopeState &) const {}
    };

    struct UndeclaredView {
        std::string_view label;

        void compose(ScopeState &) const {}
    };

    struct UndeclaredPointer {
        const int *value{nullptr};

        void compose(ScopeState &) const {}
    };

    struct Tag {
        void compose(ScopeState &) const {}
    };

} // namespace

TEST_CASE("Owned values are data, pass scoped views are not", "[data]") {
    STATIC_REQUIRE(Data<int>);
    STATIC_REQUIRE(Data<std::string>);
    STATIC_REQUIRE(Data<std::vector<std::string>>);
    STATIC_REQUIRE(Data<std::optional<int>>);
    STATIC_REQUIRE(Data<std::shared_ptr<int>>);
    STATIC_REQUIRE(Data<std::tuple<int, std::string>>);

    STATIC_REQUIRE_FALSE(Data<std::string_view>);
    STATIC_REQUIRE_FALSE(Data<std::span<int>>);
    STATIC_REQUIRE_FALSE(Data<int &>);
    STATIC_REQUIRE_FALSE(Data<ScopeState *>);
    STATIC_REQUIRE_FALSE(Data<std::vector<std::string_view>>);
    STATIC_REQUIRE_FALSE(Data<std::tuple<int, std::string_view>>);
}

TEST_CASE("Aggregates are data only when every declared field is", "[data]") {
    STATIC_REQUIRE(Data<Owning>);
    STATIC_REQUIRE_FALSE(Data<Borrowing>);
}

TEST_CASE("Classes are data only when they declare their fields", "[data]") {
    STATIC_REQUIRE_FALSE(Composable<UndeclaredView>);
    STATIC_REQUIRE_FALSE(Composable<UndeclaredPointer>);
    STATIC_REQUIRE_FALSE(Composable<Undeclared>);
    STATIC_REQUIRE(Composable<Tag>);

    STATIC_REQUIRE_FALSE(Data<const int *>);
    STATIC_REQUIRE_FALSE(Data<std::shared_ptr<int *>>);
    STATIC_REQUIRE_FALSE(Data<std::function<void()>>);
    STATIC_REQUIRE(Data<void (*)()>);
    STATIC_REQUIRE(Data<std::unique_ptr<std::string>>);
    STATIC_REQUIRE(Data<std::array<int, 3>>);
    STATIC_REQUIRE(Data<Error>);
}

TEST_CASE("Closures are data only without captures", "[data]") {
    int local = 0;
    auto by_reference = [&local](ScopeState &) { ++local; };
    auto by_value = [name = std::string{"x"}](ScopeState &) { (void)name; };
    auto captureless = [](ScopeState &) {};

    STATIC_REQUIRE_FALSE(Data<decltype(by_reference)>);
    STATIC_REQUIRE_FALSE(Composable<FromFn<decltype(by_reference)>>);
    STATIC_REQUIRE_FALSE(Composable<FromFn<decltype(by_value)>>);
    STATIC_REQUIRE(Composable<FromFn<decltype(captureless)>>);

    auto bound = from_fn([](const std::string &name, ScopeState &) { (void)name; }, std::string{"x"});
    STATIC_REQUIRE(Composable<decltype(bound)>);

    auto view = data_fn([](std::string_view, int) {}, std::string_view{"x"});
    STATIC_REQUIRE_FALSE(Data<decltype(view)>);
    auto owned = data_fn([](const std::string &, int) {}, std::string{"x"});
    STATIC_REQUIRE(Data<decltype(owned)>);
    owned(1);
}

TEST_CASE("Composable requires data and a compose capability", "[data]") {
    STATIC_REQUIRE(Composable<Plain>);
    STATIC_REQUIRE(Composable<Owning>);
    STATIC_REQUIRE(Composable<Unit>);
    STATIC_REQUIRE(Composable<std::tuple<Plain, Owning>>);
    STATIC_REQUIRE(Composable<std::vector<Plain>>);
    STATIC_REQUIRE(Composable<std::optional<Plain>>);
    STATIC_REQUIRE(Composable<Result<Plain>>);
    STATIC_REQUIRE(Composable<DynCompose>);

    STATIC_REQUIRE_FALSE(Composable<NotComposable>);
    STATIC_REQUIRE_FALSE(Composable<Borrowing>);
    STATIC_REQUIRE_FALSE(Composable<std::tuple<Plain, NotComposable>>);
}

TEST_CASE("The child type of a composable is what compose returns", "[data]") {
    STATIC_REQUIRE(std::is_same_v<child_t<Plain>, Unit>);
    STATIC_REQUIRE(std::is_same_v<child_t<Owning>, Plain>);
    STATIC_REQUIRE(is_container_v<std::vector<Plain>>);
    STATIC_REQUIRE_FALSE(is_container_v<Plain>);
}

TEST_CASE("Composable names are short type names", "[data]") {
    REQUIRE(compose_name<Plain>() == "Plain");
    REQUIRE(compose_name<Memo<int, Plain>>() == "Memo");
    REQUIRE(compose_name<std::tuple<Plain, Owning>>() == "tuple");
    REQUIRE(short_type_name("app::ui::Wrap<int, app::Leaf>") == "Wrap");
    REQUIRE(short_type_name("Counter") == "Counter");
}
