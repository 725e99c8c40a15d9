#include <recompose/util/lifecycle.h>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace recompose::test {

struct MockLifecycle : ComponentLifeCycle {
    std::vector<std::string> calls;
    bool fail_start{false};
    bool fail_dispose{false};
    bool started_during_start{true};
    bool stopping_during_stop{false};

protected:
    void initialise() override { calls.emplace_back("initialise"); }

    void start() override {
        calls.emplace_back("start");
        started_during_start = is_started();
        if (fail_start) { throw std::runtime_error("start failed"); }
    }

    void stop() override {
        calls.emplace_back("stop");
        stopping_during_stop = is_stopping();
    }

    void dispose() override {
        calls.emplace_back("dispose");
        if (fail_dispose) { throw std::runtime_error("dispose failed"); }
    }
};

}  // namespace recompose::test

TEST_CASE("Life-cycle transitions are guarded against repeats", "[lifecycle]") {
    using namespace recompose;
    test::MockLifecycle mock{};
    REQUIRE_FALSE(mock.is_started());
    REQUIRE_FALSE(mock.is_starting());
    REQUIRE_FALSE(mock.is_stopping());

    initialise_component(mock);
    start_component(mock);
    REQUIRE(mock.is_started());
    REQUIRE_FALSE(mock.started_during_start);

    start_component(mock);
    REQUIRE(mock.calls == std::vector<std::string>{"initialise", "start"});

    stop_component(mock);
    REQUIRE_FALSE(mock.is_started());
    REQUIRE(mock.stopping_during_stop);

    stop_component(mock);
    dispose_component(mock);
    REQUIRE(mock.calls == std::vector<std::string>{"initialise", "start", "stop", "dispose"});
}

TEST_CASE("A failed start leaves the component stopped", "[lifecycle]") {
    using namespace recompose;
    test::MockLifecycle mock{};
    mock.fail_start = true;
    initialise_component(mock);
    REQUIRE_THROWS_AS(start_component(mock), std::runtime_error);
    REQUIRE_FALSE(mock.is_started());
    REQUIRE_FALSE(mock.is_starting());
}

TEST_CASE("stop_and_dispose_noexcept reports failures instead of throwing", "[lifecycle]") {
    using namespace recompose;
    test::MockLifecycle mock{};
    mock.fail_dispose = true;
    initialise_component(mock);
    start_component(mock);
    stop_and_dispose_noexcept(mock);
    REQUIRE_FALSE(mock.is_started());
    REQUIRE(mock.calls == std::vector<std::string>{"initialise", "start", "stop", "dispose"});
}
