#include <recompose/util/sender_receiver_state.h>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <thread>
#include <vector>

TEST_CASE("SenderReceiverState is first in first out with a front lane", "[sender_receiver]") {
    recompose::SenderReceiverState<int> state;
    REQUIRE_FALSE(static_cast<bool>(state));

    state.enqueue(1);
    state(2);
    state.enqueue_front(0);
    REQUIRE(state.size() == 3);

    std::vector<int> drained;
    while (auto value = state.dequeue()) { drained.push_back(*value); }
    REQUIRE(drained == std::vector<int>{0, 1, 2});
    REQUIRE_FALSE(state.dequeue().has_value());
}

TEST_CASE("A stopped SenderReceiverState rejects new values but can be drained", "[sender_receiver]") {
    recompose::SenderReceiverState<int> state;
    state.enqueue(7);
    state.mark_stopped();
    REQUIRE(state.stopped());

    REQUIRE_THROWS_AS(state.enqueue(8), std::runtime_error);
    REQUIRE_FALSE(state.try_enqueue(8));
    REQUIRE(state.dequeue() == 7);

    state.mark_running();
    REQUIRE(state.try_enqueue(9));
    REQUIRE(state.dequeue() == 9);
}

TEST_CASE("SenderReceiverState accepts values from several threads", "[sender_receiver]") {
    recompose::SenderReceiverState<int> state;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&state] {
            for (int i = 0; i < 250; ++i) { state.enqueue(i); }
        });
    }
    for (auto &producer : producers) { producer.join(); }
    REQUIRE(state.size() == 1000);
}
