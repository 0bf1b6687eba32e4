#include <catch2/catch_test_macros.hpp>

#include "distraction_counter.hpp"

#include <random>

namespace distraction_counter_tests {

TEST_CASE("Counter grows by the poll interval and decays by half of it", "[counter]") {
    DistractionCounter counter(10.0, 0.5);
    counter.OnObservation(false);
    counter.OnObservation(false);
    CHECK(counter.Seconds() == 20.0);

    counter.OnObservation(true);
    CHECK(counter.Seconds() == 15.0);

    counter.Reset();
    CHECK(counter.Seconds() == 0.0);
}

TEST_CASE("Counter never goes negative", "[counter][invariant]") {
    DistractionCounter counter(10.0, 0.5);
    for (int i = 0; i < 5; ++i) {
        counter.OnObservation(true);
        CHECK(counter.Seconds() == 0.0);
    }

    std::mt19937 rng(1234);
    std::bernoulli_distribution relevant(0.7);
    for (int i = 0; i < 2000; ++i) {
        counter.OnObservation(relevant(rng));
        REQUIRE(counter.Seconds() >= 0.0);
    }
}

TEST_CASE("Decay floors at zero from a partial value", "[counter]") {
    DistractionCounter counter(10.0, 0.8);
    counter.OnObservation(false);
    counter.OnObservation(true);
    CHECK(counter.Seconds() == 2.0);
    counter.OnObservation(true);
    CHECK(counter.Seconds() == 0.0);
}

} // namespace distraction_counter_tests
