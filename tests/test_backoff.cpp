#include <catch2/catch.hpp>

#include "tailroute/backoff.hpp"

using namespace tailroute;

TEST_CASE("Backoff doubles per failure up to the maximum") {
    ExponentialBackoff backoff{Duration{1000}, Duration{8000}};

    REQUIRE(backoff.current_delay() == Duration{1000});
    REQUIRE(backoff.record_failure() == Duration{1000});
    REQUIRE(backoff.record_failure() == Duration{2000});
    REQUIRE(backoff.record_failure() == Duration{4000});
    REQUIRE(backoff.record_failure() == Duration{8000});
    REQUIRE(backoff.record_failure() == Duration{8000});
    REQUIRE(backoff.consecutive_failures() == 5);
}

TEST_CASE("Success resets the backoff") {
    ExponentialBackoff backoff{Duration{500}, Duration{60000}};
    (void)backoff.record_failure();
    (void)backoff.record_failure();
    REQUIRE(backoff.current_delay() == Duration{1000});

    backoff.reset();
    REQUIRE(backoff.consecutive_failures() == 0);
    REQUIRE(backoff.current_delay() == Duration{500});
}

TEST_CASE("Maximum below the base is raised to the base") {
    ExponentialBackoff backoff{Duration{30000}, Duration{1000}};
    REQUIRE(backoff.record_failure() == Duration{30000});
    REQUIRE(backoff.record_failure() == Duration{30000});
}

TEST_CASE("Long outages stay capped") {
    ExponentialBackoff backoff{Duration{30000}, Duration{300000}};
    for (int attempt = 0; attempt < 100; ++attempt) {
        (void)backoff.record_failure();
    }
    REQUIRE(backoff.current_delay() == Duration{300000});
}
