#include <catch2/catch_test_macros.hpp>
#include "telemon/bounded_history.hpp"
#include <memory>
#include <stdexcept>

TEST_CASE("BoundedHistory evicts oldest entries first", "[history]") {
    telemon::BoundedHistory<int> history(3);

    SECTION("Grows until capacity") {
        history.push(1);
        history.push(2);
        REQUIRE(history.size() == 2);
        REQUIRE(history.front() == 1);
        REQUIRE(history.back() == 2);
    }

    SECTION("Keeps the most recent entries in order") {
        for (int i = 1; i <= 10; ++i) {
            history.push(i);
        }
        REQUIRE(history.size() == 3);
        REQUIRE(history.to_vector() == (std::vector<int>{8, 9, 10}));
    }
}

TEST_CASE("BoundedHistory holds move-only values", "[history]") {
    telemon::BoundedHistory<std::unique_ptr<int>> history(2);
    history.push(std::make_unique<int>(1));
    history.push(std::make_unique<int>(2));
    history.push(std::make_unique<int>(3));

    REQUIRE(history.size() == 2);
    REQUIRE(*history.front() == 2);
    REQUIRE(*history.back() == 3);
}

TEST_CASE("BoundedHistory rejects zero capacity", "[history]") {
    REQUIRE_THROWS_AS(telemon::BoundedHistory<int>(0), std::invalid_argument);
}
