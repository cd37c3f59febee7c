#include <catch2/catch_test_macros.hpp>
#include "executor/circuit_breaker.hpp"

#include <thread>
#include <utility>
#include <vector>

using namespace sqlsandbox;

using Transition = std::pair<CircuitState, CircuitState>;

TEST_CASE("CircuitBreaker: consecutive failures trip the circuit", "[circuit_breaker]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 3;
    cfg.timeout = std::chrono::milliseconds(5000);
    CircuitBreaker cb("queue", cfg);

    std::vector<Transition> captured;
    cb.set_on_state_change([&](CircuitState from, CircuitState to) {
        captured.emplace_back(from, to);
    });

    cb.record_failure();
    cb.record_failure();
    CHECK(cb.get_state() == CircuitState::CLOSED);
    CHECK(cb.allow_request());

    cb.record_failure();
    CHECK(cb.get_state() == CircuitState::OPEN);
    CHECK_FALSE(cb.allow_request());
    CHECK(cb.get_stats().rejected_count == 1);

    REQUIRE(captured.size() == 1);
    CHECK(captured[0] == Transition{CircuitState::CLOSED, CircuitState::OPEN});
    CHECK(cb.name() == "queue");
}

TEST_CASE("CircuitBreaker: a success resets the failure streak", "[circuit_breaker]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 2;
    CircuitBreaker cb("queue", cfg);

    cb.record_failure();
    cb.record_success();
    cb.record_failure();
    CHECK(cb.get_state() == CircuitState::CLOSED);

    cb.record_failure();
    CHECK(cb.get_state() == CircuitState::OPEN);
}

TEST_CASE("CircuitBreaker: full cycle through half-open", "[circuit_breaker]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 2;
    cfg.success_threshold = 1;
    cfg.timeout = std::chrono::milliseconds(10);
    cfg.half_open_max_calls = 5;
    CircuitBreaker cb("cycle", cfg);

    std::vector<Transition> captured;
    cb.set_on_state_change([&](CircuitState from, CircuitState to) {
        captured.emplace_back(from, to);
    });

    cb.record_failure();
    cb.record_failure();
    CHECK(cb.get_state() == CircuitState::OPEN);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    // OPEN -> HALF_OPEN on the next admission check
    CHECK(cb.allow_request());
    CHECK(cb.get_state() == CircuitState::HALF_OPEN);

    cb.record_success();
    CHECK(cb.get_state() == CircuitState::CLOSED);

    REQUIRE(captured.size() == 3);
    CHECK(captured[0] == Transition{CircuitState::CLOSED, CircuitState::OPEN});
    CHECK(captured[1] == Transition{CircuitState::OPEN, CircuitState::HALF_OPEN});
    CHECK(captured[2] == Transition{CircuitState::HALF_OPEN, CircuitState::CLOSED});
}

TEST_CASE("CircuitBreaker: failure while half-open reopens", "[circuit_breaker]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 2;
    cfg.success_threshold = 3;
    cfg.timeout = std::chrono::milliseconds(10);
    cfg.half_open_max_calls = 5;
    CircuitBreaker cb("recovery-fail", cfg);

    cb.record_failure();
    cb.record_failure();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(cb.allow_request());
    REQUIRE(cb.get_state() == CircuitState::HALF_OPEN);

    cb.record_success();
    cb.record_failure();
    CHECK(cb.get_state() == CircuitState::OPEN);
    CHECK_FALSE(cb.allow_request());
}

TEST_CASE("CircuitBreaker: half-open admits a limited number of probes", "[circuit_breaker]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    cfg.success_threshold = 2;
    cfg.timeout = std::chrono::milliseconds(10);
    cfg.half_open_max_calls = 1;
    CircuitBreaker cb("probe", cfg);

    cb.record_failure();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    CHECK(cb.allow_request());
    CHECK_FALSE(cb.allow_request());

    // A finished probe frees its slot
    cb.record_success();
    CHECK(cb.get_state() == CircuitState::HALF_OPEN);
    CHECK(cb.allow_request());
    cb.record_success();
    CHECK(cb.get_state() == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker: reset forces the circuit closed", "[circuit_breaker]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    CircuitBreaker cb("reset", cfg);

    std::vector<Transition> captured;
    cb.set_on_state_change([&](CircuitState from, CircuitState to) {
        captured.emplace_back(from, to);
    });

    cb.record_failure();
    REQUIRE(cb.get_state() == CircuitState::OPEN);
    CHECK(cb.get_stats().opened_at.time_since_epoch().count() > 0);

    cb.reset();
    CHECK(cb.get_state() == CircuitState::CLOSED);
    CHECK(cb.allow_request());
    CHECK(cb.get_stats().failure_count == 0);
    REQUIRE(captured.size() == 2);
    CHECK(captured[1] == Transition{CircuitState::OPEN, CircuitState::CLOSED});

    // Reset of a closed circuit is silent
    cb.reset();
    CHECK(captured.size() == 2);
}

TEST_CASE("CircuitBreaker: state names", "[circuit_breaker]") {
    CHECK(std::string(circuit_state_to_string(CircuitState::CLOSED)) == "closed");
    CHECK(std::string(circuit_state_to_string(CircuitState::OPEN)) == "open");
    CHECK(std::string(circuit_state_to_string(CircuitState::HALF_OPEN)) == "half_open");
}
