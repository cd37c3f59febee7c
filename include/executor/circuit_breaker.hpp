#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace sqlsandbox {

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

[[nodiscard]] inline constexpr const char* circuit_state_to_string(CircuitState s) {
    switch (s) {
        case CircuitState::CLOSED:    return "closed";
        case CircuitState::OPEN:      return "open";
        case CircuitState::HALF_OPEN: return "half_open";
    }
    return "unknown";
}

struct CircuitBreakerStats {
    CircuitState state = CircuitState::CLOSED;
    uint64_t success_count = 0;
    uint64_t failure_count = 0;
    uint64_t rejected_count = 0;
    std::chrono::system_clock::time_point last_failure;
    std::chrono::system_clock::time_point opened_at;
};

/**
 * @brief Circuit breaker in front of the job queue backend
 *
 * Three states:
 * - CLOSED:     Normal operation, all requests pass through
 * - OPEN:       Backend failing, reject immediately (caller fails over)
 * - HALF_OPEN:  Testing recovery, allow limited requests
 *
 * State transitions:
 * - CLOSED -> OPEN:      consecutive failures >= failure_threshold
 * - OPEN -> HALF_OPEN:   timeout elapsed
 * - HALF_OPEN -> CLOSED: successes >= success_threshold
 * - HALF_OPEN -> OPEN:   any failure
 */
class CircuitBreaker {
public:
    struct Config {
        uint32_t failure_threshold = 5;
        uint32_t success_threshold = 2;
        std::chrono::milliseconds timeout{10000};
        uint32_t half_open_max_calls = 1;
    };

    explicit CircuitBreaker(std::string name, const Config& config = Config{});

    /**
     * @return true if the call may proceed; false while the circuit is open
     */
    [[nodiscard]] bool allow_request();

    void record_success();
    void record_failure();

    [[nodiscard]] CircuitState get_state() const;
    [[nodiscard]] CircuitBreakerStats get_stats() const;

    /**
     * @brief Force reset to CLOSED state
     */
    void reset();

    [[nodiscard]] const std::string& name() const { return name_; }

    // Invoked after every transition, on the thread that caused it
    void set_on_state_change(std::function<void(CircuitState from, CircuitState to)> cb);

private:
    void trip();
    void attempt_reset();
    void close_circuit();
    void emit_transition(CircuitState from, CircuitState to);

    std::string name_;
    Config config_;

    std::atomic<CircuitState> state_{CircuitState::CLOSED};
    std::atomic<uint64_t> success_count_{0};
    std::atomic<uint64_t> failure_count_{0};
    std::atomic<uint64_t> half_open_calls_{0};
    std::atomic<uint64_t> rejected_count_{0};

    std::atomic<std::chrono::system_clock::time_point::rep> last_failure_time_{0};
    std::atomic<std::chrono::system_clock::time_point::rep> opened_time_{0};

    mutable std::mutex callback_mutex_;
    std::function<void(CircuitState, CircuitState)> on_state_change_;
};

} // namespace sqlsandbox
