#include "executor/circuit_breaker.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlsandbox {

namespace {

std::chrono::system_clock::time_point from_rep(std::chrono::system_clock::time_point::rep rep) {
    return std::chrono::system_clock::time_point(std::chrono::system_clock::duration(rep));
}

} // anonymous namespace

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)), config_(config) {
    if (config_.failure_threshold == 0) config_.failure_threshold = 1;
    if (config_.success_threshold == 0) config_.success_threshold = 1;
    if (config_.half_open_max_calls == 0) config_.half_open_max_calls = 1;
}

bool CircuitBreaker::allow_request() {
    const CircuitState current_state = state_.load(std::memory_order_acquire);

    switch (current_state) {
        case CircuitState::CLOSED:
            return true;

        case CircuitState::OPEN: {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now() - from_rep(opened_time_.load(std::memory_order_acquire)));
            if (elapsed >= config_.timeout) {
                attempt_reset();
                // Falls through to the HALF_OPEN admission check
                return allow_request();
            }
            rejected_count_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        case CircuitState::HALF_OPEN: {
            // Limited number of probe calls
            uint64_t calls = half_open_calls_.load(std::memory_order_acquire);
            while (calls < config_.half_open_max_calls) {
                if (half_open_calls_.compare_exchange_weak(calls, calls + 1,
                                                           std::memory_order_acq_rel)) {
                    return true;
                }
            }
            rejected_count_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
    }

    return false;
}

void CircuitBreaker::record_success() {
    const CircuitState current_state = state_.load(std::memory_order_acquire);

    if (current_state == CircuitState::HALF_OPEN) {
        if (half_open_calls_.load(std::memory_order_acquire) > 0) {
            half_open_calls_.fetch_sub(1, std::memory_order_acq_rel);
        }
        const uint64_t successes = success_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (successes >= config_.success_threshold) {
            close_circuit();
        }
    } else if (current_state == CircuitState::CLOSED) {
        // Only consecutive failures trip the circuit
        failure_count_.store(0, std::memory_order_relaxed);
    }
}

void CircuitBreaker::record_failure() {
    const CircuitState current_state = state_.load(std::memory_order_acquire);

    last_failure_time_.store(std::chrono::system_clock::now().time_since_epoch().count(),
                             std::memory_order_release);

    if (current_state == CircuitState::HALF_OPEN) {
        trip();
    } else if (current_state == CircuitState::CLOSED) {
        const uint64_t failures = failure_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (failures >= config_.failure_threshold) {
            trip();
        }
    }
}

CircuitState CircuitBreaker::get_state() const {
    return state_.load(std::memory_order_acquire);
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    CircuitBreakerStats stats;
    stats.state = state_.load(std::memory_order_acquire);
    stats.success_count = success_count_.load(std::memory_order_relaxed);
    stats.failure_count = failure_count_.load(std::memory_order_relaxed);
    stats.rejected_count = rejected_count_.load(std::memory_order_relaxed);

    const auto last_failure_rep = last_failure_time_.load(std::memory_order_acquire);
    if (last_failure_rep > 0) stats.last_failure = from_rep(last_failure_rep);

    const auto opened_rep = opened_time_.load(std::memory_order_acquire);
    if (opened_rep > 0) stats.opened_at = from_rep(opened_rep);

    return stats;
}

void CircuitBreaker::reset() {
    const auto from = state_.exchange(CircuitState::CLOSED, std::memory_order_acq_rel);
    success_count_.store(0, std::memory_order_relaxed);
    failure_count_.store(0, std::memory_order_relaxed);
    half_open_calls_.store(0, std::memory_order_relaxed);
    last_failure_time_.store(0, std::memory_order_relaxed);
    opened_time_.store(0, std::memory_order_relaxed);
    if (from != CircuitState::CLOSED) emit_transition(from, CircuitState::CLOSED);
}

void CircuitBreaker::set_on_state_change(std::function<void(CircuitState, CircuitState)> cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_state_change_ = std::move(cb);
}

void CircuitBreaker::emit_transition(CircuitState from, CircuitState to) {
    utils::log::warn(std::format("Circuit breaker '{}': {} -> {}",
        name_, circuit_state_to_string(from), circuit_state_to_string(to)));

    std::function<void(CircuitState, CircuitState)> cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = on_state_change_;
    }
    if (cb) cb(from, to);
}

void CircuitBreaker::trip() {
    const auto now_rep = std::chrono::system_clock::now().time_since_epoch().count();

    CircuitState expected = CircuitState::CLOSED;
    if (state_.compare_exchange_strong(expected, CircuitState::OPEN,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        opened_time_.store(now_rep, std::memory_order_release);
        emit_transition(CircuitState::CLOSED, CircuitState::OPEN);
        return;
    }

    // Failure during recovery
    expected = CircuitState::HALF_OPEN;
    if (state_.compare_exchange_strong(expected, CircuitState::OPEN,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        opened_time_.store(now_rep, std::memory_order_release);
        half_open_calls_.store(0, std::memory_order_relaxed);
        emit_transition(CircuitState::HALF_OPEN, CircuitState::OPEN);
    }
}

void CircuitBreaker::attempt_reset() {
    CircuitState expected = CircuitState::OPEN;
    if (state_.compare_exchange_strong(expected, CircuitState::HALF_OPEN,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        success_count_.store(0, std::memory_order_relaxed);
        failure_count_.store(0, std::memory_order_relaxed);
        half_open_calls_.store(0, std::memory_order_relaxed);
        emit_transition(CircuitState::OPEN, CircuitState::HALF_OPEN);
    }
}

void CircuitBreaker::close_circuit() {
    CircuitState expected = CircuitState::HALF_OPEN;
    if (state_.compare_exchange_strong(expected, CircuitState::CLOSED,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        success_count_.store(0, std::memory_order_relaxed);
        failure_count_.store(0, std::memory_order_relaxed);
        half_open_calls_.store(0, std::memory_order_relaxed);
        emit_transition(CircuitState::HALF_OPEN, CircuitState::CLOSED);
    }
}

} // namespace sqlsandbox
