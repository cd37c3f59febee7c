#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace sqlsandbox {

/**
 * @brief Graceful shutdown: stop admitting work, then drain in-flight requests
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    /**
     * @brief RAII in-flight marker; admitted() is false once shutdown began
     */
    class RequestGuard {
    public:
        explicit RequestGuard(ShutdownCoordinator& coordinator)
            : coordinator_(coordinator), admitted_(coordinator.try_enter_request()) {}
        ~RequestGuard() {
            if (admitted_) coordinator_.leave_request();
        }
        RequestGuard(const RequestGuard&) = delete;
        RequestGuard& operator=(const RequestGuard&) = delete;

        [[nodiscard]] bool admitted() const { return admitted_; }

    private:
        ShutdownCoordinator& coordinator_;
        bool admitted_;
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    /// Idempotent; wakes wait_for_shutdown() and wait_for_drain()
    void initiate_shutdown();

    /// Called at start of each request. Returns false if shutting down.
    [[nodiscard]] bool try_enter_request();
    void leave_request();

    /// Blocks until initiate_shutdown() or the timeout; true if shutting down
    bool wait_for_shutdown(std::chrono::milliseconds timeout);

    /// Blocks until all in-flight requests complete or shutdown_timeout.
    /// Returns true if drained cleanly, false if timed out.
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_acquire);
    }

private:
    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace sqlsandbox
