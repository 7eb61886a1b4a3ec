#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace poolhttp {

    /// @brief Point-in-time view of a pool's bookkeeping.
    struct PoolStats {
        std::size_t idle{0};         ///< Connections parked in the pool
        std::size_t checked_out{0};  ///< Connections held by callers
        std::size_t maxsize{0};      ///< Capacity
        std::size_t waiters{0};      ///< Callers blocked in acquire()
        bool closed{false};          ///< close_all() was called
    };

    /// @brief Metrics for monitoring connection pool behavior
    struct ConnectionPoolMetrics {
        // Counters (cumulative)
        std::atomic<std::uint64_t> acquire_success{0};  ///< Successful acquires
        std::atomic<std::uint64_t> acquire_timeout{0};  ///< Acquire timed out
        std::atomic<std::uint64_t> acquire_exhausted{
            0};  ///< Non-blocking acquire found the pool full
        std::atomic<std::uint64_t> acquire_closed{0};  ///< Pool was closed
        std::atomic<std::uint64_t> connection_created{0};  ///< New connections
        std::atomic<std::uint64_t> connection_reused{0};   ///< Reused idle
        std::atomic<std::uint64_t> connection_dropped{
            0};  ///< Idle connection found dead by the liveness probe
        std::atomic<std::uint64_t> connection_expired{
            0};  ///< Idle connection past idle TTL or max age
        std::atomic<std::uint64_t> connection_invalidated{
            0};  ///< Closed by invalidate() or a bad lease
        std::atomic<std::uint64_t> discarded_on_full{
            0};  ///< Released while the idle store was full
    };

}  // namespace poolhttp
