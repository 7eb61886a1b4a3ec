#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "poolhttp/config.hpp"
#include "poolhttp/connection/connection.hpp"
#include "poolhttp/connection/connection_pool_types.hpp"
#include "poolhttp/pool_key.hpp"
#include "poolhttp/result.hpp"

namespace poolhttp {

    /**
     * Thread-safe bounded pool of connections to one origin.
     *
     * SAFETY:
     * - All public methods are thread-safe and can be called from any thread
     * - One mutex guards the idle store and the checked-out counter; it is
     *   never held across connect/send/receive or the liveness probe
     *
     * INVARIANTS:
     * 1. idle.size() + checked_out <= maxsize
     * 2. A connection is either idle (owned by the pool) or held by exactly
     *    one Lease, never both
     * 3. Once closed, no connection is created or parked again
     *
     * ERRORS:
     * - PoolExhausted: pool at capacity and either non-blocking or the
     *   timeout elapsed
     * - PoolClosed: close_all() ran before or while waiting
     *
     * LIFECYCLE:
     * 1. Construction (through create()): pool is open and empty
     * 2. Operation: connections are created lazily, unconnected, and parked
     *    on release
     * 3. close_all(): idle connections are closed, waiters are woken with
     *    PoolClosed, checked-out connections close on release
     */
    class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
       public:
        using clock = std::chrono::steady_clock;

        /**
         * @brief Exclusive, move-only handle on a checked-out connection.
         *
         * Destroying (or reset()-ing) a lease gives the connection back:
         * parked if reusable, closed otherwise. If the pool is gone the
         * connection is closed.
         */
        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept { move_from(std::move(other)); }

            /// @brief Move lease from another
            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    move_from(std::move(other));
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            ~Lease() { reset(); }

            Connection* operator->() const noexcept { return get(); }

            Connection& operator*() const { return *get(); }

            /// @brief Get the underlying connection, or nullptr if empty
            Connection* get() const noexcept { return m_conn.get(); }

            explicit operator bool() const noexcept {
                return m_conn != nullptr;
            }

            /// @brief Close instead of parking when the lease is returned.
            void mark_bad() noexcept { m_bad = true; }

            bool is_bad() const noexcept { return m_bad; }

            /// @brief Return the connection now.
            void reset() noexcept;

           private:
            friend class ConnectionPool;

            Lease(std::weak_ptr<ConnectionPool> pool,
                  std::unique_ptr<Connection> conn)
                : m_pool(std::move(pool)), m_conn(std::move(conn)) {}

            void move_from(Lease&& other) noexcept {
                m_pool = std::move(other.m_pool);
                m_conn = std::move(other.m_conn);
                m_bad = other.m_bad;
                other.m_bad = false;
            }

            std::weak_ptr<ConnectionPool> m_pool;
            std::unique_ptr<Connection> m_conn;
            bool m_bad{false};
        };

        /// @brief Pools must be owned by a shared_ptr; leases hold a
        /// weak reference back to it.
        static std::shared_ptr<ConnectionPool> create(
            PoolKey key, PoolConfiguration cfg, ConnectionFactory factory);

        /// @throws std::invalid_argument if maxsize is 0 or the factory is
        /// empty.
        ConnectionPool(PoolKey key, PoolConfiguration cfg,
                       ConnectionFactory factory);

        ~ConnectionPool();

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        /**
         * @brief Check out a connection.
         *
         * Reuses the most recently parked idle connection that passes the
         * liveness probe; otherwise creates a new (unconnected) one while
         * under capacity. At capacity, a blocking pool waits for a release
         * until `timeout` (nullopt waits forever, zero fails at once); a
         * non-blocking pool fails immediately.
         */
        Result<Lease> acquire(std::optional<std::chrono::milliseconds> timeout);

        /// @brief acquire() with the configured pool_timeout.
        Result<Lease> acquire();

        /// @brief Never waits, even for a blocking pool.
        Result<Lease> try_acquire();

        /// @brief Give a connection back. Parked if reusable and the idle
        /// store has room, closed otherwise. Wakes one waiter.
        void release(Lease&& lease) noexcept;

        /// @brief Close and discard a connection that must not be reused.
        void invalidate(Lease&& lease) noexcept;

        /// @brief Close idle connections and refuse further acquisition.
        void close_all() noexcept;

        [[nodiscard]] PoolStats stats() const;

        ///@brief Access metrics for monitoring
        ConnectionPoolMetrics const& metrics() const noexcept {
            return m_metrics;
        }

        const PoolKey& key() const noexcept { return m_key; }

        const PoolConfiguration& config() const noexcept { return m_cfg; }

        bool is_closed() const;

       private:
        Result<Lease> acquire_impl(bool may_block,
                                   std::optional<clock::time_point> deadline);

        /// @brief Take back a connection from a lease.
        void return_connection(std::unique_ptr<Connection> conn,
                               bool keep) noexcept;

        /// @brief Give up a checked-out slot without parking anything.
        void discard_slot() noexcept;

        bool is_expired_(const Connection& conn,
                         clock::time_point now) const noexcept;

        /// @brief Check internal invariants, only in debug builds
        void check_invariants_locked_() const;

        PoolKey m_key;
        PoolConfiguration m_cfg;
        ConnectionFactory m_factory;

        mutable std::mutex m_mu;  ///< Guards everything below
        std::condition_variable m_cv;
        std::deque<std::unique_ptr<Connection>> m_idle;  ///< back() = newest
        std::size_t m_checked_out{0};
        std::size_t m_waiters{0};
        bool m_closed{false};

        ConnectionPoolMetrics m_metrics;
    };

}  // namespace poolhttp
