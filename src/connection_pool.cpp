#include "poolhttp/connection/connection_pool.hpp"

#include <spdlog/spdlog.h>

#include <cassert>
#include <exception>
#include <stdexcept>
#include <utility>

namespace poolhttp {

    // -------------------------
    // Lease
    // -------------------------

    void ConnectionPool::Lease::reset() noexcept {
        if (!m_conn) return;

        // If the pool is already gone, nobody will park this connection.
        if (auto pool = m_pool.lock()) {
            pool->return_connection(std::move(m_conn), !m_bad);
        } else {
            m_conn->close();
        }
        m_conn.reset();
        m_pool.reset();
        m_bad = false;
    }

    // -------------------------
    // ConnectionPool
    // -------------------------

    std::shared_ptr<ConnectionPool> ConnectionPool::create(
        PoolKey key, PoolConfiguration cfg, ConnectionFactory factory) {
        return std::make_shared<ConnectionPool>(std::move(key), std::move(cfg),
                                                std::move(factory));
    }

    ConnectionPool::ConnectionPool(PoolKey key, PoolConfiguration cfg,
                                   ConnectionFactory factory)
        : m_key(std::move(key)),
          m_cfg(std::move(cfg)),
          m_factory(std::move(factory)) {
        if (m_cfg.maxsize == 0) {
            throw std::invalid_argument("Pool maxsize must be at least 1");
        }
        if (!m_factory) {
            throw std::invalid_argument("Pool needs a connection factory");
        }
    }

    ConnectionPool::~ConnectionPool() { close_all(); }

    Result<ConnectionPool::Lease> ConnectionPool::acquire(
        std::optional<std::chrono::milliseconds> timeout) {
        std::optional<clock::time_point> deadline;
        if (timeout) deadline = clock::now() + *timeout;
        return acquire_impl(m_cfg.block, deadline);
    }

    Result<ConnectionPool::Lease> ConnectionPool::acquire() {
        return acquire(m_cfg.pool_timeout);
    }

    Result<ConnectionPool::Lease> ConnectionPool::try_acquire() {
        return acquire_impl(false, std::nullopt);
    }

    Result<ConnectionPool::Lease> ConnectionPool::acquire_impl(
        bool may_block, std::optional<clock::time_point> deadline) {
        for (;;) {
            std::unique_ptr<Connection> conn;
            bool create_new = false;

            {
                std::unique_lock<std::mutex> lk(m_mu);
                for (;;) {
                    if (m_closed) {
                        m_metrics.acquire_closed.fetch_add(
                            1, std::memory_order_relaxed);
                        return Result<Lease>::err(
                            ErrorCode::PoolClosed,
                            "Pool for " + to_string(m_key.endpoint) +
                                " is closed");
                    }

                    // Prefer the most recently parked connection
                    if (!m_idle.empty()) {
                        conn = std::move(m_idle.back());
                        m_idle.pop_back();
                        ++m_checked_out;
                        break;
                    }

                    if (m_checked_out < m_cfg.maxsize) {
                        ++m_checked_out;  // reserve the slot
                        create_new = true;
                        break;
                    }

                    if (!may_block) {
                        m_metrics.acquire_exhausted.fetch_add(
                            1, std::memory_order_relaxed);
                        return Result<Lease>::err(
                            ErrorCode::PoolExhausted,
                            "Pool for " + to_string(m_key.endpoint) +
                                " is full and non-blocking");
                    }

                    if (deadline && clock::now() >= *deadline) {
                        m_metrics.acquire_timeout.fetch_add(
                            1, std::memory_order_relaxed);
                        return Result<Lease>::err(
                            ErrorCode::PoolExhausted,
                            "Timed out waiting for a connection to " +
                                to_string(m_key.endpoint));
                    }

                    ++m_waiters;
                    if (deadline) {
                        m_cv.wait_until(lk, *deadline);
                    } else {
                        m_cv.wait(lk);
                    }
                    --m_waiters;
                }
                check_invariants_locked_();
            }

            if (create_new) {
                try {
                    conn = m_factory(m_key);
                } catch (const std::exception& e) {
                    discard_slot();
                    return Result<Lease>::err(
                        ErrorCode::ConnectionFailed,
                        std::string("Connection factory failed: ") + e.what());
                }
                if (!conn) {
                    discard_slot();
                    return Result<Lease>::err(
                        ErrorCode::ConnectionFailed,
                        "Connection factory returned no connection");
                }

                m_metrics.connection_created.fetch_add(
                    1, std::memory_order_relaxed);
                m_metrics.acquire_success.fetch_add(1,
                                                    std::memory_order_relaxed);
                SPDLOG_DEBUG("Starting new connection to {}",
                             to_string(m_key.endpoint));
                return Result<Lease>::ok(Lease(weak_from_this(),
                                               std::move(conn)));
            }

            // Liveness and age checks run outside the lock.
            if (is_expired_(*conn, clock::now())) {
                SPDLOG_DEBUG("Closing expired idle connection to {}",
                             to_string(m_key.endpoint));
                conn->close();
                m_metrics.connection_expired.fetch_add(
                    1, std::memory_order_relaxed);
                discard_slot();
                continue;
            }

            if (conn->is_dropped()) {
                SPDLOG_DEBUG("Idle connection to {} was dropped, discarding",
                             to_string(m_key.endpoint));
                conn->close();
                m_metrics.connection_dropped.fetch_add(
                    1, std::memory_order_relaxed);
                discard_slot();
                continue;
            }

            conn->mark_reused();
            m_metrics.connection_reused.fetch_add(1,
                                                  std::memory_order_relaxed);
            m_metrics.acquire_success.fetch_add(1, std::memory_order_relaxed);
            return Result<Lease>::ok(Lease(weak_from_this(), std::move(conn)));
        }
    }

    void ConnectionPool::release(Lease&& lease) noexcept {
        if (!lease) return;

        // A lease from another pool goes home by itself.
        if (lease.m_pool.lock().get() != this) {
            lease.reset();
            return;
        }

        const bool keep = !lease.m_bad;
        auto conn = std::move(lease.m_conn);
        lease.m_pool.reset();
        lease.m_bad = false;
        return_connection(std::move(conn), keep);
    }

    void ConnectionPool::invalidate(Lease&& lease) noexcept {
        lease.mark_bad();
        release(std::move(lease));
    }

    void ConnectionPool::return_connection(std::unique_ptr<Connection> conn,
                                           bool keep) noexcept {
        if (!conn) return;

        std::unique_ptr<Connection> to_close;
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_checked_out > 0) --m_checked_out;

            if (!keep) {
                m_metrics.connection_invalidated.fetch_add(
                    1, std::memory_order_relaxed);
                to_close = std::move(conn);
            } else if (m_closed || !conn->is_reusable()) {
                to_close = std::move(conn);
            } else if (m_idle.size() >= m_cfg.maxsize) {
                m_metrics.discarded_on_full.fetch_add(
                    1, std::memory_order_relaxed);
                SPDLOG_WARN(
                    "Connection pool is full, discarding connection: {}. "
                    "Connection pool size: {}",
                    to_string(m_key.endpoint), m_cfg.maxsize);
                to_close = std::move(conn);
            } else {
                conn->touch();
                m_idle.push_back(std::move(conn));
            }
            check_invariants_locked_();
        }

        // Wake one waiter: either a connection or a slot is now free.
        m_cv.notify_one();

        if (to_close) to_close->close();
    }

    void ConnectionPool::discard_slot() noexcept {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_checked_out > 0) --m_checked_out;
        }
        m_cv.notify_one();
    }

    void ConnectionPool::close_all() noexcept {
        std::deque<std::unique_ptr<Connection>> idle;
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_closed = true;
            idle.swap(m_idle);
        }
        m_cv.notify_all();

        if (!idle.empty()) {
            SPDLOG_DEBUG("Closing {} idle connection(s) to {}", idle.size(),
                         to_string(m_key.endpoint));
        }
        for (auto& c : idle) c->close();
    }

    PoolStats ConnectionPool::stats() const {
        std::lock_guard<std::mutex> lk(m_mu);
        PoolStats out;
        out.idle = m_idle.size();
        out.checked_out = m_checked_out;
        out.maxsize = m_cfg.maxsize;
        out.waiters = m_waiters;
        out.closed = m_closed;
        return out;
    }

    bool ConnectionPool::is_closed() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_closed;
    }

    bool ConnectionPool::is_expired_(const Connection& conn,
                                     clock::time_point now) const noexcept {
        if (m_cfg.connection_idle_ttl.count() > 0 &&
            now - conn.last_used() > m_cfg.connection_idle_ttl)
            return true;
        if (m_cfg.max_connection_age.count() > 0 &&
            now - conn.created_at() > m_cfg.max_connection_age)
            return true;
        return false;
    }

    void ConnectionPool::check_invariants_locked_() const {
#ifndef NDEBUG
        assert(m_idle.size() + m_checked_out <= m_cfg.maxsize &&
               "idle + checked_out exceeds maxsize");
        for (auto const& c : m_idle) {
            assert(c && "idle connection is null");
        }
#endif
    }

}  // namespace poolhttp
