#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <utility>

#include "../pool_key.hpp"  // PoolKey, Endpoint
#include "../request.hpp"   // PreparedRequest
#include "../response.hpp"  // Response
#include "../result.hpp"    // Result, VoidResult, Error

namespace poolhttp {

    /**
     * @brief One logical link to a single origin.
     *
     * A Connection is created unconnected by its pool, opened lazily on first
     * use and closed on error, protocol violation or pool eviction. A closed
     * connection is never reopened by the pool; a fresh object is created
     * instead.
     *
     * Implementations provide the transport (see TcpConnection). They are
     * used by one thread at a time; the pool serializes hand-out.
     */
    class Connection {
       public:
        using clock = std::chrono::steady_clock;

        explicit Connection(PoolKey key)
            : m_key(std::move(key)),
              m_created(clock::now()),
              m_last_used(m_created) {}

        virtual ~Connection() = default;

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        /**
         * @brief Establish the transport (resolve, TCP, proxy tunnel, TLS).
         * @return Connect-phase errors only: nothing has been sent yet.
         */
        virtual VoidResult connect() = 0;

        /**
         * @brief Write one request. Fails with a read-phase error.
         */
        virtual VoidResult send(const PreparedRequest& request) = 0;

        /**
         * @brief Read the response to the last request sent.
         */
        virtual Result<Response> receive() = 0;

        /** @brief True while a transport handle is open. */
        virtual bool is_connected() const noexcept = 0;

        /**
         * @brief Non-blocking liveness probe for idle connections. True if
         * the peer closed the transport or sent unsolicited bytes.
         */
        virtual bool is_dropped() const noexcept = 0;

        /** @brief False after "Connection: close" or any I/O failure. */
        virtual bool is_reusable() const noexcept = 0;

        /** @brief True if the TLS peer certificate was verified. */
        virtual bool is_verified() const noexcept = 0;

        /** @brief Release the transport handle. Idempotent. */
        virtual void close() noexcept = 0;

        /**
         * @brief Connect if needed, then send and receive one exchange.
         */
        Result<Response> request(const PreparedRequest& preq) {
            if (!is_connected()) {
                auto c = connect();
                if (c.has_error()) return Result<Response>::err(c.error());
            }

            auto s = send(preq);
            if (s.has_error()) return Result<Response>::err(s.error());

            auto r = receive();
            touch();
            return r;
        }

        const PoolKey& key() const noexcept { return m_key; }

        const Endpoint& endpoint() const noexcept { return m_key.endpoint; }

        clock::time_point created_at() const noexcept { return m_created; }

        clock::time_point last_used() const noexcept { return m_last_used; }

        void touch() noexcept { m_last_used = clock::now(); }

        std::size_t reuse_count() const noexcept { return m_reuse_count; }

        void mark_reused() noexcept { ++m_reuse_count; }

       private:
        PoolKey m_key;
        clock::time_point m_created;
        clock::time_point m_last_used;
        std::size_t m_reuse_count{0};
    };

}  // namespace poolhttp
