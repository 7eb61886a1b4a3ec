#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "connection/connection_pool.hpp"
#include "lru_cache.hpp"
#include "pool_key.hpp"
#include "result.hpp"
#include "url.hpp"

namespace poolhttp {

    /**
     * @brief Registry of per-origin pools, bounded by num_pools.
     *
     * Pools are created on first use and evicted least-recently-used; an
     * evicted pool is closed before the call that evicted it returns.
     * Thread-safe. One instance per client; there is no process-wide
     * default.
     */
    class PoolManager {
       public:
        using PoolPtr = std::shared_ptr<ConnectionPool>;

        /// @throws std::invalid_argument for num_pools or pool maxsize of
        /// 0, or a Custom backend without a connection_factory.
        explicit PoolManager(ClientConfiguration cfg = {});

        ~PoolManager();

        PoolManager(const PoolManager&) = delete;
        PoolManager& operator=(const PoolManager&) = delete;

        /// @brief Pool for `key`, created (and the LRU pool evicted) if
        /// needed.
        PoolPtr get_or_create(const PoolKey& key);

        /// @brief Pool for the origin of an absolute URL.
        Result<PoolPtr> connection_from_url(std::string_view url);

        /// @brief Pool for parsed URL components.
        PoolPtr connection_from_url(const UrlComponents& url);

        /// @brief Pool for scheme ("http"/"https"), host and optional port.
        Result<PoolPtr> connection_from_host(
            std::string_view scheme, std::string_view host,
            std::optional<std::uint16_t> port = std::nullopt);

        /// @brief Key the manager would use for a URL.
        PoolKey key_for(const UrlComponents& url) const;

        /// @brief Evict and close every pool.
        void clear();

        std::size_t size() const;

        /// @brief Resident keys, least recently used first.
        std::vector<PoolKey> keys() const;

        const ClientConfiguration& config() const noexcept { return m_cfg; }

       private:
        ConnectionFactory make_factory() const;

        ClientConfiguration m_cfg;

        mutable std::mutex m_mu;
        RecentlyUsedContainer<PoolKey, PoolPtr> m_pools;
    };

}  // namespace poolhttp
