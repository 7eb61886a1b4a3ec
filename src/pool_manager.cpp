#include "poolhttp/pool_manager.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <stdexcept>
#include <utility>

#include "poolhttp/connection/tcp_connection.hpp"
#include "poolhttp/headers.hpp"

namespace poolhttp {

    namespace {
        std::size_t checked_num_pools(const ClientConfiguration& cfg) {
            if (cfg.num_pools == 0) {
                throw std::invalid_argument("num_pools must be at least 1");
            }
            return cfg.num_pools;
        }
    }  // namespace

    PoolManager::PoolManager(ClientConfiguration cfg)
        : m_cfg(std::move(cfg)), m_pools(checked_num_pools(m_cfg)) {
        if (m_cfg.pool.maxsize == 0) {
            throw std::invalid_argument("Pool maxsize must be at least 1");
        }
        if (m_cfg.backend == ConnectionBackend::Custom &&
            !m_cfg.connection_factory) {
            throw std::invalid_argument(
                "Custom connection backend requires a connection_factory");
        }
    }

    PoolManager::~PoolManager() { clear(); }

    ConnectionFactory PoolManager::make_factory() const {
        switch (m_cfg.backend) {
            case ConnectionBackend::Custom:
                return m_cfg.connection_factory;
            case ConnectionBackend::Beast:
            default:
                return make_tcp_connection_factory();
        }
    }

    PoolManager::PoolPtr PoolManager::get_or_create(const PoolKey& key) {
        PoolPtr created;
        PoolPtr evicted;
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (auto* hit = m_pools.get(key)) return *hit;

            PoolConfiguration pool_cfg = m_cfg.pool;
            pool_cfg.maxsize = key.maxsize;
            pool_cfg.block = key.block;
            created = ConnectionPool::create(key, pool_cfg, make_factory());

            if (auto out = m_pools.insert(key, created)) {
                evicted = std::move(*out);
            }
        }

        // Close outside the registry lock, but before returning.
        if (evicted) {
            SPDLOG_DEBUG("Evicting pool for {}",
                         to_string(evicted->key().endpoint));
            evicted->close_all();
        }
        return created;
    }

    PoolKey PoolManager::key_for(const UrlComponents& url) const {
        return make_pool_key(url, m_cfg.connection, m_cfg.pool);
    }

    PoolManager::PoolPtr PoolManager::connection_from_url(
        const UrlComponents& url) {
        return get_or_create(key_for(url));
    }

    Result<PoolManager::PoolPtr> PoolManager::connection_from_url(
        std::string_view url) {
        auto parsed = parse_url(std::string(url));
        if (parsed.has_error()) return Result<PoolPtr>::err(parsed.error());
        return Result<PoolPtr>::ok(connection_from_url(parsed.value()));
    }

    Result<PoolManager::PoolPtr> PoolManager::connection_from_host(
        std::string_view scheme, std::string_view host,
        std::optional<std::uint16_t> port) {
        UrlComponents u;
        const std::string s = header_utils::to_lower(scheme);
        if (s == "https") {
            u.https = true;
        } else if (s == "http") {
            u.https = false;
        } else {
            return Result<PoolPtr>::err(
                ErrorCode::InvalidUrl,
                "Unsupported scheme: " + std::string(scheme));
        }
        if (host.empty()) {
            return Result<PoolPtr>::err(ErrorCode::InvalidUrl, "Empty host");
        }
        u.host = std::string(host);
        u.port = port ? std::to_string(*port) : url_utils::default_port(u.https);
        u.target = "/";
        return Result<PoolPtr>::ok(connection_from_url(u));
    }

    void PoolManager::clear() {
        std::vector<PoolPtr> pools;
        {
            std::lock_guard<std::mutex> lk(m_mu);
            pools = m_pools.clear();
        }
        for (auto& p : pools) {
            if (p) p->close_all();
        }
    }

    std::size_t PoolManager::size() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_pools.size();
    }

    std::vector<PoolKey> PoolManager::keys() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_pools.keys();
    }

}  // namespace poolhttp
