#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "config.hpp"
#include "endpoint.hpp"
#include "url.hpp"

namespace poolhttp {

    /**
     * @brief Identity of a per-origin pool: the normalized origin plus
     * every setting that makes two connections incompatible.
     */
    struct PoolKey {
        Endpoint endpoint;
        ConnectionOptions options;
        std::size_t maxsize{1};
        bool block{false};

        friend bool operator==(const PoolKey&, const PoolKey&) = default;
    };

    inline PoolKey make_pool_key(const UrlComponents& url,
                                 const ConnectionOptions& options,
                                 const PoolConfiguration& pool) {
        PoolKey key;
        key.endpoint = endpoint_from_url(url);
        key.options = options;
        key.maxsize = pool.maxsize;
        key.block = pool.block;
        return key;
    }

}  // namespace poolhttp

namespace std {
    template <>
    struct hash<poolhttp::PoolKey> {
        size_t operator()(poolhttp::PoolKey const& k) const noexcept {
            using poolhttp::detail::fnv_mix;
            size_t h = hash<poolhttp::Endpoint>{}(k.endpoint);
            auto mix_opt = [&](const std::optional<std::string>& s) {
                fnv_mix(h, static_cast<size_t>(s.has_value()));
                if (s) fnv_mix(h, std::string_view(*s));
            };
            const auto& o = k.options;
            fnv_mix(h, static_cast<size_t>(o.connect_timeout.count()));
            fnv_mix(h, static_cast<size_t>(o.read_timeout.count()));
            fnv_mix(h, static_cast<size_t>(o.verify_tls));
            mix_opt(o.ca_file);
            mix_opt(o.ca_path);
            mix_opt(o.cert_file);
            mix_opt(o.key_file);
            mix_opt(o.server_hostname);
            mix_opt(o.proxy_url);
            fnv_mix(h, static_cast<size_t>(o.tcp_nodelay));
            fnv_mix(h, o.blocksize);
            fnv_mix(h, o.max_body_bytes);
            fnv_mix(h, k.maxsize);
            fnv_mix(h, static_cast<size_t>(k.block));
            return h;
        }
    };
}  // namespace std
