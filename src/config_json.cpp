#include "poolhttp/config_json.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>

#include "poolhttp/headers.hpp"
#include "poolhttp/http_method.hpp"

namespace poolhttp {

    namespace {

        using json = nlohmann::json;

        [[noreturn]] void bad_value(const std::string& key, const char* want) {
            throw std::invalid_argument("Configuration key '" + key +
                                        "' must be " + want);
        }

        const json* child(const json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end()) return nullptr;
            return &*it;
        }

        const json* object_child(const json& j, const char* key) {
            const json* c = child(j, key);
            if (c != nullptr && !c->is_object()) bad_value(key, "an object");
            return c;
        }

        void read(const json& j, const char* key, bool& out) {
            if (const json* v = child(j, key)) {
                if (!v->is_boolean()) bad_value(key, "a boolean");
                out = v->get<bool>();
            }
        }

        void read(const json& j, const char* key, std::string& out) {
            if (const json* v = child(j, key)) {
                if (!v->is_string()) bad_value(key, "a string");
                out = v->get<std::string>();
            }
        }

        void read(const json& j, const char* key,
                  std::optional<std::string>& out) {
            if (const json* v = child(j, key)) {
                if (v->is_null()) {
                    out.reset();
                    return;
                }
                if (!v->is_string()) bad_value(key, "a string or null");
                out = v->get<std::string>();
            }
        }

        void read(const json& j, const char* key, std::size_t& out) {
            if (const json* v = child(j, key)) {
                if (!v->is_number_unsigned())
                    bad_value(key, "a non-negative integer");
                out = v->get<std::size_t>();
            }
        }

        void read(const json& j, const char* key, double& out) {
            if (const json* v = child(j, key)) {
                if (!v->is_number() || v->get<double>() < 0.0)
                    bad_value(key, "a non-negative number");
                out = v->get<double>();
            }
        }

        void read(const json& j, const char* key, Seconds& out) {
            double seconds = out.count();
            read(j, key, seconds);
            out = Seconds{seconds};
        }

        template <typename Duration>
        void read_ms(const json& j, const char* key, Duration& out) {
            if (const json* v = child(j, key)) {
                if (!v->is_number_unsigned())
                    bad_value(key, "a non-negative integer of milliseconds");
                out = std::chrono::duration_cast<Duration>(
                    std::chrono::milliseconds(v->get<std::int64_t>()));
            }
        }

        void read_ms(const json& j, const char* key,
                     std::optional<std::chrono::milliseconds>& out) {
            if (const json* v = child(j, key)) {
                if (v->is_null()) {
                    out.reset();
                    return;
                }
                std::chrono::milliseconds ms{0};
                read_ms(j, key, ms);
                out = ms;
            }
        }

        /// Retry budgets: integer, or null for unlimited.
        void read_budget(const json& j, const char* key,
                         std::optional<int>& out) {
            if (const json* v = child(j, key)) {
                if (v->is_null()) {
                    out.reset();
                    return;
                }
                if (!v->is_number_integer())
                    bad_value(key, "an integer or null");
                out = v->get<int>();
            }
        }

        void load_connection(const json& j, ConnectionOptions& out) {
            read_ms(j, "connect_timeout_ms", out.connect_timeout);
            read_ms(j, "read_timeout_ms", out.read_timeout);
            read(j, "verify_tls", out.verify_tls);
            read(j, "ca_file", out.ca_file);
            read(j, "ca_path", out.ca_path);
            read(j, "cert_file", out.cert_file);
            read(j, "key_file", out.key_file);
            read(j, "server_hostname", out.server_hostname);
            read(j, "proxy_url", out.proxy_url);
            read(j, "tcp_nodelay", out.tcp_nodelay);
            read(j, "blocksize", out.blocksize);
            read(j, "max_body_bytes", out.max_body_bytes);
        }

        void load_pool(const json& j, PoolConfiguration& out) {
            read(j, "maxsize", out.maxsize);
            if (out.maxsize == 0) bad_value("maxsize", "at least 1");
            read(j, "block", out.block);
            read_ms(j, "pool_timeout_ms", out.pool_timeout);
            read_ms(j, "connection_idle_ttl_ms", out.connection_idle_ttl);
            read_ms(j, "max_connection_age_ms", out.max_connection_age);
        }

        void load_retry(const json& j, RetryConfiguration& out) {
            if (const json* total = child(j, "total");
                total != nullptr && total->is_boolean()) {
                if (total->get<bool>())
                    bad_value("total", "false, an integer or null");
                out.disabled = true;
                out.total = 0;
                out.redirect = 0;
                out.raise_on_redirect = false;
            } else {
                read_budget(j, "total", out.total);
            }
            read_budget(j, "connect", out.connect);
            read_budget(j, "read", out.read);
            if (!out.disabled) read_budget(j, "redirect", out.redirect);
            read_budget(j, "status", out.status);
            read_budget(j, "other", out.other);

            if (const json* v = child(j, "allowed_methods")) {
                if (v->is_null()) {
                    out.allowed_methods.reset();
                } else {
                    if (!v->is_array())
                        bad_value("allowed_methods", "an array or null");
                    std::set<HttpMethod> methods;
                    for (const auto& m : *v) {
                        if (!m.is_string())
                            bad_value("allowed_methods", "an array of strings");
                        auto parsed = parse_http_method(m.get<std::string>());
                        if (!parsed)
                            bad_value("allowed_methods",
                                      "an array of HTTP method names");
                        methods.insert(*parsed);
                    }
                    out.allowed_methods = std::move(methods);
                }
            }

            if (const json* v = child(j, "status_forcelist")) {
                if (!v->is_array())
                    bad_value("status_forcelist", "an array of integers");
                out.status_forcelist.clear();
                for (const auto& s : *v) {
                    if (!s.is_number_integer())
                        bad_value("status_forcelist", "an array of integers");
                    out.status_forcelist.insert(s.get<int>());
                }
            }

            read(j, "backoff_factor", out.backoff_factor);
            read(j, "backoff_max", out.backoff_max);
            read(j, "backoff_jitter", out.backoff_jitter);
            if (!out.disabled)
                read(j, "raise_on_redirect", out.raise_on_redirect);
            read(j, "raise_on_status", out.raise_on_status);
            read(j, "respect_retry_after_header",
                 out.respect_retry_after_header);
            read(j, "retry_after_max", out.retry_after_max);

            if (const json* v = child(j, "remove_headers_on_redirect")) {
                if (!v->is_array())
                    bad_value("remove_headers_on_redirect",
                              "an array of strings");
                out.remove_headers_on_redirect.clear();
                for (const auto& h : *v) {
                    if (!h.is_string())
                        bad_value("remove_headers_on_redirect",
                                  "an array of strings");
                    out.remove_headers_on_redirect.insert(
                        header_utils::to_lower(h.get<std::string>()));
                }
            }
        }

    }  // namespace

    ClientConfiguration load_client_configuration(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw std::invalid_argument("Configuration must be a JSON object");
        }

        ClientConfiguration cfg;
        read(j, "base_url", cfg.base_url);
        read(j, "user_agent", cfg.user_agent);
        read(j, "num_pools", cfg.num_pools);
        if (cfg.num_pools == 0) bad_value("num_pools", "at least 1");
        read(j, "redirect", cfg.redirect);

        if (const json* headers = object_child(j, "default_headers")) {
            for (const auto& item : headers->items()) {
                if (!item.value().is_string())
                    bad_value(item.key(), "a string");
                cfg.default_headers.emplace_back(
                    item.key(), item.value().get<std::string>());
            }
        }

        if (const json* v = child(j, "backend")) {
            if (!v->is_string()) bad_value("backend", "a string");
            const auto name = header_utils::to_lower(v->get<std::string>());
            if (name == "beast") {
                cfg.backend = ConnectionBackend::Beast;
            } else if (name == "custom") {
                cfg.backend = ConnectionBackend::Custom;
            } else {
                bad_value("backend", "\"beast\" or \"custom\"");
            }
        }

        if (const json* c = object_child(j, "connection"))
            load_connection(*c, cfg.connection);
        if (const json* p = object_child(j, "pool")) load_pool(*p, cfg.pool);
        if (const json* r = object_child(j, "retry")) load_retry(*r, cfg.retry);

        return cfg;
    }

}  // namespace poolhttp
