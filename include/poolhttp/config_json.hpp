#pragma once

#include <nlohmann/json_fwd.hpp>

#include "config.hpp"

namespace poolhttp {

    /**
     * @brief Build a ClientConfiguration from a JSON document.
     *
     * @code{.json}
     * {
     *   "base_url": "https://api.example.com/v1",
     *   "num_pools": 4,
     *   "pool": { "maxsize": 8, "block": true, "pool_timeout_ms": 2000 },
     *   "connection": { "connect_timeout_ms": 1500, "verify_tls": true },
     *   "retry": { "total": 5, "backoff_factor": 0.2,
     *              "status_forcelist": [502, 503] }
     * }
     * @endcode
     *
     * Durations are in milliseconds (keys ending in `_ms`), except the
     * retry backoff values and retry_after_max, which are in seconds.
     * Missing keys keep their defaults and unknown keys are ignored.
     * `"retry": {"total": false}` disables retries.
     *
     * @throws std::invalid_argument when a value has the wrong type or is
     * out of range.
     */
    ClientConfiguration load_client_configuration(const nlohmann::json& j);

}  // namespace poolhttp
