#pragma once

#include <nlohmann/json.hpp>

#include "poolhttp/response.hpp"
#include "poolhttp/serialize_impl.hpp"

namespace poolhttp {

    // Overload for types adaptable to nlohmann::json
    template <typename T>
    void deserialize(const Response& response, T& out) {
        auto j = nlohmann::json::parse(response.body);
        j.get_to(out);
    }

}  // namespace poolhttp
