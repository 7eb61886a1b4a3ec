#pragma once

#include "response.hpp"

namespace poolhttp {

    // Primary template - users should specialize this or overload
    // deserialize(const Response&, T&) via ADL.
    template <typename T>
    void deserialize(const Response& response, T& out);

}  // namespace poolhttp
