#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace poolhttp {

    /// @brief Ordered header list. Field names compare case-insensitively;
    /// duplicates are allowed and keep their wire order.
    using Headers = std::vector<std::pair<std::string, std::string>>;

    namespace header_utils {

        inline bool iequals(std::string_view a, std::string_view b) noexcept {
            if (a.size() != b.size()) return false;
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(a[i])) !=
                    std::tolower(static_cast<unsigned char>(b[i])))
                    return false;
            }
            return true;
        }

        inline std::string to_lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        /// @brief First value for `name`, or nullptr.
        inline const std::string* find(const Headers& headers,
                                       std::string_view name) noexcept {
            for (auto const& [k, v] : headers) {
                if (iequals(k, name)) return &v;
            }
            return nullptr;
        }

        inline bool contains(const Headers& headers, std::string_view name) {
            return find(headers, name) != nullptr;
        }

        /// @brief Remove every field named `name`; returns how many went.
        inline std::size_t erase(Headers& headers, std::string_view name) {
            auto before = headers.size();
            headers.erase(std::remove_if(headers.begin(), headers.end(),
                                         [&](auto const& kv) {
                                             return iequals(kv.first, name);
                                         }),
                          headers.end());
            return before - headers.size();
        }

        /// @brief Replace all fields named `name` with a single one.
        inline void set(Headers& headers, std::string name, std::string value) {
            header_utils::erase(headers, name);
            headers.emplace_back(std::move(name), std::move(value));
        }

        /// @brief Set `name` only if it is not present yet.
        inline void set_default(Headers& headers, std::string name,
                                std::string value) {
            if (!header_utils::contains(headers, name))
                headers.emplace_back(std::move(name), std::move(value));
        }

        /// @name Conversion helpers for callers holding map-shaped headers
        /// @{
        inline Headers from_map(const std::map<std::string, std::string>& m) {
            return Headers(m.begin(), m.end());
        }

        inline Headers from_map(
            const std::unordered_map<std::string, std::string>& m) {
            return Headers(m.begin(), m.end());
        }
        /// @}

    }  // namespace header_utils

}  // namespace poolhttp
