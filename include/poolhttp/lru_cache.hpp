#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace poolhttp {

    /**
     * @brief Bounded map that evicts its least recently used entry.
     *
     * Lookups through get() and every insert() move the entry to the
     * most-recently-used end. Values that leave the container (eviction,
     * replacement, erase, clear) are handed back to the caller, who owns
     * their disposal. Not thread-safe; callers lock.
     */
    template <typename K, typename V, typename Hash = std::hash<K>,
              typename KeyEqual = std::equal_to<K>>
    class RecentlyUsedContainer {
       public:
        /// @throws std::invalid_argument if maxsize is 0.
        explicit RecentlyUsedContainer(std::size_t maxsize)
            : m_maxsize(maxsize) {
            if (m_maxsize == 0) {
                throw std::invalid_argument(
                    "RecentlyUsedContainer maxsize must be at least 1");
            }
        }

        /// @brief Look up and mark as most recently used.
        V* get(const K& key) {
            auto it = m_index.find(key);
            if (it == m_index.end()) return nullptr;
            m_items.splice(m_items.end(), m_items, it->second);
            return &it->second->second;
        }

        /// @brief Look up without touching the access order.
        const V* peek(const K& key) const {
            auto it = m_index.find(key);
            return it == m_index.end() ? nullptr : &it->second->second;
        }

        bool contains(const K& key) const {
            return m_index.find(key) != m_index.end();
        }

        /**
         * @brief Insert or replace as most recently used.
         * @return The value pushed out: the replaced value for an existing
         * key, else the least recently used value if the container was full.
         */
        std::optional<V> insert(K key, V value) {
            if (auto it = m_index.find(key); it != m_index.end()) {
                std::optional<V> old(std::move(it->second->second));
                it->second->second = std::move(value);
                m_items.splice(m_items.end(), m_items, it->second);
                return old;
            }

            std::optional<V> evicted;
            if (m_items.size() >= m_maxsize) {
                auto& lru = m_items.front();
                evicted.emplace(std::move(lru.second));
                m_index.erase(lru.first);
                m_items.pop_front();
            }

            m_items.emplace_back(std::move(key), std::move(value));
            m_index.emplace(m_items.back().first, std::prev(m_items.end()));
            return evicted;
        }

        /// @brief Remove one entry and hand its value back.
        std::optional<V> erase(const K& key) {
            auto it = m_index.find(key);
            if (it == m_index.end()) return std::nullopt;
            std::optional<V> out(std::move(it->second->second));
            m_items.erase(it->second);
            m_index.erase(it);
            return out;
        }

        /// @brief Remove everything; values come back oldest first.
        std::vector<V> clear() {
            std::vector<V> out;
            out.reserve(m_items.size());
            for (auto& [k, v] : m_items) out.push_back(std::move(v));
            m_index.clear();
            m_items.clear();
            return out;
        }

        /// @brief Keys from least to most recently used.
        std::vector<K> keys() const {
            std::vector<K> out;
            out.reserve(m_items.size());
            for (auto const& [k, v] : m_items) out.push_back(k);
            return out;
        }

        std::size_t size() const noexcept { return m_items.size(); }

        std::size_t maxsize() const noexcept { return m_maxsize; }

       private:
        using Entry = std::pair<K, V>;

        std::size_t m_maxsize;
        std::list<Entry> m_items;  ///< front = least recently used
        std::unordered_map<K, typename std::list<Entry>::iterator, Hash,
                           KeyEqual>
            m_index;
    };

}  // namespace poolhttp
