#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "inscribe/types.hpp"

namespace inscribe::client
{

    // Least-recently-used cache of reconstructed payloads keyed by session
    // address, bounded by entry count and total bytes.
    class PayloadCache
    {
    public:
        PayloadCache(std::size_t max_entries, std::size_t max_bytes);

        std::optional<Bytes> get(const std::string &session_handle);

        // Payloads larger than the byte capacity are not stored.
        void put(const std::string &session_handle, Bytes payload);

        void erase(const std::string &session_handle);
        void clear();

        std::size_t size() const;
        std::size_t bytes() const;

    private:
        struct Entry
        {
            std::string key;
            Bytes payload;
        };

        void evict_locked();

        std::size_t max_entries_;
        std::size_t max_bytes_;
        std::size_t bytes_{0};
        std::list<Entry> order_;
        std::unordered_map<std::string, std::list<Entry>::iterator> entries_;
        mutable std::mutex mutex_;
    };

} // namespace inscribe::client
