#include "inscribe/client/payload_cache.hpp"

namespace inscribe::client
{

    PayloadCache::PayloadCache(std::size_t max_entries, std::size_t max_bytes)
        : max_entries_(max_entries), max_bytes_(max_bytes)
    {
    }

    std::optional<Bytes> PayloadCache::get(const std::string &session_handle)
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(session_handle);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second);
        return it->second->payload;
    }

    void PayloadCache::put(const std::string &session_handle, Bytes payload)
    {
        std::lock_guard lock(mutex_);
        if (auto it = entries_.find(session_handle); it != entries_.end())
        {
            bytes_ -= it->second->payload.size();
            order_.erase(it->second);
            entries_.erase(it);
        }
        if (max_entries_ == 0 || payload.size() > max_bytes_)
        {
            return;
        }
        bytes_ += payload.size();
        order_.push_front(Entry{session_handle, std::move(payload)});
        entries_[session_handle] = order_.begin();
        evict_locked();
    }

    void PayloadCache::erase(const std::string &session_handle)
    {
        std::lock_guard lock(mutex_);
        if (auto it = entries_.find(session_handle); it != entries_.end())
        {
            bytes_ -= it->second->payload.size();
            order_.erase(it->second);
            entries_.erase(it);
        }
    }

    void PayloadCache::clear()
    {
        std::lock_guard lock(mutex_);
        order_.clear();
        entries_.clear();
        bytes_ = 0;
    }

    std::size_t PayloadCache::size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    std::size_t PayloadCache::bytes() const
    {
        std::lock_guard lock(mutex_);
        return bytes_;
    }

    void PayloadCache::evict_locked()
    {
        while (!order_.empty() && (entries_.size() > max_entries_ || bytes_ > max_bytes_))
        {
            const auto &victim = order_.back();
            bytes_ -= victim.payload.size();
            entries_.erase(victim.key);
            order_.pop_back();
        }
    }

} // namespace inscribe::client
