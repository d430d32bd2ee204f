#include "inscribe/client/session_index.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "inscribe/error_codes.hpp"

namespace inscribe::client
{

    LocalSessionIndex::LocalSessionIndex(std::filesystem::path path) : path_(std::move(path))
    {
        load();
    }

    std::filesystem::path LocalSessionIndex::default_index_path()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".inscribe" / "sessions.json";
        }
        return std::filesystem::path(".inscribe") / "sessions.json";
    }

    void LocalSessionIndex::publish(const std::string &logical_id, const std::string &session_handle)
    {
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                               { return entry.logical_id == logical_id; });
        if (it == entries_.end())
        {
            entries_.push_back(Entry{logical_id, session_handle, static_cast<std::uint64_t>(now)});
        }
        else
        {
            it->session_handle = session_handle;
            it->published_at = static_cast<std::uint64_t>(now);
        }
        save();
        spdlog::info("Indexed {} -> {}", logical_id, session_handle);
    }

    std::optional<std::string> LocalSessionIndex::lookup(const std::string &logical_id) const
    {
        for (const auto &entry : entries_)
        {
            if (entry.logical_id == logical_id)
            {
                return entry.session_handle;
            }
        }
        return std::nullopt;
    }

    void LocalSessionIndex::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(path_))
        {
            return;
        }
        std::ifstream in(path_);
        if (!in.is_open())
        {
            return;
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            spdlog::warn("Ignoring unreadable session index {}: {}", path_.string(), ex.what());
            return;
        }
        if (!json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            Entry entry;
            entry.logical_id = item.value("id", std::string{});
            entry.session_handle = item.value("session", std::string{});
            entry.published_at = item.value("published", 0ULL);
            if (!entry.logical_id.empty() && !entry.session_handle.empty())
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void LocalSessionIndex::save() const
    {
        const auto dir = path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"id", entry.logical_id},
                            {"session", entry.session_handle},
                            {"published", entry.published_at}});
        }
        std::ofstream out(path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw InscribeError(ErrorCode::InternalError, "Unable to write session index: " + path_.string());
        }
        out << json.dump(2);
    }

} // namespace inscribe::client
