#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace inscribe::client
{

    // Receives (logical id, session address) once a session finalizes.
    class SessionIndex
    {
    public:
        virtual ~SessionIndex() = default;

        virtual void publish(const std::string &logical_id, const std::string &session_handle) = 0;
    };

    class LocalSessionIndex : public SessionIndex
    {
    public:
        struct Entry
        {
            std::string logical_id;
            std::string session_handle;
            std::uint64_t published_at{};
        };

        explicit LocalSessionIndex(std::filesystem::path path = default_index_path());

        void publish(const std::string &logical_id, const std::string &session_handle) override;

        std::optional<std::string> lookup(const std::string &logical_id) const;
        const std::vector<Entry> &entries() const noexcept { return entries_; }
        const std::filesystem::path &path() const noexcept { return path_; }

        static std::filesystem::path default_index_path();

    private:
        void load();
        void save() const;

        std::filesystem::path path_;
        std::vector<Entry> entries_;
    };

} // namespace inscribe::client
