/**
 * Inscribe - Error codes and exception types used across the upload and
 * retrieval layers.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace inscribe
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidInput = 1,
        InvalidPayload = 2,
        SessionCreationFailed = 3,
        ChunkDispatchFailed = 4,
        ConfirmationTimeout = 5,
        UploadFailed = 6,
        FinalizationFailed = 7,
        SessionNotFinalized = 8,
        SessionNotFound = 9,
        ChunkCountMismatch = 10,
        DigestMismatch = 11,
        TransportError = 12,
        Unsupported = 13,
        InternalError = 14
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Transient codes are retried inside the component that raised them.
    bool is_transient(ErrorCode code) noexcept;

    class InscribeError : public std::runtime_error
    {
    public:
        InscribeError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    class UploadFailedError : public InscribeError
    {
    public:
        UploadFailedError(std::string session_handle, std::vector<std::uint32_t> unconfirmed);

        const std::string &session_handle() const noexcept { return session_handle_; }
        const std::vector<std::uint32_t> &unconfirmed_indices() const noexcept { return unconfirmed_; }

    private:
        std::string session_handle_;
        std::vector<std::uint32_t> unconfirmed_;
    };

    class FinalizationFailedError : public InscribeError
    {
    public:
        FinalizationFailedError(std::string session_handle, const std::string &reason);

        const std::string &session_handle() const noexcept { return session_handle_; }

    private:
        std::string session_handle_;
    };

} // namespace inscribe
