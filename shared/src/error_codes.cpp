#include "inscribe/error_codes.hpp"

#include <array>
#include <sstream>

namespace inscribe
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 15> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidInput, "invalid_input"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::SessionCreationFailed, "session_creation_failed"},
            {ErrorCode::ChunkDispatchFailed, "chunk_dispatch_failed"},
            {ErrorCode::ConfirmationTimeout, "confirmation_timeout"},
            {ErrorCode::UploadFailed, "upload_failed"},
            {ErrorCode::FinalizationFailed, "finalization_failed"},
            {ErrorCode::SessionNotFinalized, "session_not_finalized"},
            {ErrorCode::SessionNotFound, "session_not_found"},
            {ErrorCode::ChunkCountMismatch, "chunk_count_mismatch"},
            {ErrorCode::DigestMismatch, "digest_mismatch"},
            {ErrorCode::TransportError, "transport_error"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};

        std::string describe_unconfirmed(const std::string &session_handle, const std::vector<std::uint32_t> &indices)
        {
            std::ostringstream oss;
            oss << indices.size() << " chunk(s) unconfirmed after retries for session " << session_handle << ": [";
            for (std::size_t i = 0; i < indices.size(); ++i)
            {
                if (i > 0)
                {
                    oss << ", ";
                }
                oss << indices[i];
            }
            oss << "]";
            return oss.str();
        }
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    bool is_transient(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::ChunkDispatchFailed:
        case ErrorCode::ConfirmationTimeout:
        case ErrorCode::SessionNotFinalized:
        case ErrorCode::TransportError:
            return true;
        default:
            return false;
        }
    }

    InscribeError::InscribeError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code)
    {
    }

    UploadFailedError::UploadFailedError(std::string session_handle, std::vector<std::uint32_t> unconfirmed)
        : InscribeError(ErrorCode::UploadFailed, describe_unconfirmed(session_handle, unconfirmed)),
          session_handle_(std::move(session_handle)),
          unconfirmed_(std::move(unconfirmed))
    {
    }

    FinalizationFailedError::FinalizationFailedError(std::string session_handle, const std::string &reason)
        : InscribeError(ErrorCode::FinalizationFailed,
                        "Session " + session_handle +
                            " was uploaded but could not be finalized; data is not yet retrievable: " + reason),
          session_handle_(std::move(session_handle))
    {
    }

} // namespace inscribe
