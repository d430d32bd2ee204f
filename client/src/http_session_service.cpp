#include "inscribe/client/session_service.hpp"

#include <spdlog/spdlog.h>

#include "inscribe/error_codes.hpp"

namespace inscribe::client
{

    namespace
    {

        constexpr std::string_view kCreatePath = "/api/v2/inscribe/pinocchio";
        constexpr std::string_view kSessionPath = "/api/v2/inscribe/session/";
        constexpr std::string_view kDownloadPath = "/api/v2/inscribe/download/";

        void require_success(const HttpResponse &response, const std::string &what, const std::string &session_handle)
        {
            if (response.status == 404)
            {
                throw InscribeError(ErrorCode::SessionNotFound, "Session " + session_handle + " not found");
            }
            if (!response.ok())
            {
                // 5xx is the service being unavailable, 4xx a rejected request.
                const auto code = response.status >= 500 ? ErrorCode::TransportError : ErrorCode::InvalidInput;
                throw InscribeError(code, what + " returned HTTP " + std::to_string(response.status) + ": " +
                                              response.body.substr(0, 256));
            }
        }

        template <typename T>
        T parse_body(const HttpResponse &response, const std::string &what)
        {
            try
            {
                return nlohmann::json::parse(response.body).get<T>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw InscribeError(ErrorCode::InvalidPayload, what + " returned an unexpected body: " + ex.what());
            }
        }

    } // namespace

    HttpSessionService::HttpSessionService(HttpClient &http, std::string base_url)
        : http_(http), base_url_(std::move(base_url))
    {
    }

    protocol::SessionResponse HttpSessionService::create_session(const protocol::SessionRequest &request)
    {
        spdlog::info("Requesting session for {} chunk(s) of up to {} bytes", request.total_chunks, request.chunk_size);
        const auto response = http_.post_json(join_url(base_url_, kCreatePath), nlohmann::json(request).dump());
        if (!response.ok())
        {
            throw InscribeError(ErrorCode::SessionCreationFailed,
                                "Session service returned HTTP " + std::to_string(response.status) + ": " +
                                    response.body.substr(0, 256));
        }
        try
        {
            return parse_body<protocol::SessionResponse>(response, "Session creation");
        }
        catch (const InscribeError &ex)
        {
            throw InscribeError(ErrorCode::SessionCreationFailed, ex.what());
        }
    }

    protocol::SessionMetadata HttpSessionService::session_metadata(const std::string &session_handle)
    {
        const auto response = http_.get(join_url(base_url_, std::string(kSessionPath) + session_handle));
        require_success(response, "Session metadata", session_handle);
        return parse_body<protocol::SessionMetadata>(response, "Session metadata");
    }

    Bytes HttpSessionService::download(const std::string &session_handle)
    {
        const auto response = http_.get(join_url(base_url_, std::string(kDownloadPath) + session_handle));
        require_success(response, "Session download", session_handle);
        spdlog::debug("Downloaded {} bytes for session {}", response.body.size(), session_handle);
        return Bytes(response.body.begin(), response.body.end());
    }

} // namespace inscribe::client
