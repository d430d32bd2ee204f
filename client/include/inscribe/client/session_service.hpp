/**
 * Inscribe - Remote session service: builds session transactions, reports
 * session metadata and serves assembled payloads.
 */
#pragma once

#include <string>

#include "inscribe/client/http_client.hpp"
#include "inscribe/protocol.hpp"
#include "inscribe/types.hpp"

namespace inscribe::client
{

    class SessionService
    {
    public:
        virtual ~SessionService() = default;

        virtual protocol::SessionResponse create_session(const protocol::SessionRequest &request) = 0;

        // Throws InscribeError(SessionNotFound) for an unknown session.
        virtual protocol::SessionMetadata session_metadata(const std::string &session_handle) = 0;

        virtual Bytes download(const std::string &session_handle) = 0;
    };

    class HttpSessionService : public SessionService
    {
    public:
        HttpSessionService(HttpClient &http, std::string base_url);

        protocol::SessionResponse create_session(const protocol::SessionRequest &request) override;
        protocol::SessionMetadata session_metadata(const std::string &session_handle) override;
        Bytes download(const std::string &session_handle) override;

    private:
        HttpClient &http_;
        std::string base_url_;
    };

} // namespace inscribe::client
