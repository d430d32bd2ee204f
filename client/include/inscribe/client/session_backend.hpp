/**
 * Inscribe - Session plans: every transaction an upload needs, produced
 * either by the remote session service or locally from the program layout.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "inscribe/client/session_service.hpp"
#include "inscribe/codec.hpp"
#include "inscribe/types.hpp"
#include "inscribe/wire.hpp"

namespace inscribe::client
{

    struct SessionDescriptor
    {
        std::string handle;
        PublicKey address{};
        SessionId session_id{};
        PublicKey owner{};
        std::uint32_t total_chunks{};
        Digest digest{};
    };

    // Message templates; the reference blockhash is filled in at dispatch.
    struct SessionPlan
    {
        SessionDescriptor session;
        std::optional<wire::Message> init_storage;
        wire::Message create_session;
        std::vector<wire::Message> chunks;
        wire::Message finalize;
    };

    class SessionBackend
    {
    public:
        virtual ~SessionBackend() = default;

        virtual SessionPlan plan(const codec::EncodedPayload &payload, const PublicKey &owner) = 0;
    };

    class DirectSessionBackend : public SessionBackend
    {
    public:
        explicit DirectSessionBackend(const PublicKey &program_id, bool initialize_storage = true);

        SessionPlan plan(const codec::EncodedPayload &payload, const PublicKey &owner) override;

        // Fixed session id for reproducible plans.
        SessionPlan plan_with_id(const codec::EncodedPayload &payload, const PublicKey &owner, const SessionId &session_id) const;

    private:
        PublicKey program_id_;
        bool initialize_storage_;
    };

    class ServiceSessionBackend : public SessionBackend
    {
    public:
        ServiceSessionBackend(SessionService &service, const PublicKey &program_id);

        // Throws InscribeError(SessionCreationFailed) when the service plan
        // disagrees with the local chunk count or digest.
        SessionPlan plan(const codec::EncodedPayload &payload, const PublicKey &owner) override;

    private:
        SessionService &service_;
        PublicKey program_id_;
    };

    wire::Message decode_transaction_template(const std::string &base64);

} // namespace inscribe::client
