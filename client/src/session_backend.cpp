#include "inscribe/client/session_backend.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "inscribe/address.hpp"
#include "inscribe/crypto.hpp"
#include "inscribe/encoding/base64.hpp"
#include "inscribe/error_codes.hpp"
#include "inscribe/layout.hpp"

namespace inscribe::client
{

    namespace
    {

        wire::Message single_instruction(const PublicKey &owner, wire::Instruction instruction)
        {
            return wire::compile_message(owner, {std::move(instruction)}, wire::Blockhash{});
        }

        std::optional<SessionId> parse_session_id(const std::string &text)
        {
            try
            {
                const auto bytes = crypto::from_hex(text);
                if (bytes.size() != kSessionIdSize)
                {
                    return std::nullopt;
                }
                SessionId id{};
                std::copy(bytes.begin(), bytes.end(), id.begin());
                return id;
            }
            catch (const InscribeError &)
            {
                return std::nullopt;
            }
        }

    } // namespace

    DirectSessionBackend::DirectSessionBackend(const PublicKey &program_id, bool initialize_storage)
        : program_id_(program_id), initialize_storage_(initialize_storage)
    {
    }

    SessionPlan DirectSessionBackend::plan(const codec::EncodedPayload &payload, const PublicKey &owner)
    {
        return plan_with_id(payload, owner, crypto::random_session_id());
    }

    SessionPlan DirectSessionBackend::plan_with_id(const codec::EncodedPayload &payload, const PublicKey &owner,
                                                   const SessionId &session_id) const
    {
        const auto system_program = address::parse_public_key(address::kSystemProgramId);
        const auto session = address::derive_session_address(owner, session_id, program_id_);
        const auto storage = address::derive_storage_address(owner, program_id_);
        const auto total = static_cast<std::uint32_t>(payload.chunks.size());

        SessionPlan plan;
        plan.session = SessionDescriptor{
            .handle = address::to_base58(session.address),
            .address = session.address,
            .session_id = session_id,
            .owner = owner,
            .total_chunks = total,
            .digest = payload.digest,
        };

        if (initialize_storage_)
        {
            plan.init_storage = single_instruction(
                owner, wire::Instruction{
                           .program_id = program_id_,
                           .accounts = {{owner, true, true}, {storage.address, false, true}, {system_program, false, false}},
                           .data = layout::encode_init_storage(),
                       });
        }

        plan.create_session = single_instruction(
            owner, wire::Instruction{
                       .program_id = program_id_,
                       .accounts = {{owner, true, true},
                                    {session.address, false, true},
                                    {storage.address, false, true},
                                    {system_program, false, false}},
                       .data = layout::encode_create_session(session_id, total, payload.digest),
                   });

        plan.chunks.reserve(payload.chunks.size());
        for (const auto &chunk : payload.chunks)
        {
            plan.chunks.push_back(single_instruction(
                owner, wire::Instruction{
                           .program_id = program_id_,
                           .accounts = {{owner, true, true}, {session.address, false, true}},
                           .data = layout::encode_chunk_instruction(layout::ChunkInstruction{
                               .session_id = session_id,
                               .chunk_index = chunk.index,
                               .method = static_cast<std::uint8_t>(payload.method),
                               .data = chunk.data,
                           }),
                       }));
        }

        plan.finalize = single_instruction(
            owner, wire::Instruction{
                       .program_id = program_id_,
                       .accounts = {{owner, true, true}, {session.address, false, true}, {storage.address, false, true}},
                       .data = layout::encode_finalize(session_id),
                   });
        return plan;
    }

    ServiceSessionBackend::ServiceSessionBackend(SessionService &service, const PublicKey &program_id)
        : service_(service), program_id_(program_id)
    {
    }

    SessionPlan ServiceSessionBackend::plan(const codec::EncodedPayload &payload, const PublicKey &owner)
    {
        protocol::SessionRequest request;
        request.owner = address::to_base58(owner);
        request.chunk_size = payload.chunks.empty() ? 0 : payload.chunks.front().data.size();
        request.method = static_cast<std::uint8_t>(payload.method);
        request.total_chunks = static_cast<std::uint32_t>(payload.chunks.size());
        request.content_digest = crypto::to_hex(payload.digest);
        request.chunks.reserve(payload.chunks.size());
        for (const auto &chunk : payload.chunks)
        {
            request.chunks.push_back(encoding::encode_base64(chunk.data));
        }

        const auto response = service_.create_session(request);
        if (response.total_chunks != request.total_chunks || response.chunk_txs.size() != payload.chunks.size())
        {
            throw InscribeError(ErrorCode::SessionCreationFailed,
                                "Service planned " + std::to_string(response.total_chunks) + " chunk(s) with " +
                                    std::to_string(response.chunk_txs.size()) + " transaction(s), expected " +
                                    std::to_string(payload.chunks.size()));
        }
        if (!response.content_digest.empty() && response.content_digest != request.content_digest)
        {
            throw InscribeError(ErrorCode::SessionCreationFailed,
                                "Service digest " + response.content_digest + " does not match local digest " +
                                    request.content_digest);
        }

        SessionPlan plan;
        plan.session.owner = owner;
        plan.session.total_chunks = response.total_chunks;
        plan.session.digest = payload.digest;
        const auto session_id = parse_session_id(response.session_id);
        if (session_id)
        {
            plan.session.session_id = *session_id;
        }
        if (response.session_handle)
        {
            plan.session.handle = *response.session_handle;
            plan.session.address = address::parse_public_key(*response.session_handle);
        }
        else if (session_id)
        {
            plan.session.address = address::derive_session_address(owner, *session_id, program_id_).address;
            plan.session.handle = address::to_base58(plan.session.address);
        }
        else
        {
            throw InscribeError(ErrorCode::SessionCreationFailed,
                                "Service response names no session address: " + response.session_id);
        }

        try
        {
            if (response.init_storage_tx)
            {
                plan.init_storage = decode_transaction_template(*response.init_storage_tx);
            }
            plan.create_session = decode_transaction_template(response.create_session_tx);
            plan.chunks.reserve(response.chunk_txs.size());
            for (const auto &tx : response.chunk_txs)
            {
                plan.chunks.push_back(decode_transaction_template(tx));
            }
            plan.finalize = decode_transaction_template(response.finalize_tx);
        }
        catch (const InscribeError &ex)
        {
            throw InscribeError(ErrorCode::SessionCreationFailed, std::string("Unusable transaction template: ") + ex.what());
        }

        spdlog::info("Service planned session {} ({} chunk(s), {})", plan.session.handle, plan.session.total_chunks,
                     response.upload_type.empty() ? "pinocchio" : response.upload_type);
        return plan;
    }

    wire::Message decode_transaction_template(const std::string &base64)
    {
        const auto raw = encoding::decode_base64(base64);
        if (!raw)
        {
            throw InscribeError(ErrorCode::InvalidPayload, "Transaction template is not valid base64");
        }
        return wire::parse_transaction(*raw).message;
    }

} // namespace inscribe::client
