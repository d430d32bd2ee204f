/**
 * Inscribe - Legacy ledger transaction wire format: compact arrays, message
 * compilation, serialization and parsing.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "inscribe/types.hpp"

namespace inscribe::wire
{

    using Blockhash = std::array<std::uint8_t, 32>;

    struct AccountMeta
    {
        PublicKey key{};
        bool is_signer{};
        bool is_writable{};
    };

    struct Instruction
    {
        PublicKey program_id{};
        std::vector<AccountMeta> accounts;
        Bytes data;
    };

    struct MessageHeader
    {
        std::uint8_t num_required_signatures{};
        std::uint8_t num_readonly_signed{};
        std::uint8_t num_readonly_unsigned{};
    };

    struct CompiledInstruction
    {
        std::uint8_t program_id_index{};
        std::vector<std::uint8_t> accounts;
        Bytes data;
    };

    struct Message
    {
        MessageHeader header{};
        std::vector<PublicKey> account_keys;
        Blockhash recent_blockhash{};
        std::vector<CompiledInstruction> instructions;
    };

    struct Transaction
    {
        std::vector<Signature> signatures;
        Message message;
    };

    void write_compact_u16(Bytes &out, std::uint16_t value);

    // Returns the value and the number of bytes consumed.
    std::pair<std::uint16_t, std::size_t> read_compact_u16(ByteView in);

    Message compile_message(const PublicKey &fee_payer, const std::vector<Instruction> &instructions,
                            const Blockhash &recent_blockhash);

    Bytes serialize_message(const Message &message);

    // Throws InscribeError(InvalidPayload) on truncated data and
    // InscribeError(Unsupported) for versioned messages.
    Message parse_message(ByteView data);

    Bytes serialize_transaction(const Transaction &transaction);

    Transaction parse_transaction(ByteView data);

    // A transaction with zeroed signature slots, ready to be signed.
    Transaction unsigned_transaction(Message message);

    std::vector<Bytes> instruction_data_for_program(const Message &message, const PublicKey &program_id);

} // namespace inscribe::wire
