#include "inscribe/wire.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "inscribe/error_codes.hpp"

namespace inscribe::wire
{

    namespace
    {

        class Reader
        {
        public:
            explicit Reader(ByteView data) : data_(data) {}

            std::uint8_t byte()
            {
                require(1);
                return data_[offset_++];
            }

            std::uint16_t compact_u16()
            {
                const auto [value, consumed] = read_compact_u16(data_.subspan(offset_));
                offset_ += consumed;
                return value;
            }

            ByteView take(std::size_t count)
            {
                require(count);
                const auto view = data_.subspan(offset_, count);
                offset_ += count;
                return view;
            }

            template <std::size_t N>
            std::array<std::uint8_t, N> fixed()
            {
                const auto view = take(N);
                std::array<std::uint8_t, N> result{};
                std::copy(view.begin(), view.end(), result.begin());
                return result;
            }

            std::size_t remaining() const { return data_.size() - offset_; }
            ByteView rest() const { return data_.subspan(offset_); }

        private:
            void require(std::size_t count) const
            {
                if (data_.size() - offset_ < count)
                {
                    throw InscribeError(ErrorCode::InvalidPayload, "Transaction data truncated");
                }
            }

            ByteView data_;
            std::size_t offset_{0};
        };

        std::uint8_t checked_index(std::size_t value)
        {
            if (value > std::numeric_limits<std::uint8_t>::max())
            {
                throw InscribeError(ErrorCode::InvalidInput, "Too many accounts in one transaction");
            }
            return static_cast<std::uint8_t>(value);
        }

        std::uint16_t checked_length(std::size_t value)
        {
            if (value > std::numeric_limits<std::uint16_t>::max())
            {
                throw InscribeError(ErrorCode::InvalidInput, "Array too long for compact encoding");
            }
            return static_cast<std::uint16_t>(value);
        }

        Message parse_message_from(Reader &reader)
        {
            Message message{};
            const auto first = reader.byte();
            if (first & 0x80)
            {
                throw InscribeError(ErrorCode::Unsupported,
                                    "Versioned message v" + std::to_string(first & 0x7F) + " is not supported");
            }
            message.header.num_required_signatures = first;
            message.header.num_readonly_signed = reader.byte();
            message.header.num_readonly_unsigned = reader.byte();

            const auto key_count = reader.compact_u16();
            message.account_keys.reserve(key_count);
            for (std::uint16_t i = 0; i < key_count; ++i)
            {
                message.account_keys.push_back(reader.fixed<kPublicKeySize>());
            }
            message.recent_blockhash = reader.fixed<32>();

            const auto instruction_count = reader.compact_u16();
            message.instructions.reserve(instruction_count);
            for (std::uint16_t i = 0; i < instruction_count; ++i)
            {
                CompiledInstruction instruction{};
                instruction.program_id_index = reader.byte();
                if (instruction.program_id_index >= message.account_keys.size())
                {
                    throw InscribeError(ErrorCode::InvalidPayload, "Program index outside account keys");
                }
                const auto account_count = reader.compact_u16();
                const auto accounts = reader.take(account_count);
                instruction.accounts.assign(accounts.begin(), accounts.end());
                const auto data_length = reader.compact_u16();
                const auto data = reader.take(data_length);
                instruction.data.assign(data.begin(), data.end());
                message.instructions.push_back(std::move(instruction));
            }
            return message;
        }

    } // namespace

    void write_compact_u16(Bytes &out, std::uint16_t value)
    {
        auto remaining = static_cast<std::uint32_t>(value);
        while (true)
        {
            auto element = static_cast<std::uint8_t>(remaining & 0x7F);
            remaining >>= 7;
            if (remaining == 0)
            {
                out.push_back(element);
                return;
            }
            out.push_back(static_cast<std::uint8_t>(element | 0x80));
        }
    }

    std::pair<std::uint16_t, std::size_t> read_compact_u16(ByteView in)
    {
        std::uint32_t value = 0;
        for (std::size_t i = 0; i < 3; ++i)
        {
            if (i >= in.size())
            {
                throw InscribeError(ErrorCode::InvalidPayload, "Compact length truncated");
            }
            const auto element = in[i];
            value |= static_cast<std::uint32_t>(element & 0x7F) << (7 * i);
            if ((element & 0x80) == 0)
            {
                if (value > std::numeric_limits<std::uint16_t>::max())
                {
                    throw InscribeError(ErrorCode::InvalidPayload, "Compact length overflows u16");
                }
                return {static_cast<std::uint16_t>(value), i + 1};
            }
        }
        throw InscribeError(ErrorCode::InvalidPayload, "Compact length longer than three bytes");
    }

    Message compile_message(const PublicKey &fee_payer, const std::vector<Instruction> &instructions,
                            const Blockhash &recent_blockhash)
    {
        std::vector<AccountMeta> metas;
        auto merge = [&metas](const PublicKey &key, bool is_signer, bool is_writable)
        {
            auto it = std::find_if(metas.begin(), metas.end(), [&](const AccountMeta &meta)
                                   { return meta.key == key; });
            if (it == metas.end())
            {
                metas.push_back(AccountMeta{.key = key, .is_signer = is_signer, .is_writable = is_writable});
                return;
            }
            it->is_signer = it->is_signer || is_signer;
            it->is_writable = it->is_writable || is_writable;
        };

        merge(fee_payer, true, true);
        for (const auto &instruction : instructions)
        {
            for (const auto &account : instruction.accounts)
            {
                merge(account.key, account.is_signer, account.is_writable);
            }
            merge(instruction.program_id, false, false);
        }

        // Fee payer stays first; the rest ordered signer/writable classes.
        auto rank = [](const AccountMeta &meta)
        {
            return (meta.is_signer ? 0 : 2) + (meta.is_writable ? 0 : 1);
        };
        std::stable_sort(metas.begin() + 1, metas.end(), [&](const AccountMeta &a, const AccountMeta &b)
                         { return rank(a) < rank(b); });

        Message message{};
        message.recent_blockhash = recent_blockhash;
        for (const auto &meta : metas)
        {
            message.account_keys.push_back(meta.key);
            if (meta.is_signer)
            {
                ++message.header.num_required_signatures;
                if (!meta.is_writable)
                {
                    ++message.header.num_readonly_signed;
                }
            }
            else if (!meta.is_writable)
            {
                ++message.header.num_readonly_unsigned;
            }
        }

        auto index_of = [&message](const PublicKey &key)
        {
            const auto it = std::find(message.account_keys.begin(), message.account_keys.end(), key);
            return checked_index(static_cast<std::size_t>(it - message.account_keys.begin()));
        };

        for (const auto &instruction : instructions)
        {
            CompiledInstruction compiled{};
            compiled.program_id_index = index_of(instruction.program_id);
            for (const auto &account : instruction.accounts)
            {
                compiled.accounts.push_back(index_of(account.key));
            }
            compiled.data = instruction.data;
            message.instructions.push_back(std::move(compiled));
        }
        return message;
    }

    Bytes serialize_message(const Message &message)
    {
        Bytes out;
        out.push_back(message.header.num_required_signatures);
        out.push_back(message.header.num_readonly_signed);
        out.push_back(message.header.num_readonly_unsigned);
        write_compact_u16(out, checked_length(message.account_keys.size()));
        for (const auto &key : message.account_keys)
        {
            out.insert(out.end(), key.begin(), key.end());
        }
        out.insert(out.end(), message.recent_blockhash.begin(), message.recent_blockhash.end());
        write_compact_u16(out, checked_length(message.instructions.size()));
        for (const auto &instruction : message.instructions)
        {
            out.push_back(instruction.program_id_index);
            write_compact_u16(out, checked_length(instruction.accounts.size()));
            out.insert(out.end(), instruction.accounts.begin(), instruction.accounts.end());
            write_compact_u16(out, checked_length(instruction.data.size()));
            out.insert(out.end(), instruction.data.begin(), instruction.data.end());
        }
        return out;
    }

    Message parse_message(ByteView data)
    {
        Reader reader(data);
        return parse_message_from(reader);
    }

    Bytes serialize_transaction(const Transaction &transaction)
    {
        Bytes out;
        write_compact_u16(out, checked_length(transaction.signatures.size()));
        for (const auto &signature : transaction.signatures)
        {
            out.insert(out.end(), signature.begin(), signature.end());
        }
        const auto message = serialize_message(transaction.message);
        out.insert(out.end(), message.begin(), message.end());
        return out;
    }

    Transaction parse_transaction(ByteView data)
    {
        Reader reader(data);
        Transaction transaction{};
        const auto signature_count = reader.compact_u16();
        transaction.signatures.reserve(signature_count);
        for (std::uint16_t i = 0; i < signature_count; ++i)
        {
            transaction.signatures.push_back(reader.fixed<kSignatureSize>());
        }
        transaction.message = parse_message_from(reader);
        if (transaction.signatures.size() != transaction.message.header.num_required_signatures)
        {
            throw InscribeError(ErrorCode::InvalidPayload, "Signature count does not match message header");
        }
        return transaction;
    }

    Transaction unsigned_transaction(Message message)
    {
        Transaction transaction{};
        transaction.signatures.assign(message.header.num_required_signatures, Signature{});
        transaction.message = std::move(message);
        return transaction;
    }

    std::vector<Bytes> instruction_data_for_program(const Message &message, const PublicKey &program_id)
    {
        std::vector<Bytes> result;
        for (const auto &instruction : message.instructions)
        {
            if (message.account_keys[instruction.program_id_index] == program_id)
            {
                result.push_back(instruction.data);
            }
        }
        return result;
    }

} // namespace inscribe::wire
