#include "inscribe/client/signer.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include <nlohmann/json.hpp>

#include "inscribe/error_codes.hpp"

namespace inscribe::client
{

    KeypairSigner::KeypairSigner(crypto::Keypair keypair) : keypair_(keypair)
    {
    }

    KeypairSigner KeypairSigner::from_file(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw InscribeError(ErrorCode::InvalidInput, "Unable to open keypair file: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw InscribeError(ErrorCode::InvalidInput, "Malformed keypair file " + path.string() + ": " + ex.what());
        }
        if (!json.is_array() || json.size() != crypto::kSecretKeySize)
        {
            throw InscribeError(ErrorCode::InvalidInput, "Keypair file must hold 64 bytes: " + path.string());
        }
        const auto secret = json.get<std::vector<std::uint8_t>>();
        return KeypairSigner(crypto::keypair_from_secret(secret));
    }

    KeypairSigner KeypairSigner::generate()
    {
        return KeypairSigner(crypto::generate_keypair());
    }

    PublicKey KeypairSigner::public_key() const
    {
        return keypair_.public_key;
    }

    Signature KeypairSigner::sign(ByteView message) const
    {
        return crypto::sign(keypair_, message);
    }

    wire::Transaction sign_message(wire::Message message, const wire::Blockhash &blockhash, const Signer &signer)
    {
        message.recent_blockhash = blockhash;
        const auto key = signer.public_key();
        const auto required = static_cast<std::size_t>(message.header.num_required_signatures);
        const auto end = message.account_keys.begin() + static_cast<std::ptrdiff_t>(std::min(required, message.account_keys.size()));
        const auto it = std::find(message.account_keys.begin(), end, key);
        if (it == end)
        {
            throw InscribeError(ErrorCode::InvalidInput, "Signer is not a required signer of the transaction");
        }
        const auto slot = static_cast<std::size_t>(it - message.account_keys.begin());

        const auto payload = wire::serialize_message(message);
        auto transaction = wire::unsigned_transaction(std::move(message));
        transaction.signatures[slot] = signer.sign(payload);
        return transaction;
    }

    Bytes sign_and_serialize(const wire::Message &message, const wire::Blockhash &blockhash, const Signer &signer)
    {
        return wire::serialize_transaction(sign_message(message, blockhash, signer));
    }

} // namespace inscribe::client
