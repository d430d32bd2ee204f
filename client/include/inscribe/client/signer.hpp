#pragma once

#include <filesystem>

#include "inscribe/crypto.hpp"
#include "inscribe/types.hpp"
#include "inscribe/wire.hpp"

namespace inscribe::client
{

    class Signer
    {
    public:
        virtual ~Signer() = default;

        virtual PublicKey public_key() const = 0;
        virtual Signature sign(ByteView message) const = 0;
    };

    class KeypairSigner : public Signer
    {
    public:
        explicit KeypairSigner(crypto::Keypair keypair);

        // Reads the JSON array of 64 secret key bytes written by the ledger CLI.
        static KeypairSigner from_file(const std::filesystem::path &path);
        static KeypairSigner generate();

        PublicKey public_key() const override;
        Signature sign(ByteView message) const override;

    private:
        crypto::Keypair keypair_;
    };

    // Sets the reference blockhash and fills the signer's slot. Throws
    // InscribeError(InvalidInput) when the signer is not a required signer.
    wire::Transaction sign_message(wire::Message message, const wire::Blockhash &blockhash, const Signer &signer);

    Bytes sign_and_serialize(const wire::Message &message, const wire::Blockhash &blockhash, const Signer &signer);

} // namespace inscribe::client
