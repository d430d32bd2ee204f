#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "inscribe/address.hpp"
#include "inscribe/codec.hpp"
#include "inscribe/compression.hpp"
#include "inscribe/crypto.hpp"
#include "inscribe/encoding/base58.hpp"
#include "inscribe/encoding/base64.hpp"
#include "inscribe/error_codes.hpp"
#include "inscribe/layout.hpp"
#include "inscribe/protocol.hpp"
#include "inscribe/wire.hpp"

using namespace inscribe;

void run_client_pipeline_tests();
void run_client_retrieval_tests();

namespace
{

    Bytes pattern_bytes(std::size_t size, std::uint32_t seed)
    {
        Bytes data(size);
        std::uint32_t state = seed;
        for (auto &byte : data)
        {
            state = state * 1103515245u + 12345u;
            byte = static_cast<std::uint8_t>(state >> 16);
        }
        return data;
    }

    Bytes text_bytes(const std::string &text)
    {
        return Bytes(text.begin(), text.end());
    }

    template <typename Fn>
    ErrorCode error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const InscribeError &ex)
        {
            return ex.code();
        }
        return ErrorCode::Ok;
    }

    void test_small_payload_skips_compression()
    {
        const auto payload = pattern_bytes(50, 1);
        codec::EncodeOptions options;
        options.compress = true;
        const auto encoded = codec::encode(payload, options);

        assert(encoded.chunks.size() == 1);
        assert(!encoded.compressed);
        assert(encoded.method == codec::EncodingMethod::Raw);
        assert(encoded.stream.front() == static_cast<std::uint8_t>(codec::Envelope::Raw));
        assert(codec::decode(encoded.stream).data == payload);
    }

    void test_compressed_payload()
    {
        std::string text;
        while (text.size() < 5000)
        {
            text += "the session stores every chunk under its own index; ";
        }
        text.resize(5000);
        const auto payload = text_bytes(text);

        codec::EncodeOptions options;
        options.compress = true;
        const auto encoded = codec::encode(payload, options);

        assert(encoded.compressed);
        assert(encoded.method == codec::EncodingMethod::Gzip);
        assert(encoded.encoded_size < payload.size());
        assert(encoded.stream.front() == static_cast<std::uint8_t>(codec::Envelope::Gzip));
        assert(encoded.chunks.size() == codec::chunk_count_for(encoded.stream.size(), options.chunk_size));

        const auto decoded = codec::decode(encoded.stream);
        assert(decoded.decompressed);
        assert(decoded.data.size() == 5000);
        assert(decoded.data == payload);
    }

    void test_incompressible_payload_stays_raw()
    {
        const auto payload = pattern_bytes(4000, 7);
        codec::EncodeOptions options;
        options.compress = true;
        const auto encoded = codec::encode(payload, options);
        assert(!encoded.compressed);
        assert(encoded.encoded_size == payload.size() + 1);
        assert(codec::decode(encoded.stream).data == payload);
    }

    void test_chunk_count_and_sizes()
    {
        for (const std::size_t size : {1u, 674u, 675u, 676u, 1349u, 1350u, 5000u})
        {
            const auto encoded = codec::encode(pattern_bytes(size, static_cast<std::uint32_t>(size)));
            const auto expected = (encoded.stream.size() + 674) / 675;
            assert(encoded.chunks.size() == expected);
            std::size_t total = 0;
            for (std::size_t i = 0; i < encoded.chunks.size(); ++i)
            {
                assert(encoded.chunks[i].index == i);
                assert(!encoded.chunks[i].data.empty());
                assert(encoded.chunks[i].data.size() <= 675);
                total += encoded.chunks[i].data.size();
            }
            assert(total == encoded.stream.size());
        }
    }

    void test_encode_rejects_invalid_input()
    {
        assert(error_of([] { codec::encode(Bytes{}); }) == ErrorCode::InvalidInput);

        codec::EncodeOptions oversized;
        oversized.chunk_size = codec::kMaxChunkSize + 1;
        assert(error_of([&] { codec::encode(pattern_bytes(10, 1), oversized); }) == ErrorCode::InvalidInput);

        codec::EncodeOptions zero;
        zero.chunk_size = 0;
        assert(error_of([&] { codec::encode(pattern_bytes(10, 1), zero); }) == ErrorCode::InvalidInput);
    }

    void test_digest_independent_of_chunk_size()
    {
        const auto payload = pattern_bytes(3000, 3);
        codec::EncodeOptions small;
        small.chunk_size = 100;
        codec::EncodeOptions large;
        large.chunk_size = 900;
        const auto a = codec::encode(payload, small);
        const auto b = codec::encode(payload, large);
        assert(a.chunks.size() != b.chunks.size());
        assert(a.digest == b.digest);
        assert(a.digest == crypto::sha256(a.stream));
    }

    void test_text_safe_envelope()
    {
        std::string text(2000, 'z');
        codec::EncodeOptions options;
        options.compress = true;
        options.text_safe = true;
        const auto encoded = codec::encode(text_bytes(text), options);
        assert(encoded.method == codec::EncodingMethod::Base64Text);
        assert(encoded.compressed);
        assert(encoded.stream.front() == static_cast<std::uint8_t>(codec::Envelope::Base64Text));

        const auto decoded = codec::decode(encoded.stream);
        assert(decoded.text_decoded);
        assert(decoded.decompressed);
        assert(decoded.data == text_bytes(text));
    }

    void test_marker_bytes_in_payload_are_unambiguous()
    {
        // Payloads that begin with envelope or gzip bytes still round-trip.
        Bytes tricky{0xF1, 0x1F, 0x8B, 0x08, 0x00};
        const auto encoded = codec::encode(tricky);
        assert(codec::decode(encoded.stream).data == tricky);

        const auto text = text_bytes("QUJDREVGR0hJSktMTU5PUFFSU1RVVldYWVo=");
        assert(codec::decode(codec::encode(text).stream).data == text);
    }

    void test_untagged_stream_handling()
    {
        const auto legacy_text = text_bytes(encoding::encode_base64(text_bytes("hello from the old writer")));
        const auto untouched = codec::decode(legacy_text);
        assert(!untouched.envelope_present);
        assert(untouched.data == legacy_text);

        const auto detected = codec::decode(legacy_text, codec::DecodeOptions{.legacy_detection = true});
        assert(detected.text_decoded);
        assert(detected.data == text_bytes("hello from the old writer"));

        const auto original = text_bytes(std::string(600, 'q'));
        auto flagged = compression::gzip_compress(original);
        flagged.insert(flagged.begin(), 0x01);
        const auto inflated = codec::decode(flagged, codec::DecodeOptions{.legacy_detection = true});
        assert(inflated.decompressed);
        assert(inflated.data == original);
    }

    void test_corrupt_gzip_envelope()
    {
        Bytes broken{static_cast<std::uint8_t>(codec::Envelope::Gzip), 0x1F, 0x8B, 0x08, 0x00, 0x01};
        assert(error_of([&] { codec::decode(broken); }) == ErrorCode::InvalidPayload);
    }

    void test_session_account_layout()
    {
        layout::SessionAccount account{};
        account.owner.fill(0x11);
        account.session_id.fill(0x22);
        account.total_chunks = 0x01020304;
        account.digest.fill(0x33);
        account.status = layout::SessionStatus::Finalized;

        const auto bytes = layout::encode_session_account(account);
        assert(bytes.size() == 85);
        assert(bytes[32] == 0x22);
        assert(bytes[48] == 0x04 && bytes[49] == 0x03 && bytes[50] == 0x02 && bytes[51] == 0x01);
        assert(bytes[84] == 1);

        const auto decoded = layout::decode_session_account(bytes);
        assert(decoded.total_chunks == account.total_chunks);
        assert(decoded.digest == account.digest);
        assert(decoded.status == layout::SessionStatus::Finalized);

        auto bad_status = bytes;
        bad_status[84] = 7;
        assert(error_of([&] { layout::decode_session_account(bad_status); }) == ErrorCode::InvalidPayload);
        assert(error_of([&] { layout::decode_session_account(ByteView(bytes).first(40)); }) == ErrorCode::InvalidPayload);
    }

    void test_chunk_instruction_layout()
    {
        layout::ChunkInstruction instruction{};
        instruction.session_id.fill(0xAB);
        instruction.chunk_index = 7;
        instruction.method = 1;
        instruction.data = {1, 2, 3};

        const auto bytes = layout::encode_chunk_instruction(instruction);
        assert(bytes.size() == layout::kChunkHeaderSize + 3);
        assert(bytes[0] == layout::kPostChunkDiscriminator);
        assert(bytes[17] == 7 && bytes[18] == 0 && bytes[19] == 0 && bytes[20] == 0);
        assert(bytes[21] == 1);

        const auto parsed = layout::parse_chunk_instruction(bytes);
        assert(parsed);
        assert(parsed->chunk_index == 7);
        assert(parsed->session_id == instruction.session_id);
        assert(parsed->data == instruction.data);

        assert(!layout::parse_chunk_instruction(layout::encode_finalize(instruction.session_id)));
        assert(!layout::parse_chunk_instruction(ByteView(bytes).first(10)));
    }

    void test_compact_u16()
    {
        const std::vector<std::pair<std::uint16_t, Bytes>> cases = {
            {0, {0x00}},
            {127, {0x7F}},
            {128, {0x80, 0x01}},
            {16383, {0xFF, 0x7F}},
            {16384, {0x80, 0x80, 0x01}},
            {65535, {0xFF, 0xFF, 0x03}},
        };
        for (const auto &[value, encoded] : cases)
        {
            Bytes out;
            wire::write_compact_u16(out, value);
            assert(out == encoded);
            const auto [decoded, consumed] = wire::read_compact_u16(out);
            assert(decoded == value);
            assert(consumed == encoded.size());
        }
        assert(error_of([] { wire::read_compact_u16(Bytes{0x80}); }) == ErrorCode::InvalidPayload);
    }

    void test_message_compilation_and_signing()
    {
        const auto keypair = crypto::generate_keypair();
        PublicKey program{};
        program.fill(0x44);
        PublicKey writable{};
        writable.fill(0x55);
        PublicKey readonly{};
        readonly.fill(0x66);

        wire::Instruction instruction{
            .program_id = program,
            .accounts = {{readonly, false, false}, {writable, false, true}, {keypair.public_key, true, true}},
            .data = {9, 8, 7},
        };
        wire::Blockhash blockhash{};
        blockhash.fill(0x77);
        const auto message = wire::compile_message(keypair.public_key, {instruction}, blockhash);

        assert(message.header.num_required_signatures == 1);
        assert(message.header.num_readonly_signed == 0);
        assert(message.header.num_readonly_unsigned == 2);
        assert(message.account_keys.size() == 4);
        assert(message.account_keys[0] == keypair.public_key);
        assert(message.account_keys[1] == writable);
        assert(message.instructions.size() == 1);
        assert(message.account_keys[message.instructions[0].program_id_index] == program);

        const auto serialized = wire::serialize_message(message);
        const auto parsed = wire::parse_message(serialized);
        assert(wire::serialize_message(parsed) == serialized);
        assert(wire::instruction_data_for_program(parsed, program).front() == instruction.data);

        auto transaction = wire::unsigned_transaction(message);
        transaction.signatures[0] = crypto::sign(keypair, serialized);
        const auto raw = wire::serialize_transaction(transaction);
        const auto round = wire::parse_transaction(raw);
        assert(crypto::verify(keypair.public_key, wire::serialize_message(round.message), round.signatures[0]));

        assert(error_of([&] { wire::parse_transaction(ByteView(raw).first(raw.size() - 1)); }) ==
               ErrorCode::InvalidPayload);
        auto versioned = serialized;
        versioned[0] = 0x80;
        assert(error_of([&] { wire::parse_message(versioned); }) == ErrorCode::Unsupported);
    }

    void test_program_addresses()
    {
        const auto loader = address::parse_public_key("BPFLoaderUpgradeab1e11111111111111111111111");
        const std::uint8_t bump_one[] = {1};
        const std::string empty;
        const auto first = address::create_program_address(
            {ByteView(reinterpret_cast<const std::uint8_t *>(empty.data()), 0), ByteView(bump_one, 1)}, loader);
        assert(first && address::to_base58(*first) == "BwqrghZA2htAcqq8dzP1WDAhTXYTYWj7CHxF5j7TDBAe");

        const std::string talking = "Talking";
        const std::string squirrels = "Squirrels";
        const auto second = address::create_program_address(
            {ByteView(reinterpret_cast<const std::uint8_t *>(talking.data()), talking.size()),
             ByteView(reinterpret_cast<const std::uint8_t *>(squirrels.data()), squirrels.size())},
            loader);
        assert(second && address::to_base58(*second) == "2fnQrngrQT4SeLcdToJAD96phoEjNL2man2kfRLCASVk");

        PublicKey owner{};
        for (std::size_t i = 0; i < owner.size(); ++i)
        {
            owner[i] = static_cast<std::uint8_t>(i);
        }
        SessionId session_id{};
        for (std::size_t i = 0; i < session_id.size(); ++i)
        {
            session_id[i] = static_cast<std::uint8_t>(100 + i);
        }
        const auto program = address::parse_public_key(address::kDefaultProgramId);
        const auto session = address::derive_session_address(owner, session_id, program);
        assert(address::to_base58(session.address) == "ExFER4X4ims3hE3pkSrVejRjpXyDaPK2HcQm6VsiYG9Q");
        assert(session.bump == 255);
        const auto storage = address::derive_storage_address(owner, program);
        assert(address::to_base58(storage.address) == "As7nh4vQiRtPDU5gwL7sdEitmVucVkpuxsteRe23CyYD");
        assert(!crypto::is_on_curve(session.address));

        const auto keypair = crypto::generate_keypair();
        assert(crypto::is_on_curve(keypair.public_key));
    }

    void test_base58_and_hex()
    {
        const auto system = address::parse_public_key(address::kSystemProgramId);
        assert(system == PublicKey{});
        assert(address::to_base58(system) == address::kSystemProgramId);
        assert(error_of([] { address::parse_public_key("not-base58-0OIl"); }) == ErrorCode::InvalidInput);

        const auto abc = crypto::sha256(text_bytes("abc"));
        assert(crypto::to_hex(abc) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        assert(crypto::from_hex(crypto::to_hex(abc)) == Bytes(abc.begin(), abc.end()));
        assert(error_of([] { crypto::from_hex("abc"); }) == ErrorCode::InvalidPayload);
    }

    void test_service_schema()
    {
        const auto json = nlohmann::json::parse(R"({
            "sessionId": "000102030405060708090a0b0c0d0e0f",
            "createSessionTransaction": "AQ==",
            "chunkTransactions": ["AA==", "AB=="],
            "finalizeTransaction": "AC==",
            "merkleRoot": "ff",
            "totalChunks": 2,
            "uploadType": "pinocchio"
        })");
        const auto response = json.get<protocol::SessionResponse>();
        assert(response.chunk_txs.size() == 2);
        assert(!response.init_storage_tx);
        assert(!response.session_handle);
        assert(response.total_chunks == 2);

        const auto metadata = nlohmann::json::parse(R"({"owner":"o","sessionId":"s","totalChunks":3,"status":"pending","merkleRoot":"aa"})")
                                  .get<protocol::SessionMetadata>();
        assert(metadata.status == layout::SessionStatus::Active);
        const auto finalized = nlohmann::json::parse(R"({"totalChunks":3,"status":"finalized"})").get<protocol::SessionMetadata>();
        assert(finalized.status == layout::SessionStatus::Finalized);

        assert(protocol::dispatch_strategy_from_string("fire-and-forget") == protocol::DispatchStrategy::FireAndForget);
        assert(!protocol::dispatch_strategy_from_string("parallel"));
        assert(protocol::meets(protocol::Commitment::Finalized, protocol::Commitment::Confirmed));
        assert(!protocol::meets(protocol::Commitment::Processed, protocol::Commitment::Confirmed));
    }

    void test_error_descriptions()
    {
        assert(to_string(ErrorCode::DigestMismatch) == "digest_mismatch");
        assert(error_code_from_int(to_int(ErrorCode::UploadFailed)) == ErrorCode::UploadFailed);
        assert(is_transient(ErrorCode::ChunkDispatchFailed));
        assert(!is_transient(ErrorCode::InvalidInput));

        const UploadFailedError error("Sess1on", {3, 7});
        assert(error.code() == ErrorCode::UploadFailed);
        assert(error.unconfirmed_indices().size() == 2);
        assert(std::string(error.what()).find("[3, 7]") != std::string::npos);
    }

} // namespace

int main()
{
    try
    {
        test_small_payload_skips_compression();
        test_compressed_payload();
        test_incompressible_payload_stays_raw();
        test_chunk_count_and_sizes();
        test_encode_rejects_invalid_input();
        test_digest_independent_of_chunk_size();
        test_text_safe_envelope();
        test_marker_bytes_in_payload_are_unambiguous();
        test_untagged_stream_handling();
        test_corrupt_gzip_envelope();
        test_session_account_layout();
        test_chunk_instruction_layout();
        test_compact_u16();
        test_message_compilation_and_signing();
        test_program_addresses();
        test_base58_and_hex();
        test_service_schema();
        test_error_descriptions();
        run_client_pipeline_tests();
        run_client_retrieval_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
