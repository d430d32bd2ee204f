#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "fake_ledger.hpp"
#include "inscribe/client/chunk_source.hpp"
#include "inscribe/client/config.hpp"
#include "inscribe/client/confirmation_tracker.hpp"
#include "inscribe/client/dispatch_log.hpp"
#include "inscribe/client/payload_cache.hpp"
#include "inscribe/client/retriever.hpp"
#include "inscribe/client/session_index.hpp"
#include "inscribe/client/session_manager.hpp"
#include "inscribe/client/signer.hpp"
#include "inscribe/client/uploader.hpp"

using namespace inscribe;
using namespace std::chrono_literals;
using test::fast_settings;
using test::Harness;
using test::noise;
using test::payload_for_chunks;

namespace
{

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

    void test_single_chunk_upload()
    {
        Harness harness;
        auto uploader = harness.uploader();
        const auto payload = noise(50, 3);

        codec::EncodeOptions options;
        options.compress = true;
        const auto result = uploader.upload(payload, options);

        assert(result.chunk_count == 1);
        assert(!result.compressed);
        assert(result.signatures.size() == 2);
        assert(result.signatures.back() == result.finalize_signature);
        assert(result.init_storage_signature.has_value());
        assert(!result.create_signature.empty());
        assert(result.rounds == 1);

        const auto account = harness.ledger.session(address::parse_public_key(result.session_handle));
        assert(account.has_value());
        assert(account->status == layout::SessionStatus::Finalized);
        assert(account->total_chunks == 1);
        assert(account->digest == result.digest);
    }

    void test_compressed_upload_round_trip()
    {
        Harness harness;
        auto uploader = harness.uploader();
        std::string text;
        while (text.size() < 5000)
        {
            text += "chunk payloads are reassembled by index, never by arrival; ";
        }
        text.resize(5000);
        const Bytes payload(text.begin(), text.end());

        codec::EncodeOptions options;
        options.compress = true;
        const auto result = uploader.upload(payload, options);
        assert(result.compressed);
        assert(result.method == codec::EncodingMethod::Gzip);
        assert(result.encoded_size < payload.size());

        client::LedgerMetadataSource metadata(harness.ledger);
        client::HistoryScanSource history(harness.ledger, harness.program_id);
        client::RetrievalSettings settings;
        settings.retry_delay = 1ms;
        client::Retriever retriever(metadata, history, settings);
        const auto retrieved = retriever.retrieve(result.session_handle);
        assert(retrieved.data == payload);
        assert(retrieved.digest_verified);
        assert(retrieved.observed_chunks == result.chunk_count);
        assert(retrieved.warnings.empty());
    }

    void test_batches_share_one_blockhash()
    {
        Harness harness;
        auto uploader = harness.uploader();
        const auto payload = payload_for_chunks(20);
        const auto result = uploader.upload(payload, codec::EncodeOptions{});

        assert(result.chunk_count == 20);
        assert(result.batches_dispatched == 4);
        assert(result.signatures.size() == 21);
        assert(harness.ledger.largest_status_query() <= 5);

        std::set<wire::Blockhash> blockhashes;
        for (const auto &submission : harness.ledger.chunk_submissions())
        {
            blockhashes.insert(submission.blockhash);
        }
        assert(blockhashes.size() == 4);

        const auto account = harness.ledger.session(address::parse_public_key(result.session_handle));
        assert(account && account->status == layout::SessionStatus::Finalized);
    }

    void test_stalled_chunk_is_resent()
    {
        Harness harness;
        harness.ledger.stall_first_attempt(7);
        auto uploader = harness.uploader();
        const auto result = uploader.upload(payload_for_chunks(10), codec::EncodeOptions{});

        assert(result.chunk_count == 10);
        assert(result.rounds == 2);
        assert(result.attempts.size() == 11);
        assert(result.signatures.size() == 11);

        const auto resent = harness.ledger.submissions_of(7);
        assert(resent.size() == 2);
        assert(resent[0].blockhash != resent[1].blockhash);
        assert(resent[0].signature != resent[1].signature);

        std::size_t failed = 0;
        for (const auto &record : result.attempts)
        {
            if (record.outcome == client::DispatchOutcome::Failed)
            {
                assert(record.chunk_index == 7);
                assert(record.attempt == 1);
                ++failed;
            }
        }
        assert(failed == 1);
        assert(result.signatures[7] == resent[1].signature);
    }

    void test_retry_exhaustion()
    {
        Harness harness;
        harness.ledger.fail_chunk(3, 10);
        auto uploader = harness.uploader();
        bool thrown = false;
        try
        {
            uploader.upload(payload_for_chunks(5), codec::EncodeOptions{});
        }
        catch (const UploadFailedError &ex)
        {
            thrown = true;
            assert(ex.code() == ErrorCode::UploadFailed);
            assert(ex.unconfirmed_indices() == std::vector<std::uint32_t>{3});
            assert(!ex.session_handle().empty());
        }
        assert(thrown);
        assert(harness.ledger.submissions_of(3).size() == 3);
        assert(harness.ledger.submissions_of(0).size() == 1);
        assert(harness.ledger.finalize_submissions() == 0);

        const auto &log = uploader.last_dispatch_log();
        assert(log.count(client::DispatchOutcome::Failed) == 3);
        assert(log.count(client::DispatchOutcome::Confirmed) == 4);
        for (const auto &record : log.records())
        {
            if (record.outcome == client::DispatchOutcome::Failed)
            {
                assert(record.error.has_value());
            }
        }
    }

    void test_dispatch_strategies()
    {
        {
            Harness harness;
            auto settings = fast_settings();
            settings.dispatch.strategy = protocol::DispatchStrategy::Sequential;
            auto uploader = harness.uploader(settings);
            const auto result = uploader.upload(payload_for_chunks(3), codec::EncodeOptions{});
            assert(result.batches_dispatched == 3);
            assert(harness.ledger.largest_status_query() == 1);
        }
        {
            Harness harness;
            auto settings = fast_settings();
            settings.dispatch.strategy = protocol::DispatchStrategy::FireAndForget;
            auto uploader = harness.uploader(settings);
            const auto result = uploader.upload(payload_for_chunks(6), codec::EncodeOptions{});
            assert(result.batches_dispatched == 1);
            assert(result.signatures.size() == 7);
            assert(harness.ledger.largest_status_query() == 6);
        }
    }

    void test_fire_and_forget_windows()
    {
        {
            Harness harness;
            auto settings = fast_settings();
            settings.dispatch.strategy = protocol::DispatchStrategy::FireAndForget;
            auto uploader = harness.uploader(settings);
            const auto result = uploader.upload(payload_for_chunks(300), codec::EncodeOptions{});
            assert(result.chunk_count == 300);
            assert(result.signatures.size() == 301);
            assert(result.batches_dispatched == 2);
            assert(harness.ledger.largest_status_query() == client::LedgerClient::kStatusQueryLimit);
        }
        {
            // Oversized batches are refused before anything reaches the ledger.
            Harness harness;
            auto settings = fast_settings();
            settings.dispatch.batch_size = client::LedgerClient::kStatusQueryLimit + 1;
            auto uploader = harness.uploader(settings);
            const auto code = error_of([&]
                                       { uploader.upload(noise(200, 5), codec::EncodeOptions{}); });
            assert(code == ErrorCode::InvalidInput);
            assert(harness.ledger.simulations() == 0);
            assert(harness.ledger.create_submissions() == 0);
        }
    }

    void test_existing_storage_is_reused()
    {
        Harness harness;
        harness.ledger.mark_storage_initialized(harness.signer.public_key());
        auto uploader = harness.uploader();
        const auto result = uploader.upload(noise(200, 5), codec::EncodeOptions{});

        assert(!result.init_storage_signature.has_value());
        assert(harness.ledger.init_submissions() == 0);
        assert(harness.ledger.simulations() == 1);
        assert(result.signatures.size() == 2);
    }

    void test_fatal_storage_error_aborts()
    {
        Harness harness;
        harness.ledger.reject_storage_init("insufficient funds for rent");
        auto uploader = harness.uploader();
        const auto code = error_of([&]
                                   { uploader.upload(noise(200, 5), codec::EncodeOptions{}); });
        assert(code == ErrorCode::SessionCreationFailed);
        assert(harness.ledger.chunk_submissions().empty());
    }

    void test_finalize_retries()
    {
        {
            Harness harness;
            harness.ledger.fail_finalize(1);
            auto uploader = harness.uploader();
            const auto result = uploader.upload(noise(300, 9), codec::EncodeOptions{});
            assert(harness.ledger.finalize_submissions() == 2);
            assert(!result.finalize_signature.empty());
        }
        {
            Harness harness;
            harness.ledger.fail_finalize(10);
            auto uploader = harness.uploader();
            bool thrown = false;
            try
            {
                uploader.upload(noise(300, 9), codec::EncodeOptions{});
            }
            catch (const FinalizationFailedError &ex)
            {
                thrown = true;
                assert(ex.code() == ErrorCode::FinalizationFailed);
                const auto account = harness.ledger.session(address::parse_public_key(ex.session_handle()));
                assert(account && account->status == layout::SessionStatus::Active);
            }
            assert(thrown);
            assert(harness.ledger.finalize_submissions() == 3);
        }
    }

    void test_unconfirmed_finalize_that_landed()
    {
        Harness harness;
        harness.ledger.hide_first_finalize_status();
        auto uploader = harness.uploader();
        const auto result = uploader.upload(noise(300, 9), codec::EncodeOptions{});

        // The account read after the timeout sees Finalized, so no second finalize is sent.
        assert(harness.ledger.finalize_submissions() == 1);
        assert(harness.ledger.finalize_signatures() == std::vector<std::string>{result.finalize_signature});
        assert(result.signatures.back() == result.finalize_signature);
        const auto account = harness.ledger.session(address::parse_public_key(result.session_handle));
        assert(account && account->status == layout::SessionStatus::Finalized);
    }

    void test_unconfirmed_session_creation()
    {
        {
            Harness harness;
            harness.ledger.hide_create_status();
            auto uploader = harness.uploader();
            const auto result = uploader.upload(payload_for_chunks(2), codec::EncodeOptions{});
            assert(harness.ledger.create_submissions() == 1);
            assert(!result.create_signature.empty());
            assert(result.chunk_count == 2);
            assert(harness.ledger.finalize_submissions() == 1);
        }
        {
            Harness harness;
            harness.ledger.drop_create();
            auto uploader = harness.uploader();
            const auto code = error_of([&]
                                       { uploader.upload(payload_for_chunks(2), codec::EncodeOptions{}); });
            assert(code == ErrorCode::SessionCreationFailed);
            assert(harness.ledger.create_submissions() == 1);
            assert(harness.ledger.chunk_submissions().empty());
        }
    }

    void test_service_backend_upload()
    {
        Harness harness;
        test::FakeSessionService service(harness.ledger);
        client::ServiceSessionBackend backend(service, harness.program_id);
        client::Uploader uploader(harness.ledger, harness.signer, backend, fast_settings());
        const auto payload = payload_for_chunks(4, 21);
        const auto result = uploader.upload(payload, codec::EncodeOptions{});
        assert(result.chunk_count == 4);

        client::ServiceMetadataSource metadata(service);
        client::ServiceDownloadSource download(service);
        client::RetrievalSettings settings;
        settings.retry_delay = 1ms;
        client::Retriever retriever(metadata, download, settings);
        const auto retrieved = retriever.retrieve(result.session_handle);
        assert(retrieved.data == payload);
        assert(retrieved.source == "service-download");
    }

    void test_service_plan_mismatch_rejected()
    {
        Harness harness;
        test::FakeSessionService service(harness.ledger);
        service.announced_total = 99;
        client::ServiceSessionBackend backend(service, harness.program_id);
        client::Uploader uploader(harness.ledger, harness.signer, backend, fast_settings());
        const auto code = error_of([&]
                                   { uploader.upload(payload_for_chunks(2), codec::EncodeOptions{}); });
        assert(code == ErrorCode::SessionCreationFailed);
        assert(harness.ledger.chunk_submissions().empty());
    }

    // Returns one scripted status map per poll and records what was asked.
    class ScriptedStatusLedger : public client::LedgerClient
    {
    public:
        std::vector<std::map<std::string, client::SignatureStatus>> polls;
        std::vector<std::vector<std::string>> queries;
        std::chrono::milliseconds latency{0};

        wire::Blockhash latest_blockhash() override { throw InscribeError(ErrorCode::Unsupported, "not scripted"); }
        std::string submit_transaction(const Bytes &) override { throw InscribeError(ErrorCode::Unsupported, "not scripted"); }
        client::SimulationResult simulate_transaction(const Bytes &) override
        {
            throw InscribeError(ErrorCode::Unsupported, "not scripted");
        }
        std::optional<Bytes> account_info(const PublicKey &) override { return std::nullopt; }
        std::vector<client::HistoricalTransaction> transaction_history(const PublicKey &) override { return {}; }

        std::vector<std::optional<client::SignatureStatus>> signature_statuses(const std::vector<std::string> &signatures) override
        {
            std::this_thread::sleep_for(latency);
            const auto poll = queries.size();
            queries.push_back(signatures);
            std::vector<std::optional<client::SignatureStatus>> result;
            for (const auto &signature : signatures)
            {
                std::optional<client::SignatureStatus> status;
                if (poll < polls.size())
                {
                    if (auto it = polls[poll].find(signature); it != polls[poll].end())
                    {
                        status = it->second;
                    }
                }
                result.push_back(status);
            }
            return result;
        }
    };

    void test_tracker_only_polls_pending()
    {
        using protocol::Commitment;
        ScriptedStatusLedger ledger;
        ledger.polls = {
            {{"a", {Commitment::Confirmed, std::nullopt}}, {"c", {Commitment::Processed, std::nullopt}}},
            {{"a", {Commitment::Processed, std::string("rolled back")}}, {"b", {Commitment::Finalized, std::nullopt}}},
            {{"c", {Commitment::Confirmed, std::string("{\"InstructionError\":[0,{\"Custom\":1}]}")}}},
            {},
            {{"d", {Commitment::Confirmed, std::nullopt}}},
        };

        client::ConfirmationSettings settings;
        settings.max_wait = 1000ms;
        settings.poll_interval = 5ms;
        client::ConfirmationTracker tracker(ledger, settings);
        assert(tracker.max_polls() == 200);

        const auto report = tracker.confirm({"a", "b", "c", "d"});
        assert(report.is_confirmed("a"));
        assert(report.is_confirmed("b"));
        assert(!report.is_confirmed("c"));
        assert(report.is_confirmed("d"));
        assert(report.errors.size() == 1);
        assert(report.errors.count("c") == 1);
        assert(!report.timed_out);
        assert(report.polls == 5);
        assert(tracker.status_queries() == 5);

        assert(ledger.queries[0].size() == 4);
        // "a" confirmed on the first poll and is never asked about again.
        for (std::size_t poll = 1; poll < ledger.queries.size(); ++poll)
        {
            const auto &asked = ledger.queries[poll];
            assert(std::find(asked.begin(), asked.end(), "a") == asked.end());
        }
        assert(ledger.queries[1] == (std::vector<std::string>{"b", "c", "d"}));
        assert(ledger.queries[3] == std::vector<std::string>{"d"});
        assert(ledger.queries[4] == std::vector<std::string>{"d"});
    }

    void test_tracker_commitment_level()
    {
        ScriptedStatusLedger ledger;
        ledger.polls = {{{"x", {protocol::Commitment::Confirmed, std::nullopt}}}};
        client::ConfirmationSettings settings;
        settings.max_wait = 10ms;
        settings.poll_interval = 5ms;
        settings.commitment = protocol::Commitment::Finalized;
        client::ConfirmationTracker tracker(ledger, settings);
        const auto report = tracker.confirm({"x"});
        assert(!report.is_confirmed("x"));
        assert(report.timed_out);
        assert(report.polls >= 1 && report.polls <= 2);
    }

    void test_tracker_wait_is_wall_clock()
    {
        // Slow status queries eat into the wait budget.
        ScriptedStatusLedger ledger;
        ledger.latency = 40ms;
        client::ConfirmationSettings settings;
        settings.max_wait = 100ms;
        settings.poll_interval = 10ms;
        client::ConfirmationTracker tracker(ledger, settings);
        assert(tracker.max_polls() == 10);

        const auto started = std::chrono::steady_clock::now();
        const auto report = tracker.confirm({"slow"});
        const auto elapsed = std::chrono::steady_clock::now() - started;

        assert(report.timed_out);
        assert(!report.is_confirmed("slow"));
        assert(report.polls >= 1 && report.polls <= 3);
        assert(elapsed < 400ms);

        // The first poll runs even with no budget at all.
        ScriptedStatusLedger instant;
        instant.polls = {{{"now", {protocol::Commitment::Confirmed, std::nullopt}}}};
        settings.max_wait = 0ms;
        client::ConfirmationTracker eager(instant, settings);
        const auto quick = eager.confirm({"now"});
        assert(quick.is_confirmed("now"));
        assert(quick.polls == 1);
    }

    void test_dispatch_log()
    {
        client::DispatchLog log;
        const auto first = log.add(0, "sig-0", 1);
        const auto second = log.add(1, "sig-1a", 1);
        log.add_failure(2, 1, "blockhash unavailable");
        log.resolve(first, client::DispatchOutcome::Confirmed);
        log.resolve(second, client::DispatchOutcome::Failed, std::string("timeout"));

        // A confirmed record keeps its outcome.
        log.resolve(first, client::DispatchOutcome::Failed, std::string("late error"));
        assert(log.records()[first].outcome == client::DispatchOutcome::Confirmed);
        assert(!log.records()[first].error.has_value());

        assert(log.unconfirmed(3) == (std::vector<std::uint32_t>{1, 2}));
        assert(!log.all_confirmed(3));

        const auto retry = log.add(1, "sig-1b", 2);
        log.resolve(retry, client::DispatchOutcome::Confirmed);
        const auto last = log.add(2, "sig-2", 2);
        log.resolve(last, client::DispatchOutcome::Confirmed);

        assert(log.all_confirmed(3));
        assert(log.confirmed_signature(1) == std::optional<std::string>("sig-1b"));
        assert(log.confirmed_signatures(3) == (std::vector<std::string>{"sig-0", "sig-1b", "sig-2"}));
        assert(log.count(client::DispatchOutcome::Failed) == 2);

        nlohmann::json json = log.records()[2];
        assert(json["outcome"] == "failed");
        assert(json["chunk"] == 2);
    }

    void test_already_initialized_markers()
    {
        using client::SessionManager;
        assert(SessionManager::is_already_initialized("Transaction simulation failed: custom program error: 0x0"));
        assert(SessionManager::is_already_initialized("{\"InstructionError\":[0,{\"Custom\":0}]}"));
        assert(SessionManager::is_already_initialized("Allocate: account Address { .. } already in use"));
        assert(!SessionManager::is_already_initialized("custom program error: 0x1"));
        assert(!SessionManager::is_already_initialized("insufficient funds for rent"));
    }

    void test_payload_cache()
    {
        client::PayloadCache cache(2, 100);
        cache.put("a", Bytes(10, 1));
        cache.put("b", Bytes(20, 2));
        assert(cache.get("a").has_value());
        cache.put("c", Bytes(30, 3));
        assert(cache.size() == 2);
        assert(!cache.get("b").has_value());
        assert(cache.get("a") == Bytes(10, 1));
        assert(cache.bytes() == 40);

        cache.put("huge", Bytes(101, 4));
        assert(!cache.get("huge").has_value());

        cache.put("d", Bytes(80, 5));
        assert(cache.bytes() <= 100);
        assert(cache.get("d").has_value());

        cache.erase("d");
        assert(!cache.get("d").has_value());
        cache.clear();
        assert(cache.size() == 0);
        assert(cache.bytes() == 0);

        client::PayloadCache disabled(0, 100);
        disabled.put("a", Bytes(1, 1));
        assert(!disabled.get("a").has_value());
    }

    void test_local_session_index()
    {
        const auto path = std::filesystem::temp_directory_path() /
                          ("inscribe-index-" + crypto::to_hex(crypto::random_session_id()) + ".json");
        {
            client::LocalSessionIndex index(path);
            assert(index.entries().empty());
            index.publish("backup/photos", "SessionOne");
            index.publish("notes", "SessionTwo");
            index.publish("backup/photos", "SessionThree");
            assert(index.entries().size() == 2);
        }
        {
            client::LocalSessionIndex reloaded(path);
            assert(reloaded.entries().size() == 2);
            assert(reloaded.lookup("backup/photos") == std::optional<std::string>("SessionThree"));
            assert(reloaded.lookup("notes") == std::optional<std::string>("SessionTwo"));
            assert(!reloaded.lookup("missing").has_value());
        }
        std::filesystem::remove(path);
    }

    client::ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "inscribe");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return client::parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    void test_parse_arguments()
    {
        const auto upload = parse({"upload", "photo.jpg", "--compress", "--strategy", "sequential", "--batch-size", "3",
                                   "--id", "photos/1", "--direct"});
        assert(upload.command == client::CommandKind::Upload);
        assert(upload.input_path == "photo.jpg");
        assert(upload.encode.compress);
        assert(upload.upload.dispatch.strategy == protocol::DispatchStrategy::Sequential);
        assert(upload.upload.dispatch.batch_size == 3);
        assert(upload.logical_id == std::optional<std::string>("photos/1"));
        assert(upload.direct);

        const auto download = parse({"download", "Sess1on", "out.bin", "--history", "--no-verify"});
        assert(download.command == client::CommandKind::Download);
        assert(download.session_handle == "Sess1on");
        assert(download.output_path == "out.bin");
        assert(download.use_history);
        assert(!download.retrieval.strict_digest);

        const auto status = parse({"status", "Sess1on"});
        assert(status.command == client::CommandKind::Status);

        assert(parse_fails({"upload"}));
        assert(parse_fails({"upload", "a", "--strategy", "bogus"}));
        assert(parse_fails({"download", "only-one"}));
        assert(parse_fails({"upload", "a", "--unknown"}));
        assert(parse_fails({"upload", "a", "--rpc"}));
        assert(parse_fails({"erase", "a"}));
    }

    void test_config_file_overrides()
    {
        const auto path = std::filesystem::temp_directory_path() /
                          ("inscribe-config-" + crypto::to_hex(crypto::random_session_id()) + ".json");
        {
            std::ofstream out(path);
            out << R"({"rpc": "http://node:8899", "dispatch": {"strategy": "fire-and-forget", "batchSize": 8},
                       "confirmation": {"maxWaitMs": 5000, "commitment": "finalized"},
                       "retrieval": {"maxRetries": 2, "strictDigest": false}})";
        }
        const auto config = parse({"status", "Sess1on", "--config", path.string(), "--batch-size", "2"});
        assert(config.rpc_url == "http://node:8899");
        assert(config.upload.dispatch.strategy == protocol::DispatchStrategy::FireAndForget);
        assert(config.upload.dispatch.batch_size == 2);
        assert(config.upload.confirmation.max_wait == 5000ms);
        assert(config.upload.confirmation.commitment == protocol::Commitment::Finalized);
        assert(config.retrieval.max_retries == 2);
        assert(!config.retrieval.strict_digest);
        std::filesystem::remove(path);
    }

} // namespace

void run_client_pipeline_tests()
{
    test_single_chunk_upload();
    test_compressed_upload_round_trip();
    test_batches_share_one_blockhash();
    test_stalled_chunk_is_resent();
    test_retry_exhaustion();
    test_dispatch_strategies();
    test_fire_and_forget_windows();
    test_existing_storage_is_reused();
    test_fatal_storage_error_aborts();
    test_finalize_retries();
    test_unconfirmed_finalize_that_landed();
    test_unconfirmed_session_creation();
    test_service_backend_upload();
    test_service_plan_mismatch_rejected();
    test_tracker_only_polls_pending();
    test_tracker_commitment_level();
    test_tracker_wait_is_wall_clock();
    test_dispatch_log();
    test_already_initialized_markers();
    test_payload_cache();
    test_local_session_index();
    test_parse_arguments();
    test_config_file_overrides();
    std::cout << "client pipeline tests passed\n";
}
