#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "fake_ledger.hpp"
#include "inscribe/client/chunk_source.hpp"
#include "inscribe/client/http_client.hpp"
#include "inscribe/client/payload_cache.hpp"
#include "inscribe/client/retriever.hpp"

using namespace inscribe;
using namespace std::chrono_literals;
using test::Harness;
using test::noise;
using test::payload_for_chunks;

namespace
{

    client::RetrievalSettings quick_retrieval(std::size_t max_retries = 5)
    {
        client::RetrievalSettings settings;
        settings.max_retries = max_retries;
        settings.retry_delay = 1ms;
        return settings;
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

    bool mentions(const std::vector<std::string> &warnings, const std::string &text)
    {
        return std::any_of(warnings.begin(), warnings.end(),
                           [&](const std::string &warning)
                           { return warning.find(text) != std::string::npos; });
    }

    // Uploads `payload` and returns the session address.
    std::string store(Harness &harness, const Bytes &payload)
    {
        auto uploader = harness.uploader();
        return uploader.upload(payload, codec::EncodeOptions{}).session_handle;
    }

    void test_waits_until_finalized()
    {
        Harness harness;
        const auto payload = payload_for_chunks(3);
        const auto handle = store(harness, payload);

        test::FakeSessionService service(harness.ledger);
        service.status_script = {layout::SessionStatus::Active};
        client::ServiceMetadataSource metadata(service);
        client::ServiceDownloadSource download(service);
        client::Retriever retriever(metadata, download, quick_retrieval());

        const auto result = retriever.retrieve(handle);
        assert(result.metadata_attempts == 2);
        assert(result.data == payload);
        assert(result.declared_chunks == 3);
        assert(result.digest_verified);
    }

    void test_never_finalized()
    {
        Harness harness;
        harness.ledger.fail_finalize(10);
        auto uploader = harness.uploader();
        std::string handle;
        try
        {
            uploader.upload(payload_for_chunks(4), codec::EncodeOptions{});
        }
        catch (const FinalizationFailedError &ex)
        {
            handle = ex.session_handle();
        }
        assert(!handle.empty());

        client::LedgerMetadataSource metadata(harness.ledger);
        client::HistoryScanSource history(harness.ledger, harness.program_id);
        client::Retriever retriever(metadata, history, quick_retrieval(2));
        assert(error_of([&]
                        { retriever.retrieve(handle); }) == ErrorCode::SessionNotFinalized);

        // Progress is still visible without reconstructing anything.
        const auto progress = retriever.status(handle);
        assert(!progress.finalized);
        assert(progress.metadata.total_chunks == 4);
        assert(progress.chunks_observed == std::optional<std::size_t>(4));
    }

    void test_metadata_retry_budget()
    {
        Harness harness;
        const auto handle = store(harness, noise(900, 4));
        test::FakeSessionService service(harness.ledger);
        client::ServiceMetadataSource metadata(service);
        client::ServiceDownloadSource download(service);

        service.status_script = {layout::SessionStatus::Active, layout::SessionStatus::Active,
                                 layout::SessionStatus::Active, layout::SessionStatus::Active};
        client::Retriever impatient(metadata, download, quick_retrieval(2));
        assert(error_of([&]
                        { impatient.retrieve(handle); }) == ErrorCode::SessionNotFinalized);
        assert(service.metadata_calls == 3);
        assert(service.download_calls == 0);

        service.status_script.clear();
        service.metadata_calls = 0;
        service.metadata_outages = 2;
        client::Retriever patient(metadata, download, quick_retrieval(3));
        const auto result = patient.retrieve(handle);
        assert(result.metadata_attempts == 3);
        assert(result.data == noise(900, 4));

        service.metadata_outages = 5;
        assert(error_of([&]
                        { impatient.retrieve(handle); }) == ErrorCode::TransportError);

        service.metadata_outages = 0;
        service.metadata_calls = 0;
        assert(error_of([&]
                        { patient.retrieve(address::to_base58(PublicKey{})); }) == ErrorCode::SessionNotFound);
        assert(service.metadata_calls == 1);
    }

    codec::Chunk chunk(std::uint32_t index, const std::string &text)
    {
        return codec::Chunk{index, Bytes(text.begin(), text.end())};
    }

    void test_reassemble_orders_by_index()
    {
        const auto ordered = client::reassemble({chunk(2, "cc"), chunk(0, "aa"), chunk(1, "bb")}, 3);
        assert(ordered.stream == Bytes({'a', 'a', 'b', 'b', 'c', 'c'}));
        assert(ordered.observed_chunks == 3);
        assert(ordered.warnings.empty());

        // The first copy of a duplicated index wins.
        const auto duplicated = client::reassemble({chunk(1, "b1"), chunk(0, "a"), chunk(1, "b2")}, 2);
        assert(duplicated.stream == Bytes({'a', 'b', '1'}));
        assert(duplicated.observed_chunks == 2);
        assert(mentions(duplicated.warnings, "duplicate"));

        const auto gapped = client::reassemble({chunk(3, "d"), chunk(0, "a")}, 4);
        assert(gapped.stream == Bytes({'a', 'd'}));
        assert(gapped.observed_chunks == 2);
        assert(mentions(gapped.warnings, "first missing index 1"));
        assert(mentions(gapped.warnings, "count mismatch"));

        const auto extra = client::reassemble({chunk(0, "a"), chunk(1, "b")}, 1);
        assert(extra.observed_chunks == 2);
        assert(mentions(extra.warnings, "declares 1, found 2"));
    }

    void test_history_order_is_irrelevant()
    {
        Harness harness;
        const auto payload = payload_for_chunks(6, 17);
        const auto handle = store(harness, payload);

        // History comes back newest first; the index inside each chunk decides.
        client::LedgerMetadataSource metadata(harness.ledger);
        client::HistoryScanSource history(harness.ledger, harness.program_id);
        const auto acquired = history.acquire(handle, metadata.fetch(handle));
        assert(acquired.chunks.size() == 6);
        assert(acquired.chunks.front().index != 0);

        client::Retriever retriever(metadata, history, quick_retrieval());
        const auto result = retriever.retrieve(handle);
        assert(result.data == payload);
        assert(result.source == "history-scan");
        assert(result.observed_chunks == 6);
    }

    void test_digest_mismatch()
    {
        Harness harness;
        const auto payload = noise(1500, 8);
        const auto handle = store(harness, payload);
        test::FakeSessionService service(harness.ledger);
        client::ServiceMetadataSource metadata(service);
        client::ServiceDownloadSource download(service);

        auto tampered = service.download(handle);
        tampered.back() ^= 0xFF;
        service.download_override = tampered;

        client::Retriever strict(metadata, download, quick_retrieval());
        assert(error_of([&]
                        { strict.retrieve(handle); }) == ErrorCode::DigestMismatch);

        auto lenient_settings = quick_retrieval();
        lenient_settings.strict_digest = false;
        client::PayloadCache cache(4, 1 << 20);
        client::Retriever lenient(metadata, download, lenient_settings);
        lenient.set_cache(&cache);
        const auto result = lenient.retrieve(handle);
        assert(!result.digest_verified);
        assert(mentions(result.warnings, "Digest mismatch"));
        assert(result.data.size() == payload.size());
        assert(result.data != payload);
        // Unverified data is never cached.
        assert(cache.size() == 0);

        service.download_override = Bytes{};
        assert(error_of([&]
                        { lenient.retrieve(handle); }) == ErrorCode::ChunkCountMismatch);
    }

    void test_falls_back_to_history()
    {
        Harness harness;
        const auto payload = payload_for_chunks(2, 23);
        const auto handle = store(harness, payload);
        test::FakeSessionService service(harness.ledger);
        service.download_unavailable = true;

        client::ServiceMetadataSource metadata(service);
        client::ServiceDownloadSource download(service);
        client::HistoryScanSource history(harness.ledger, harness.program_id);
        client::Retriever retriever(metadata, download, quick_retrieval());

        assert(error_of([&]
                        { retriever.retrieve(handle); }) == ErrorCode::TransportError);

        retriever.set_fallback(&history);
        const auto result = retriever.retrieve(handle);
        assert(result.data == payload);
        assert(result.source == "history-scan");
        assert(mentions(result.warnings, "falling back to history-scan"));
    }

    void test_cache_serves_repeat_reads()
    {
        Harness harness;
        const auto payload = noise(2000, 31);
        const auto handle = store(harness, payload);
        test::FakeSessionService service(harness.ledger);
        client::ServiceMetadataSource metadata(service);
        client::ServiceDownloadSource download(service);
        client::PayloadCache cache(4, 1 << 20);
        client::Retriever retriever(metadata, download, quick_retrieval());
        retriever.set_cache(&cache);

        const auto first = retriever.retrieve(handle);
        assert(!first.from_cache);
        const auto second = retriever.retrieve(handle);
        assert(second.from_cache);
        assert(second.source == "cache");
        assert(second.data == payload);
        assert(service.download_calls == 1);
        assert(service.metadata_calls == 2);
    }

    void test_status_without_history_source()
    {
        Harness harness;
        const auto handle = store(harness, noise(100, 2));
        test::FakeSessionService service(harness.ledger);
        client::ServiceMetadataSource metadata(service);
        client::ServiceDownloadSource download(service);
        client::Retriever retriever(metadata, download, quick_retrieval());

        const auto progress = retriever.status(handle);
        assert(progress.finalized);
        assert(!progress.chunks_observed.has_value());
        assert(service.download_calls == 0);
    }

    void test_http_response_parsing()
    {
        const auto chunked = client::parse_http_response("HTTP/1.1 200 OK\r\n"
                                                         "Transfer-Encoding: chunked\r\n\r\n"
                                                         "5\r\nhello\r\n"
                                                         "6;ext=1\r\n world\r\n"
                                                         "0\r\n\r\n");
        assert(chunked.ok());
        assert(chunked.body == "hello world");

        const auto sized = client::parse_http_response("HTTP/1.1 404 Not Found\r\nContent-Length: 4\r\n\r\ngonetrailing");
        assert(!sized.ok());
        assert(sized.body == "gone");

        // A chunk size near the top of size_t must not wrap the bounds check.
        const auto huge = error_of([]
                                   { client::parse_http_response("HTTP/1.1 200 OK\r\n"
                                                                 "Transfer-Encoding: chunked\r\n\r\n"
                                                                 "ffffffffffffffff\r\nabc\r\n0\r\n\r\n"); });
        assert(huge == ErrorCode::TransportError);

        const auto truncated = error_of([]
                                        { client::parse_http_response("HTTP/1.1 200 OK\r\n"
                                                                      "Transfer-Encoding: chunked\r\n\r\n"
                                                                      "10\r\nshort\r\n"); });
        assert(truncated == ErrorCode::TransportError);

        const auto bad_length = error_of([]
                                         { client::parse_http_response("HTTP/1.1 200 OK\r\nContent-Length: lots\r\n\r\nx"); });
        assert(bad_length == ErrorCode::TransportError);
    }

} // namespace

void run_client_retrieval_tests()
{
    test_waits_until_finalized();
    test_never_finalized();
    test_metadata_retry_budget();
    test_reassemble_orders_by_index();
    test_history_order_is_irrelevant();
    test_digest_mismatch();
    test_falls_back_to_history();
    test_cache_serves_repeat_reads();
    test_status_without_history_source();
    test_http_response_parsing();
    std::cout << "client retrieval tests passed\n";
}
