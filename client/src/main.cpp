#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "inscribe/address.hpp"
#include "inscribe/client/chunk_source.hpp"
#include "inscribe/client/config.hpp"
#include "inscribe/client/http_client.hpp"
#include "inscribe/client/json_rpc_ledger.hpp"
#include "inscribe/client/logger.hpp"
#include "inscribe/client/payload_cache.hpp"
#include "inscribe/client/retriever.hpp"
#include "inscribe/client/session_backend.hpp"
#include "inscribe/client/session_index.hpp"
#include "inscribe/client/session_service.hpp"
#include "inscribe/client/signer.hpp"
#include "inscribe/client/uploader.hpp"
#include "inscribe/error_codes.hpp"
#include "inscribe/version.hpp"

namespace
{

    using namespace inscribe;
    using namespace inscribe::client;

    Bytes read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw InscribeError(ErrorCode::InvalidInput, "Unable to open " + path.string());
        }
        return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    void write_file(const std::filesystem::path &path, const Bytes &data)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw InscribeError(ErrorCode::InvalidInput, "Unable to write " + path.string());
        }
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    KeypairSigner load_signer(const ClientConfig &config)
    {
        if (config.keypair_path)
        {
            return KeypairSigner::from_file(*config.keypair_path);
        }
        if (const char *home = std::getenv("HOME"))
        {
            const auto fallback = std::filesystem::path(home) / ".config" / "solana" / "id.json";
            if (std::filesystem::exists(fallback))
            {
                return KeypairSigner::from_file(fallback);
            }
        }
        throw InscribeError(ErrorCode::InvalidInput, "No keypair given, pass --keypair <file>");
    }

    int run_upload(const ClientConfig &config, HttpClient &http, LedgerClient &ledger)
    {
        const auto signer = load_signer(config);
        const auto program_id = address::parse_public_key(config.program_id);
        const auto payload = read_file(config.input_path);

        HttpSessionService service(http, config.service_url);
        std::unique_ptr<SessionBackend> backend;
        if (config.direct)
        {
            backend = std::make_unique<DirectSessionBackend>(program_id);
        }
        else
        {
            backend = std::make_unique<ServiceSessionBackend>(service, program_id);
        }

        Uploader uploader(ledger, signer, *backend, config.upload);
        std::optional<LocalSessionIndex> index;
        if (config.logical_id)
        {
            index.emplace(config.index_path.value_or(LocalSessionIndex::default_index_path()));
            uploader.set_index(&*index);
        }

        try
        {
            const auto result = uploader.upload(payload, config.encode, config.logical_id);
            std::cout << nlohmann::json(result).dump(2) << std::endl;
        }
        catch (const UploadFailedError &ex)
        {
            std::cout << nlohmann::json{{"error", ex.what()},
                                        {"session", ex.session_handle()},
                                        {"unconfirmed", ex.unconfirmed_indices()},
                                        {"attempts", uploader.last_dispatch_log().records()}}
                             .dump(2)
                      << std::endl;
            throw;
        }
        return EXIT_SUCCESS;
    }

    std::string resolve_handle(const ClientConfig &config)
    {
        LocalSessionIndex index(config.index_path.value_or(LocalSessionIndex::default_index_path()));
        if (auto handle = index.lookup(config.session_handle))
        {
            spdlog::info("Resolved {} to session {}", config.session_handle, *handle);
            return *handle;
        }
        return config.session_handle;
    }

    int run_retrieval(const ClientConfig &config, HttpClient &http, LedgerClient &ledger)
    {
        const auto program_id = address::parse_public_key(config.program_id);
        HttpSessionService service(http, config.service_url);
        ServiceMetadataSource service_metadata(service);
        LedgerMetadataSource ledger_metadata(ledger);
        ServiceDownloadSource download(service);
        HistoryScanSource history(ledger, program_id);

        MetadataSource &metadata = config.use_history ? static_cast<MetadataSource &>(ledger_metadata) : service_metadata;
        ChunkSource &primary = config.use_history ? static_cast<ChunkSource &>(history) : download;

        Retriever retriever(metadata, primary, config.retrieval);
        if (!config.use_history)
        {
            retriever.set_fallback(&history);
        }
        PayloadCache cache(config.cache.max_entries, config.cache.max_bytes);
        retriever.set_cache(&cache);

        const auto handle = resolve_handle(config);
        if (config.command == CommandKind::Status)
        {
            const auto progress = retriever.status(handle);
            nlohmann::json json = progress.metadata;
            json["finalized"] = progress.finalized;
            if (progress.chunks_observed)
            {
                json["chunksObserved"] = *progress.chunks_observed;
            }
            std::cout << json.dump(2) << std::endl;
            return EXIT_SUCCESS;
        }

        const auto result = retriever.retrieve(handle);
        write_file(config.output_path, result.data);
        std::cout << nlohmann::json{{"session", handle},
                                    {"bytes", result.data.size()},
                                    {"chunks", result.observed_chunks},
                                    {"declaredChunks", result.declared_chunks},
                                    {"source", result.source},
                                    {"digestVerified", result.digest_verified},
                                    {"warnings", result.warnings}}
                         .dump(2)
                  << std::endl;
        return EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char *argv[])
{
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h"))
    {
        std::cout << "inscribe " << inscribe::version() << "\n"
                  << inscribe::client::usage();
        return EXIT_SUCCESS;
    }

    inscribe::client::ClientConfig config;
    try
    {
        config = inscribe::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        inscribe::client::configure_logging(config.log_path, config.verbose);
        spdlog::debug("inscribe {} using RPC {}", inscribe::version(), config.rpc_url);

        inscribe::client::HttpClient http;
        inscribe::client::JsonRpcLedgerClient ledger(http, config.rpc_url, config.upload.confirmation.commitment);
        if (config.command == inscribe::client::CommandKind::Upload)
        {
            return run_upload(config, http, ledger);
        }
        return run_retrieval(config, http, ledger);
    }
    catch (const inscribe::InscribeError &ex)
    {
        spdlog::error("{} ({})", ex.what(), inscribe::to_string(ex.code()));
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
