#include "inscribe/client/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace inscribe::client
{

    namespace
    {

        std::string read_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        std::chrono::milliseconds read_millis(const nlohmann::json &json, const char *key, std::chrono::milliseconds fallback)
        {
            return std::chrono::milliseconds(json.value(key, static_cast<std::int64_t>(fallback.count())));
        }

        protocol::DispatchStrategy parse_strategy(const std::string &value)
        {
            auto strategy = protocol::dispatch_strategy_from_string(value);
            if (!strategy)
            {
                throw std::runtime_error("Unknown dispatch strategy: " + value);
            }
            return *strategy;
        }

        protocol::Commitment parse_commitment(const std::string &value)
        {
            auto commitment = protocol::commitment_from_string(value);
            if (!commitment)
            {
                throw std::runtime_error("Unknown commitment level: " + value);
            }
            return *commitment;
        }

    } // namespace

    std::string usage()
    {
        return "Usage:\n"
               "  inscribe upload <file> [--id <logical-id>] [--compress] [--text-safe] [--chunk-size <n>]\n"
               "                  [--strategy batched|sequential|fire-and-forget] [--batch-size <n>] [--direct]\n"
               "  inscribe download <session> <output> [--history] [--no-verify] [--legacy-detect]\n"
               "  inscribe status <session> [--history]\n"
               "Common options:\n"
               "  --rpc <url> --service <url> --program <id> --keypair <file> --config <json>\n"
               "  --log <file> --index <file> --verbose\n";
    }

    void apply_config_file(ClientConfig &config, const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Unable to open config file: " + path.string());
        }
        const auto json = nlohmann::json::parse(in);
        if (!json.is_object())
        {
            throw std::runtime_error("Config file must contain a JSON object");
        }

        config.rpc_url = json.value("rpc", config.rpc_url);
        config.service_url = json.value("service", config.service_url);
        config.program_id = json.value("program", config.program_id);
        if (auto it = json.find("keypair"); it != json.end())
        {
            config.keypair_path = std::filesystem::path(it->get<std::string>());
        }
        if (auto it = json.find("log"); it != json.end())
        {
            config.log_path = std::filesystem::path(it->get<std::string>());
        }
        if (auto it = json.find("index"); it != json.end())
        {
            config.index_path = std::filesystem::path(it->get<std::string>());
        }

        if (auto it = json.find("encode"); it != json.end())
        {
            const auto &encode = *it;
            config.encode.chunk_size = encode.value("chunkSize", config.encode.chunk_size);
            config.encode.compress = encode.value("compress", config.encode.compress);
            config.encode.compression_threshold = encode.value("compressionThreshold", config.encode.compression_threshold);
            config.encode.text_safe = encode.value("textSafe", config.encode.text_safe);
        }

        if (auto it = json.find("dispatch"); it != json.end())
        {
            auto &dispatch = config.upload.dispatch;
            if (auto strategy = it->find("strategy"); strategy != it->end())
            {
                dispatch.strategy = parse_strategy(strategy->get<std::string>());
            }
            dispatch.batch_size = it->value("batchSize", dispatch.batch_size);
            dispatch.stagger = read_millis(*it, "staggerMs", dispatch.stagger);
            dispatch.sequential_delay = read_millis(*it, "sequentialDelayMs", dispatch.sequential_delay);
        }

        if (auto it = json.find("confirmation"); it != json.end())
        {
            auto &confirmation = config.upload.confirmation;
            confirmation.max_wait = read_millis(*it, "maxWaitMs", confirmation.max_wait);
            confirmation.poll_interval = read_millis(*it, "pollIntervalMs", confirmation.poll_interval);
            confirmation.retry_rounds = it->value("retryRounds", confirmation.retry_rounds);
            if (auto commitment = it->find("commitment"); commitment != it->end())
            {
                confirmation.commitment = parse_commitment(commitment->get<std::string>());
            }
        }

        if (auto it = json.find("finalize"); it != json.end())
        {
            config.upload.finalize.attempts = it->value("attempts", config.upload.finalize.attempts);
            config.upload.finalize.retry_delay = read_millis(*it, "retryDelayMs", config.upload.finalize.retry_delay);
        }

        if (auto it = json.find("retrieval"); it != json.end())
        {
            auto &retrieval = config.retrieval;
            retrieval.max_retries = it->value("maxRetries", retrieval.max_retries);
            retrieval.retry_delay = read_millis(*it, "retryDelayMs", retrieval.retry_delay);
            retrieval.strict_digest = it->value("strictDigest", retrieval.strict_digest);
            retrieval.legacy_detection = it->value("legacyDetection", retrieval.legacy_detection);
        }

        if (auto it = json.find("cache"); it != json.end())
        {
            config.cache.max_entries = it->value("maxEntries", config.cache.max_entries);
            config.cache.max_bytes = it->value("maxBytes", config.cache.max_bytes);
        }
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(usage());
        }

        ClientConfig config;
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                apply_config_file(config, std::filesystem::path(argv[i + 1]));
                break;
            }
        }

        int index = 1;
        const std::string command = argv[index++];
        std::vector<std::string> positional;

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--config")
            {
                read_value(index, argc, argv, arg);
            }
            else if (arg == "--rpc")
            {
                config.rpc_url = read_value(index, argc, argv, arg);
            }
            else if (arg == "--service")
            {
                config.service_url = read_value(index, argc, argv, arg);
            }
            else if (arg == "--program")
            {
                config.program_id = read_value(index, argc, argv, arg);
            }
            else if (arg == "--keypair")
            {
                config.keypair_path = std::filesystem::path(read_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(read_value(index, argc, argv, arg));
            }
            else if (arg == "--index")
            {
                config.index_path = std::filesystem::path(read_value(index, argc, argv, arg));
            }
            else if (arg == "--id")
            {
                config.logical_id = read_value(index, argc, argv, arg);
            }
            else if (arg == "--compress")
            {
                config.encode.compress = true;
            }
            else if (arg == "--text-safe")
            {
                config.encode.text_safe = true;
            }
            else if (arg == "--chunk-size")
            {
                config.encode.chunk_size = static_cast<std::size_t>(std::stoul(read_value(index, argc, argv, arg)));
            }
            else if (arg == "--strategy")
            {
                config.upload.dispatch.strategy = parse_strategy(read_value(index, argc, argv, arg));
            }
            else if (arg == "--batch-size")
            {
                config.upload.dispatch.batch_size = static_cast<std::size_t>(std::stoul(read_value(index, argc, argv, arg)));
            }
            else if (arg == "--direct")
            {
                config.direct = true;
            }
            else if (arg == "--history")
            {
                config.use_history = true;
            }
            else if (arg == "--no-verify")
            {
                config.retrieval.strict_digest = false;
            }
            else if (arg == "--legacy-detect")
            {
                config.retrieval.legacy_detection = true;
            }
            else if (arg == "--verbose")
            {
                config.verbose = true;
            }
            else if (arg.rfind("--", 0) == 0)
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }

        if (command == "upload")
        {
            if (positional.size() != 1)
            {
                throw std::runtime_error("upload expects exactly one input file");
            }
            config.command = CommandKind::Upload;
            config.input_path = positional[0];
        }
        else if (command == "download")
        {
            if (positional.size() != 2)
            {
                throw std::runtime_error("download expects a session address and an output path");
            }
            config.command = CommandKind::Download;
            config.session_handle = positional[0];
            config.output_path = positional[1];
        }
        else if (command == "status")
        {
            if (positional.size() != 1)
            {
                throw std::runtime_error("status expects a session address");
            }
            config.command = CommandKind::Status;
            config.session_handle = positional[0];
        }
        else
        {
            throw std::runtime_error("Unknown command: " + command + "\n" + usage());
        }

        return config;
    }

} // namespace inscribe::client
