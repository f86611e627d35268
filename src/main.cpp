#include "token_reader.hpp"

#include <cstdlib>
#include <optional>
#include <string_view>

static void _configureLogger(const std::filesystem::path& logs_path)
{
    std::filesystem::create_directories(logs_path);

    // Create sinks
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    const std::string log_name = tkr::utils::currentTimestamp() + "-TokenReader.log";
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (logs_path / log_name).string(), true);

    // set different log levels per sink
    console_sink->set_level(spdlog::level::info);
    file_sink->set_level(spdlog::level::debug);
    console_sink->set_pattern("[%T] [%^%l%$] %v");
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
    
    spdlog::logger logger("multi_sink", {console_sink, file_sink});
    logger.set_level(spdlog::level::debug);
    logger.flush_on(spdlog::level::info);

    spdlog::set_default_logger(std::make_shared<spdlog::logger>(logger));
}

static std::string _helpMessage()
{
    return
        "Usage: token-reader [options] <address>...\n"
        "  -h, --help        Display help message and exit\n"
        "  --version         Display version and exit\n"
        "  --rpc <url>       Ethereum JSON-RPC endpoint URL (default: $" + std::string(tkr::RPC_URL_ENV) + ")\n"
        "  --block <tag>     Block tag or number used for eth_call (default: latest)\n"
        "  --logs <dir>      Directory for log files\n";
}

int main(int argc, char* argv[])
{
    tkr::config::Config cfg;
    cfg.bin_path = std::filesystem::path(argv[0]).parent_path();
    cfg.logs_path = cfg.bin_path.parent_path() / "logs";

    std::vector<std::string> address_args;
    std::optional<std::string> rpc_arg;
    bool show_help = false;
    bool show_version = false;

    for(int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        const bool has_value = (i + 1) < argc;

        if(arg == "-h" || arg == "--help")
        {
            show_help = true;
        }
        else if(arg == "--version")
        {
            show_version = true;
        }
        else if(arg == "--rpc" || arg == "--block" || arg == "--logs")
        {
            if(!has_value)
            {
                std::fprintf(stderr, "Missing value for %s\n%s", argv[i], _helpMessage().c_str());
                return 1;
            }

            const std::string value = argv[++i];
            if(arg == "--rpc")          rpc_arg = value;
            else if(arg == "--block")   cfg.block_tag = value;
            else                        cfg.logs_path = value;
        }
        else if(arg.starts_with("-"))
        {
            std::fprintf(stderr, "Unknown option %s\n%s", argv[i], _helpMessage().c_str());
            return 1;
        }
        else
        {
            address_args.emplace_back(arg);
        }
    }

    _configureLogger(cfg.logs_path);

    spdlog::debug("Token reader started with {} arguments", argc);
    for(int i = 0; i < argc; ++i)
    {
        spdlog::debug("Argument at [{}] : {}", i, argv[i]);
    }

    const std::string build_timestamp = tkr::utils::loadBuildTimestamp(cfg.bin_path / "build_timestamp");
    spdlog::debug("Build timestamp: {}", build_timestamp);

    if(show_version)
    {
        spdlog::info("Token reader build timestamp: {}", build_timestamp);
        spdlog::info("Version: {}.{}.{}", tkr::MAJOR_VERSION, tkr::MINOR_VERSION, tkr::PATCH_VERSION);
        return 0;
    }

    if(show_help)
    {
        spdlog::info(_helpMessage());
        return 0;
    }

    if(rpc_arg)
    {
        cfg.rpc_url = *rpc_arg;
    }
    else if(const char * env_rpc = std::getenv(tkr::RPC_URL_ENV))
    {
        cfg.rpc_url = env_rpc;
    }

    if(cfg.rpc_url.empty())
    {
        spdlog::error("No JSON-RPC endpoint, pass --rpc or set {}", tkr::RPC_URL_ENV);
        return 1;
    }

    if(address_args.empty())
    {
        spdlog::error("No contract address given");
        spdlog::info(_helpMessage());
        return 1;
    }

    std::vector<tkr::chain::Address> addresses;
    addresses.reserve(address_args.size());
    for(const std::string & address_arg : address_args)
    {
        const auto address_res = tkr::chain::parseAddress(address_arg);
        if(!address_res)
        {
            spdlog::error("Invalid contract address: {}", address_arg);
            return 1;
        }
        addresses.push_back(*address_res);
    }

    spdlog::info("Reading {} token(s) from {} at block {}", addresses.size(), cfg.rpc_url, cfg.block_tag);

    const tkr::chain::RpcContractReader reader(tkr::chain::ReaderConfig{
        .rpc_url = cfg.rpc_url,
        .block_tag = cfg.block_tag
    });

    for(const tkr::chain::Address & address : addresses)
    {
        const tkr::token::TokenMetadata metadata = tkr::token::fetchTokenMetadata(reader, address);

        const nlohmann::json line{
            {"address", tkr::chain::addressToHex(address)},
            {"metadata", tkr::token::toJson(metadata)}
        };

        // a byte-truncated name may end inside a UTF-8 sequence
        std::printf("%s\n", line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).c_str());
        std::fflush(stdout);
    }

    spdlog::debug("Program finished");
    return 0;
}
