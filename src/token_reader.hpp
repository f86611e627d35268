#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <format>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "utils.hpp"
#include "address.hpp"
#include "contract_reader.hpp"
#include "functions.hpp"
#include "metadata.hpp"
#include "reader.hpp"

namespace tkr
{
    static constexpr std::uint32_t MAJOR_VERSION = 0;
    static constexpr std::uint32_t MINOR_VERSION = 1;
    static constexpr std::uint32_t PATCH_VERSION = 0;

    // environment variable read when --rpc is not given
    static constexpr const char * RPC_URL_ENV = "ETHEREUM_JSONRPC_HTTP_URL";
}
