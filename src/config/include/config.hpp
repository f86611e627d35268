#pragma once
#include <filesystem>
#include <string>

namespace tkr::config
{
    struct Config
    {
        std::filesystem::path bin_path;
        std::filesystem::path logs_path;

        std::string rpc_url;
        std::string block_tag = "latest";
    };
}
