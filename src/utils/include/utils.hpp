#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace tkr::utils
{
    std::string loadBuildTimestamp(const std::filesystem::path & path);

    std::string currentTimestamp();

    std::string toLower(std::string value);

    std::string stripHexPrefix(const std::string & value);

    std::string bytesToHex(const std::uint8_t* bytes, std::size_t size, bool with_prefix = true);

    std::string bytesToHex(const std::vector<std::uint8_t> & bytes, bool with_prefix = true);

    /**
     * @brief Strict UTF-8 check.
     *
     * Rejects overlong encodings, UTF-16 surrogates, code points above U+10FFFF
     * and truncated sequences.
     */
    bool isValidUtf8(std::string_view text);

    std::string removeNullBytes(std::string text);
}
