#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <fstream>

namespace tkr::utils
{
    std::string loadBuildTimestamp(const std::filesystem::path & path) 
    {
        std::ifstream file(path);
        if (!file.is_open()) return "Unknown";
        std::string timestamp;
        std::getline(file, timestamp);
        return timestamp;
    }

    std::string currentTimestamp()
    {
        const auto zt{ std::chrono::zoned_time{
            std::chrono::current_zone(),
            std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())}
            };
        std::string ts = std::format("{:%F-%H_%M_%S}", zt);
        return ts;
    }

    std::string toLower(std::string value)
    {
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string stripHexPrefix(const std::string & value)
    {
        if(value.rfind("0x", 0) == 0 || value.rfind("0X", 0) == 0)
        {
            return value.substr(2);
        }
        return value;
    }

    std::string bytesToHex(const std::uint8_t* bytes, const std::size_t size, const bool with_prefix)
    {
        static constexpr char HEX[] = "0123456789abcdef";
        std::string out;
        out.reserve(size * 2 + (with_prefix ? 2 : 0));
        if(with_prefix)
        {
            out += "0x";
        }

        for(std::size_t i = 0; i < size; ++i)
        {
            const std::uint8_t b = bytes[i];
            out.push_back(HEX[(b >> 4) & 0x0F]);
            out.push_back(HEX[b & 0x0F]);
        }

        return out;
    }

    std::string bytesToHex(const std::vector<std::uint8_t> & bytes, const bool with_prefix)
    {
        return bytesToHex(bytes.data(), bytes.size(), with_prefix);
    }

    bool isValidUtf8(std::string_view text)
    {
        const auto* bytes = reinterpret_cast<const unsigned char*>(text.data());
        const std::size_t size = text.size();

        std::size_t i = 0;
        while(i < size)
        {
            const unsigned char lead = bytes[i];
            if(lead < 0x80)
            {
                ++i;
                continue;
            }

            std::size_t length = 0;
            std::uint32_t code_point = 0;
            std::uint32_t min_code_point = 0;

            if((lead & 0xE0) == 0xC0)
            {
                length = 2;
                code_point = lead & 0x1F;
                min_code_point = 0x80;
            }
            else if((lead & 0xF0) == 0xE0)
            {
                length = 3;
                code_point = lead & 0x0F;
                min_code_point = 0x800;
            }
            else if((lead & 0xF8) == 0xF0)
            {
                length = 4;
                code_point = lead & 0x07;
                min_code_point = 0x10000;
            }
            else
            {
                // stray continuation byte or 0xF8..0xFF
                return false;
            }

            if(size - i < length)
            {
                return false;
            }

            for(std::size_t k = 1; k < length; ++k)
            {
                const unsigned char cont = bytes[i + k];
                if((cont & 0xC0) != 0x80)
                {
                    return false;
                }
                code_point = (code_point << 6) | (cont & 0x3F);
            }

            if(code_point < min_code_point || code_point > 0x10FFFF)
            {
                return false;
            }

            if(code_point >= 0xD800 && code_point <= 0xDFFF)
            {
                return false;
            }

            i += length;
        }

        return true;
    }

    std::string removeNullBytes(std::string text)
    {
        std::erase(text, '\0');
        return text;
    }
}
