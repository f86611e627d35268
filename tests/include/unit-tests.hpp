#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include "abi.hpp"
#include "address.hpp"
#include "call.hpp"
#include "contract_reader.hpp"
#include "decode_abi.hpp"
#include "functions.hpp"
#include "math.hpp"
#include "metadata.hpp"
#include "reader.hpp"
#include "utils.hpp"

namespace tkr::tests
{
    using json = nlohmann::json;

    class UnitTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            spdlog::set_level(spdlog::level::debug);
        }
    };

    inline std::vector<std::uint8_t> encodeUint256Word(std::uint64_t value)
    {
        std::vector<std::uint8_t> out(32, 0);
        for(int i = 0; i < 8; ++i)
        {
            out[31 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
        }
        return out;
    }

    inline evmc::uint256be makeUint256(std::uint64_t value)
    {
        evmc::uint256be out{};
        const auto word = encodeUint256Word(value);
        std::memcpy(out.bytes, word.data(), 32);
        return out;
    }

    // a single `string` return value: offset word, length word, padded bytes
    inline std::vector<std::uint8_t> encodeStringReturn(const std::string & value)
    {
        std::vector<std::uint8_t> out = encodeUint256Word(32);
        const auto length_word = encodeUint256Word(value.size());
        out.insert(out.end(), length_word.begin(), length_word.end());
        out.insert(out.end(), value.begin(), value.end());
        const std::size_t pad = (32 - (value.size() % 32)) % 32;
        out.insert(out.end(), pad, 0);
        return out;
    }

    inline chain::FunctionCallResult ok(chain::AbiValue value)
    {
        return std::vector<chain::AbiValue>{std::move(value)};
    }

    inline chain::FunctionCallResult failed(chain::CallError::Kind kind = chain::CallError::Kind::REVERTED)
    {
        return std::unexpected(chain::CallError{.kind = kind, .message = "test failure"});
    }
}
