#include "unit-tests.hpp"

using namespace tkr;
using namespace tkr::tests;

TEST_F(UnitTest, Utils_IsValidUtf8_AcceptsWellFormedText)
{
    EXPECT_TRUE(utils::isValidUtf8(""));
    EXPECT_TRUE(utils::isValidUtf8("Wrapped Ether"));
    EXPECT_TRUE(utils::isValidUtf8(std::string("nul\0inside", 10)));
    EXPECT_TRUE(utils::isValidUtf8("\xC3\xA9"));                // U+00E9
    EXPECT_TRUE(utils::isValidUtf8("\xE2\x82\xAC"));            // U+20AC
    EXPECT_TRUE(utils::isValidUtf8("\xF0\x9F\x9A\x80"));        // U+1F680
    EXPECT_TRUE(utils::isValidUtf8("\xF4\x8F\xBF\xBF"));        // U+10FFFF
}

TEST_F(UnitTest, Utils_IsValidUtf8_RejectsMalformedText)
{
    EXPECT_FALSE(utils::isValidUtf8("\x80"));                   // lone continuation
    EXPECT_FALSE(utils::isValidUtf8("\xC3"));                   // truncated
    EXPECT_FALSE(utils::isValidUtf8("\xC3\x28"));               // bad continuation
    EXPECT_FALSE(utils::isValidUtf8("\xC0\xAF"));               // overlong '/'
    EXPECT_FALSE(utils::isValidUtf8("\xE0\x80\xAF"));           // overlong '/'
    EXPECT_FALSE(utils::isValidUtf8("\xED\xA0\x80"));           // U+D800
    EXPECT_FALSE(utils::isValidUtf8("\xF4\x90\x80\x80"));       // above U+10FFFF
    EXPECT_FALSE(utils::isValidUtf8("\xFF"));
    EXPECT_FALSE(utils::isValidUtf8("ok\xE2\x82"));
}

TEST_F(UnitTest, Utils_RemoveNullBytes_KeepsOrder)
{
    EXPECT_EQ(utils::removeNullBytes(std::string("\0a\0b\0c\0", 7)), "abc");
    EXPECT_EQ(utils::removeNullBytes("plain"), "plain");
    EXPECT_EQ(utils::removeNullBytes(std::string(3, '\0')), "");
}

TEST_F(UnitTest, Utils_Uint256ToDecimal_Converts)
{
    EXPECT_EQ(utils::uint256ToDecimal(evmc::uint256be{}), "0");
    EXPECT_EQ(utils::uint256ToDecimal(makeUint256(18)), "18");
    EXPECT_EQ(utils::uint256ToDecimal(makeUint256(18446744073709551615ull)), "18446744073709551615");

    evmc::uint256be max{};
    std::memset(max.bytes, 0xFF, sizeof(max.bytes));
    EXPECT_EQ(utils::uint256ToDecimal(max), "115792089237316195423570985008687907853269984665640564039457584007913129639935");

    // 2^64
    evmc::uint256be two_pow_64{};
    two_pow_64.bytes[23] = 0x01;
    EXPECT_EQ(utils::uint256ToDecimal(two_pow_64), "18446744073709551616");
}

TEST_F(UnitTest, Utils_ReadUint8Word_RejectsWideValues)
{
    const auto small = encodeUint256Word(255);
    const auto wide = encodeUint256Word(256);

    EXPECT_EQ(utils::readUint8Word(small.data(), small.size(), 0), std::uint8_t{255});
    EXPECT_FALSE(utils::readUint8Word(wide.data(), wide.size(), 0).has_value());
    EXPECT_FALSE(utils::readUint8Word(small.data(), small.size(), 1).has_value());
    EXPECT_FALSE(utils::readUint8Word(nullptr, 0, 0).has_value());
}

TEST_F(UnitTest, Utils_DecodeAbiString_ChecksBounds)
{
    const auto encoded = encodeStringReturn("WETH");

    const auto decoded = utils::decodeAbiString(encoded.data(), encoded.size(), 32);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "WETH");

    // length word claims more bytes than available
    std::vector<std::uint8_t> truncated = encodeUint256Word(100);
    truncated.resize(32 + 10, 'a');
    EXPECT_FALSE(utils::decodeAbiString(truncated.data(), truncated.size(), 0).has_value());

    EXPECT_FALSE(utils::decodeAbiString(encoded.data(), encoded.size(), encoded.size()).has_value());
}

TEST_F(UnitTest, Abi_DecodeOutputs_KeepsRawStringBytes)
{
    const std::string raw = std::string("a\xFF\0b", 4);
    const auto decoded = abi::decodeOutputs({abi::Type::STRING}, encodeStringReturn(raw));

    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->size(), 1u);
    EXPECT_EQ(std::get<std::string>(decoded->front()), raw);
}

TEST_F(UnitTest, Address_ParseAddress_AcceptsCanonicalForms)
{
    const auto lower = chain::parseAddress("0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
    const auto upper = chain::parseAddress("0XC02AAA39B223FE8D0A0E5C4F27EAD9083C756CC2");
    const auto bare = chain::parseAddress("c02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");

    ASSERT_TRUE(lower.has_value());
    ASSERT_TRUE(upper.has_value());
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(*lower, *upper);
    EXPECT_EQ(*lower, *bare);
    EXPECT_EQ(chain::addressToHex(*upper), "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
}

TEST_F(UnitTest, Address_ParseAddress_RejectsMalformedInput)
{
    EXPECT_FALSE(chain::parseAddress("").has_value());
    EXPECT_FALSE(chain::parseAddress("0x1234").has_value());
    EXPECT_FALSE(chain::parseAddress("0xz02aaa39b223fe8d0a0e5c4f27ead9083c756cc2").has_value());
    EXPECT_FALSE(chain::parseAddress("0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc200").has_value());
}
