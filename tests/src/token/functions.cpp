#include "unit-tests.hpp"

using namespace tkr;
using namespace tkr::tests;

TEST_F(UnitTest, Functions_ContractAbi_DescribesTokenGetters)
{
    const auto & abi = token::contractAbi();
    ASSERT_EQ(abi.size(), 4u);

    const struct
    {
        const char * name;
        abi::Type output;
        abi::Selector selector;
    } expected[] = {
        {"name",        abi::Type::STRING,  {0x06, 0xfd, 0xde, 0x03}},
        {"symbol",      abi::Type::STRING,  {0x95, 0xd8, 0x9b, 0x41}},
        {"decimals",    abi::Type::UINT8,   {0x31, 0x3c, 0xe5, 0x67}},
        {"totalSupply", abi::Type::UINT256, {0x18, 0x16, 0x0d, 0xdd}},
    };

    for(const auto & entry : expected)
    {
        const abi::Function * function = abi::findFunction(abi, entry.name);
        ASSERT_NE(function, nullptr) << entry.name;
        EXPECT_TRUE(function->inputs.empty());
        ASSERT_EQ(function->outputs.size(), 1u);
        EXPECT_EQ(function->outputs.front(), entry.output);
        EXPECT_EQ(function->selector, entry.selector);
        EXPECT_TRUE(function->constant);
        EXPECT_FALSE(function->payable);
        EXPECT_EQ(abi::signature(*function), std::string(entry.name) + "()");
    }
}

TEST_F(UnitTest, Functions_ContractFunctions_HaveNoArguments)
{
    const auto & functions = token::contractFunctions();
    ASSERT_EQ(functions.size(), 4u);

    for(const char * name : {"name", "symbol", "decimals", "totalSupply"})
    {
        const auto it = functions.find(name);
        ASSERT_NE(it, functions.end()) << name;
        EXPECT_TRUE(it->second.empty());
        EXPECT_NE(abi::findFunction(token::contractAbi(), name), nullptr);
    }
}

TEST_F(UnitTest, Functions_ContractAbi_JsonMatchesStandardFragment)
{
    const json abi_json = abi::toJson(token::contractAbi());
    ASSERT_TRUE(abi_json.is_array());
    ASSERT_EQ(abi_json.size(), 4u);

    const json & decimals = abi_json[1];
    EXPECT_EQ(decimals["name"], "decimals");
    EXPECT_EQ(decimals["constant"], true);
    EXPECT_EQ(decimals["payable"], false);
    EXPECT_EQ(decimals["type"], "function");
    EXPECT_TRUE(decimals["inputs"].is_array());
    EXPECT_TRUE(decimals["inputs"].empty());
    ASSERT_EQ(decimals["outputs"].size(), 1u);
    EXPECT_EQ(decimals["outputs"][0]["name"], "");
    EXPECT_EQ(decimals["outputs"][0]["type"], "uint8");

    EXPECT_EQ(abi_json[2]["outputs"][0]["type"], "uint256");
    EXPECT_EQ(abi_json[3]["outputs"][0]["type"], "string");
}
