#include "abi.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "decode_abi.hpp"
#include "math.hpp"

namespace tkr::abi
{
    using json = nlohmann::json;

    std::string_view typeName(Type type)
    {
        switch(type)
        {
            case Type::STRING:  return "string";
            case Type::UINT8:   return "uint8";
            case Type::UINT256: return "uint256";
        }
        return "unknown";
    }

    std::string signature(const Function & function)
    {
        std::string out = function.name + "(";
        for(std::size_t i = 0; i < function.inputs.size(); ++i)
        {
            if(i > 0)
            {
                out += ",";
            }
            out += typeName(function.inputs[i]);
        }
        out += ")";
        return out;
    }

    const Function * findFunction(const std::vector<Function> & abi, std::string_view name)
    {
        const auto it = std::ranges::find_if(abi, [name](const Function & f) { return f.name == name; });
        if(it == abi.end())
        {
            return nullptr;
        }
        return &(*it);
    }

    json toJson(const std::vector<Function> & abi)
    {
        json out = json::array();
        for(const Function & function : abi)
        {
            json inputs = json::array();
            for(const Type input : function.inputs)
            {
                inputs.push_back({{"name", ""}, {"type", std::string(typeName(input))}});
            }

            json outputs = json::array();
            for(const Type output : function.outputs)
            {
                outputs.push_back({{"name", ""}, {"type", std::string(typeName(output))}});
            }

            out.push_back({
                {"constant", function.constant},
                {"inputs", std::move(inputs)},
                {"name", function.name},
                {"outputs", std::move(outputs)},
                {"payable", function.payable},
                {"type", "function"}
            });
        }
        return out;
    }

    std::optional<std::vector<Value>> decodeOutputs(const std::vector<Type> & outputs, const std::vector<std::uint8_t> & data)
    {
        if(data.size() < outputs.size() * 32)
        {
            return std::nullopt;
        }

        std::vector<Value> values;
        values.reserve(outputs.size());

        for(std::size_t i = 0; i < outputs.size(); ++i)
        {
            const std::size_t head_offset = i * 32;
            switch(outputs[i])
            {
                case Type::STRING:
                {
                    const auto offset_res = utils::readWordAsSizeT(data.data(), data.size(), head_offset);
                    if(!offset_res)
                    {
                        return std::nullopt;
                    }

                    auto string_res = utils::decodeAbiString(data.data(), data.size(), *offset_res);
                    if(!string_res)
                    {
                        return std::nullopt;
                    }
                    values.emplace_back(std::move(*string_res));
                    break;
                }
                case Type::UINT8:
                {
                    const auto value_res = utils::readUint8Word(data.data(), data.size(), head_offset);
                    if(!value_res)
                    {
                        return std::nullopt;
                    }
                    values.emplace_back(std::in_place_type<std::uint8_t>, *value_res);
                    break;
                }
                case Type::UINT256:
                {
                    const auto value_res = utils::readUint256Word(data.data(), data.size(), head_offset);
                    if(!value_res)
                    {
                        return std::nullopt;
                    }
                    values.emplace_back(*value_res);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }

        return values;
    }
}
