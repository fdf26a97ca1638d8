/*
 * File: src/value.cpp
 * Project: XPLink
 * Purpose: Value decoding and encoding
 * Last updated: 2026-10-19
 */

#include "xplink/value.hpp"
#include "xplink/errors.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <algorithm>
#include <sstream>

namespace xplink
{

namespace bai = boost::archive::iterators;

ValueKind kind_from_type(const std::string &value_type)
{
    if (value_type == "int_array" || value_type == "float_array")
        return ValueKind::Array;
    if (value_type == "data")
        return ValueKind::Bytes;
    return ValueKind::Scalar;
}

const char *to_string(ValueKind kind)
{
    switch (kind)
    {
    case ValueKind::Scalar:
        return "scalar";
    case ValueKind::Array:
        return "array";
    case ValueKind::Bytes:
        return "bytes";
    }
    return "?";
}

std::optional<Value> decode_value(ValueKind kind, const nlohmann::json &raw)
{
    switch (kind)
    {
    case ValueKind::Scalar:
        if (raw.is_number())
            return Value{raw.get<double>()};
        if (raw.is_boolean())
            return Value{raw.get<bool>() ? 1.0 : 0.0};
        return std::nullopt;
    case ValueKind::Array:
    {
        if (!raw.is_array())
            return std::nullopt;
        std::vector<double> out;
        out.reserve(raw.size());
        for (const auto &v : raw)
        {
            if (!v.is_number())
                return std::nullopt;
            out.push_back(v.get<double>());
        }
        return Value{std::move(out)};
    }
    case ValueKind::Bytes:
    {
        if (!raw.is_string())
            return std::nullopt;
        std::string s;
        try
        {
            s = base64_decode(raw.get<std::string>());
        }
        catch (const DecodeError &)
        {
            return std::nullopt;
        }
        s.erase(std::remove(s.begin(), s.end(), '\0'), s.end());
        return Value{std::move(s)};
    }
    }
    return std::nullopt;
}

nlohmann::json encode_value(ValueKind kind, const Value &value)
{
    switch (kind)
    {
    case ValueKind::Scalar:
        if (auto d = std::get_if<double>(&value))
            return *d;
        break;
    case ValueKind::Array:
        if (auto a = std::get_if<std::vector<double>>(&value))
            return *a;
        break;
    case ValueKind::Bytes:
        if (auto s = std::get_if<std::string>(&value))
            return base64_encode(*s);
        break;
    }
    throw ContractError(std::string("value does not match ") + to_string(kind) + " dataref");
}

Value default_value(ValueKind kind)
{
    switch (kind)
    {
    case ValueKind::Scalar:
        return 0.0;
    case ValueKind::Bytes:
        return std::string();
    case ValueKind::Array:
        break;
    }
    throw ContractError("no default value for array dataref");
}

std::string to_string(const Value &value)
{
    std::ostringstream oss;
    if (auto d = std::get_if<double>(&value))
        oss << *d;
    else if (auto a = std::get_if<std::vector<double>>(&value))
    {
        oss << '[';
        for (std::size_t i = 0; i < a->size(); ++i)
            oss << (i ? "," : "") << (*a)[i];
        oss << ']';
    }
    else
        oss << '"' << std::get<std::string>(value) << '"';
    return oss.str();
}

std::string base64_encode(const std::string &plain)
{
    using Encoder = bai::base64_from_binary<bai::transform_width<std::string::const_iterator, 6, 8>>;
    std::string out(Encoder(plain.begin()), Encoder(plain.end()));
    out.append((3 - plain.size() % 3) % 3, '=');
    return out;
}

std::string base64_decode(const std::string &encoded)
{
    using Decoder = bai::transform_width<bai::binary_from_base64<std::string::const_iterator>, 8, 6>;
    std::string in = encoded;
    while (!in.empty() && in.back() == '=')
        in.pop_back();
    // decode whole quads; the filler bits come back as bytes we drop
    const std::size_t pad = (4 - in.size() % 4) % 4;
    if (pad == 3)
        throw DecodeError("base64 text of invalid length " + std::to_string(encoded.size()));
    in.append(pad, 'A');
    try
    {
        std::string out(Decoder(in.cbegin()), Decoder(in.cend()));
        out.resize(out.size() - pad);
        return out;
    }
    catch (const bai::dataflow_exception &e)
    {
        throw DecodeError(std::string("base64: ") + e.what());
    }
}

} // namespace xplink
