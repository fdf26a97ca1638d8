/*
 * File: include/xplink/value.hpp
 * Project: XPLink
 * Purpose: Dataref value shapes and their JSON wire form
 * Notes:
 *  - kind comes from metadata value_type, never guessed from a payload
 *  - "data" datarefs travel base64 encoded
 * Last updated: 2026-10-19
 */

#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace xplink
{

enum class ValueKind
{
    Scalar,
    Array,
    Bytes
};

using Value = std::variant<double, std::vector<double>, std::string>;

// "int" | "float" | "double" | "int_array" | "float_array" | "data"
ValueKind kind_from_type(const std::string &value_type);
const char *to_string(ValueKind kind);

// nullopt when the payload does not have the expected shape
std::optional<Value> decode_value(ValueKind kind, const nlohmann::json &raw);

// Throws ContractError if the value does not match the kind.
nlohmann::json encode_value(ValueKind kind, const Value &value);

// Throws ContractError for arrays, which have no sensible default.
Value default_value(ValueKind kind);

std::string to_string(const Value &value);

std::string base64_encode(const std::string &plain);
/// Padding is optional. @throws DecodeError outside the base64 alphabet
std::string base64_decode(const std::string &encoded);

} // namespace xplink
