#include "ssz/core/types.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ssz {

namespace {
int
hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
}  // namespace

void
slice_hex(const Slice sl, std::string& result)
{
    static constexpr char hexChars[] = "0123456789abcdef";
    result.reserve(result.size() + sl.size() * 2);
    const uint8_t* bytes = sl.data();
    for (size_t i = 0; i < sl.size(); ++i)
    {
        uint8_t byte = bytes[i];
        result.push_back(hexChars[(byte >> 4) & 0xF]);
        result.push_back(hexChars[byte & 0xF]);
    }
}

std::vector<uint8_t>
hex_to_bytes(std::string_view hex)
{
    if (hex.starts_with("0x") || hex.starts_with("0X"))
    {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0)
    {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0)
        {
            throw std::invalid_argument(
                "Invalid hex digit in: " + std::string(hex));
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

std::string
Node::hex() const
{
    std::string result;
    slice_hex(slice(), result);
    return result;
}

Node
Node::from_hex(std::string_view hex)
{
    if (hex.starts_with("0x") || hex.starts_with("0X"))
    {
        hex.remove_prefix(2);
    }
    if (hex.size() != size() * 2)
    {
        throw std::invalid_argument(
            "Node hex must be 64 characters, got " +
            std::to_string(hex.size()));
    }

    return Node(hex_to_bytes(hex).data());
}

}  // namespace ssz
