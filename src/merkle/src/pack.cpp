#include "ssz/merkle/pack.h"
#include "ssz/merkle/chunks.h"
#include "ssz/merkle/merkle-errors.h"

namespace ssz::merkle {

void
require_chunks(const std::vector<uint8_t>& buffer)
{
    if (buffer.size() % BYTES_PER_CHUNK != 0)
    {
        throw PartialChunkException(buffer.size());
    }
}

void
pack_bytes(std::vector<uint8_t>& buffer)
{
    if (auto tail = buffer.size() % BYTES_PER_CHUNK; tail != 0)
    {
        buffer.resize(buffer.size() + BYTES_PER_CHUNK - tail, 0);
    }
}

std::vector<uint8_t>
pack_bits(const std::vector<bool>& bits)
{
    std::vector<uint8_t> buffer((bits.size() + 7) / 8, 0);
    for (std::size_t i = 0; i < bits.size(); ++i)
    {
        if (bits[i])
        {
            buffer[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
        }
    }
    pack_bytes(buffer);
    return buffer;
}

}  // namespace ssz::merkle
