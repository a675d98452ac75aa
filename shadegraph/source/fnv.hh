// shadegraph

#pragma once

#include <cstdint>

namespace shadegraph {
    constexpr uint64_t sgHashFnv1a64(char const* start, char const* end = nullptr, uint64_t hash = 0xcbf2'9ce4'8422'2325ull) noexcept
    {
        constexpr uint64_t prime = 0x0000'0100'0000'01b3ull;

        if (start == nullptr)
            return hash;

        for (; end != nullptr ? start != end : *start != '\0'; ++start)
        {
            hash ^= static_cast<uint8_t>(*start);
            hash *= prime;
        }

        return hash;
    }
} // namespace shadegraph
