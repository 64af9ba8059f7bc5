#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace Tally::Crypto {
using Byte = uint8_t;
using BytesSpan = std::span<const Byte>;

using Hash256 = std::array<Byte, 32>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

} // namespace Tally::Crypto
