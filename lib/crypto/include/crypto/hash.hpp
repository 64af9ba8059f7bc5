#pragma once

#include <string>
#include <string_view>

#include "crypto/common.hpp"

namespace Tally::Crypto {

// SHA-256 over raw bytes. Throws std::runtime_error if OpenSSL fails.
[[nodiscard]]
Hash256 sha256(BytesSpan data);

// Lowercase hex, two characters per byte.
[[nodiscard]]
std::string to_hex(BytesSpan data);

// to_hex(sha256(text))
[[nodiscard]]
std::string sha256_hex(std::string_view text);

} // namespace Tally::Crypto
