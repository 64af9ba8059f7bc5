#include "crypto/hash.hpp"
#include "internal/evp.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace Tally::Crypto {
using impl::EvpMdCtxPtr;

Hash256 sha256(BytesSpan data)
{
    Hash256 h {};
    unsigned int len = 0;

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (1 != EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    if (1 != EVP_DigestUpdate(ctx.get(), data.data(), data.size())) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    if (1 != EVP_DigestFinal_ex(ctx.get(), h.data(), &len) || len != h.size()) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return h;
}

std::string to_hex(BytesSpan data)
{
    static constexpr char kDigits[] = "0123456789abcdef";

    std::string out;
    out.reserve(data.size() * 2);
    for (Byte b : data) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

std::string sha256_hex(std::string_view text)
{
    return to_hex(sha256(as_span(text)));
}

} // namespace Tally::Crypto
