#include "acdc/crypto/DigestBackends.hpp"

#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace acdc::crypto::backends
{
namespace
{

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

[[nodiscard]] const EVP_MD* messageDigestFor(DigestCode code)
{
    switch (code)
    {
    case DigestCode::Blake2s_256:
        return EVP_blake2s256();
    case DigestCode::Sha3_256:
        return EVP_sha3_256();
    case DigestCode::Sha2_256:
        return EVP_sha256();
    case DigestCode::Blake3_256:
    case DigestCode::Blake2b_256:
        break;
    }
    throw std::invalid_argument("openSslDigest: algorithm not served by OpenSSL");
}

} // namespace

[[nodiscard]] Digest256 openSslDigest(DigestCode code, std::span<const std::uint8_t> data)
{
    const EVP_MD* md{ messageDigestFor(code) };
    if (md == nullptr)
    {
        throw std::runtime_error("openSslDigest: message digest not available");
    }

    EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("openSslDigest: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
    {
        throw std::runtime_error("openSslDigest: EVP_DigestInit_ex failed");
    }
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    {
        throw std::runtime_error("openSslDigest: EVP_DigestUpdate failed");
    }

    Digest256 out{};
    unsigned int written{ 0U };
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1 || written != out.size())
    {
        throw std::runtime_error("openSslDigest: EVP_DigestFinal_ex failed");
    }
    return out;
}

} // namespace acdc::crypto::backends
