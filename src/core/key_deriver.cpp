#include "bato_core/key_deriver.h"
#include "bato_core/resolve_error.h"
#include <memory>
#include <utility>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace bato_core {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

} // namespace

DerivedKeyMaterial deriveKeyMaterial(const std::string& password,
                                     const std::vector<std::uint8_t>& salt,
                                     int keyLength,
                                     int ivLength) {
    if (password.empty()) {
        throw ResolveError(ErrorKind::KeyDerivationFailed, "password is empty");
    }
    if (salt.size() != kSaltSize) {
        throw ResolveError(ErrorKind::KeyDerivationFailed,
                           "salt must be 8 bytes, got " + std::to_string(salt.size()));
    }
    if (keyLength <= 0 || ivLength <= 0) {
        throw ResolveError(ErrorKind::KeyDerivationFailed,
                           "key and iv lengths must be positive (key " + std::to_string(keyLength)
                               + ", iv " + std::to_string(ivLength) + ")");
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw ResolveError(ErrorKind::KeyDerivationFailed, "EVP_MD_CTX_new failed");
    }

    const size_t required = static_cast<size_t>(keyLength) + static_cast<size_t>(ivLength);
    std::vector<std::uint8_t> stream;
    stream.reserve(required + EVP_MAX_MD_SIZE);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    bool ok = true;

    while (stream.size() < required) {
        if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) { ok = false; break; }
        // D(i-1): the previous block is the tail of the stream.
        if (digestLen > 0 && EVP_DigestUpdate(ctx.get(), digest, digestLen) != 1) { ok = false; break; }
        if (EVP_DigestUpdate(ctx.get(), password.data(), password.size()) != 1) { ok = false; break; }
        if (EVP_DigestUpdate(ctx.get(), salt.data(), salt.size()) != 1) { ok = false; break; }
        if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) { ok = false; break; }
        stream.insert(stream.end(), digest, digest + digestLen);
    }
    OPENSSL_cleanse(digest, sizeof(digest));

    if (!ok) {
        OPENSSL_cleanse(stream.data(), stream.size());
        throw ResolveError(ErrorKind::KeyDerivationFailed, "MD5 digest failed");
    }

    std::vector<std::uint8_t> key(stream.begin(), stream.begin() + keyLength);
    std::vector<std::uint8_t> iv(stream.begin() + keyLength, stream.begin() + keyLength + ivLength);
    OPENSSL_cleanse(stream.data(), stream.size());
    return DerivedKeyMaterial(std::move(key), std::move(iv));
}

} // namespace bato_core
