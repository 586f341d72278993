#include "bato_core/block_decryptor.h"
#include "bato_core/resolve_error.h"
#include <memory>
#include <openssl/evp.h>

namespace bato_core {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

} // namespace

std::vector<std::uint8_t> decryptAes256Cbc(const std::vector<std::uint8_t>& ciphertext,
                                           const DerivedKeyMaterial& material) {
    if (ciphertext.empty() || ciphertext.size() % kAesBlockSize != 0) {
        throw ResolveError(ErrorKind::CipherFailed,
                           "ciphertext length " + std::to_string(ciphertext.size())
                               + " is not a positive multiple of 16");
    }
    if (material.key().size() != 32 || material.iv().size() != kAesBlockSize) {
        throw ResolveError(ErrorKind::CipherFailed, "AES-256-CBC needs a 32-byte key and a 16-byte iv");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw ResolveError(ErrorKind::CipherFailed, "EVP_CIPHER_CTX_new failed");
    }

    std::vector<std::uint8_t> plain(ciphertext.size() + kAesBlockSize);
    int outl = 0;
    int finl = 0;
    bool ok = false;
    do {
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, material.key().data(), material.iv().data()) != 1) break;
        // Padding is validated by stripPkcs7Padding so a bad pad is reported the same way everywhere.
        if (EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != 1) break;
        if (EVP_DecryptUpdate(ctx.get(), plain.data(), &outl, ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) break;
        if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + outl, &finl) != 1) break;
        ok = true;
    } while (false);

    if (!ok) {
        throw ResolveError(ErrorKind::CipherFailed, "AES-256-CBC decryption failed");
    }
    plain.resize(static_cast<size_t>(outl + finl));
    return plain;
}

std::vector<std::uint8_t> stripPkcs7Padding(std::vector<std::uint8_t> data, std::size_t blockSize) {
    if (data.empty()) {
        throw ResolveError(ErrorKind::CipherFailed, "nothing to unpad");
    }
    const std::uint8_t pad = data.back();
    if (pad < 1 || pad > blockSize || pad > data.size()) {
        throw ResolveError(ErrorKind::CipherFailed,
                           "invalid PKCS#7 pad length " + std::to_string(pad) + " (wrong password?)");
    }
    for (size_t i = data.size() - pad; i < data.size(); ++i) {
        if (data[i] != pad) {
            throw ResolveError(ErrorKind::CipherFailed, "inconsistent PKCS#7 padding bytes (wrong password?)");
        }
    }
    data.resize(data.size() - pad);
    return data;
}

bool isValidUtf8(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        unsigned int cp = 0;
        if (c < 0x80) { i++; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            const unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates, out of range.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::string decryptPayloadText(const EncryptedPayload& payload, const DerivedKeyMaterial& material) {
    std::vector<std::uint8_t> unpadded = stripPkcs7Padding(decryptAes256Cbc(payload.ciphertext, material));
    std::string text(unpadded.begin(), unpadded.end());
    if (!isValidUtf8(text)) {
        throw ResolveError(ErrorKind::CipherFailed, "decrypted plaintext is not valid UTF-8");
    }
    return text;
}

} // namespace bato_core
