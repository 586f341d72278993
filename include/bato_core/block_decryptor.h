#ifndef BATO_CORE_BLOCK_DECRYPTOR_H
#define BATO_CORE_BLOCK_DECRYPTOR_H

#include "bato_core/chapter_types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bato_core {

// Raw AES-256-CBC decryption, padding left in place. The ciphertext must be a
// non-empty multiple of 16 bytes and the material must hold a 32-byte key and a
// 16-byte IV; otherwise throws ResolveError(CipherFailed).
std::vector<std::uint8_t> decryptAes256Cbc(const std::vector<std::uint8_t>& ciphertext,
                                           const DerivedKeyMaterial& material);

// Removes PKCS#7 padding. A pad byte outside 1..blockSize or a pad run that does
// not repeat its own value throws CipherFailed; nothing is ever partially stripped.
std::vector<std::uint8_t> stripPkcs7Padding(std::vector<std::uint8_t> data,
                                            std::size_t blockSize = kAesBlockSize);

bool isValidUtf8(const std::string& text);

// decrypt + unpad + UTF-8 check.
std::string decryptPayloadText(const EncryptedPayload& payload, const DerivedKeyMaterial& material);

} // namespace bato_core

#endif // BATO_CORE_BLOCK_DECRYPTOR_H
