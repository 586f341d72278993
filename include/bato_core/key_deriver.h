#ifndef BATO_CORE_KEY_DERIVER_H
#define BATO_CORE_KEY_DERIVER_H

#include "bato_core/chapter_types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace bato_core {

/**
 * @brief Derives a key/IV pair the way OpenSSL's EVP_BytesToKey does with MD5
 *        and a single iteration.
 *
 * D(i) = MD5(D(i-1) || password || salt), concatenated until keyLength + ivLength
 * bytes are available; the key is the head of that stream and the IV follows it.
 *
 * @throws ResolveError(KeyDerivationFailed) if the password is empty, the salt is
 *         not exactly 8 bytes, or either length is not positive.
 */
DerivedKeyMaterial deriveKeyMaterial(const std::string& password,
                                     const std::vector<std::uint8_t>& salt,
                                     int keyLength,
                                     int ivLength);

} // namespace bato_core

#endif // BATO_CORE_KEY_DERIVER_H
