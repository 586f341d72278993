#ifndef BATO_CORE_PAYLOAD_CODEC_H
#define BATO_CORE_PAYLOAD_CODEC_H

#include "bato_core/chapter_types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace bato_core {

// Strict standard-alphabet base64. ASCII whitespace is ignored; anything else
// outside the alphabet, bad padding or a length that is not a multiple of 4
// throws ResolveError(DecodeFailed).
std::vector<std::uint8_t> decodeBase64(const std::string& encoded);

// Splits "<marker><8-byte salt><ciphertext>". Throws DecodeFailed when the
// buffer is shorter than marker + salt or does not start with the marker.
EncryptedPayload parsePayload(const std::vector<std::uint8_t>& raw, const std::string& marker);

EncryptedPayload decodePayload(const std::string& encodedWord, const std::string& marker);

} // namespace bato_core

#endif // BATO_CORE_PAYLOAD_CODEC_H
