#include "bato_core/payload_codec.h"
#include "bato_core/resolve_error.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <openssl/evp.h>

namespace bato_core {

static bool isBase64Char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

std::vector<std::uint8_t> decodeBase64(const std::string& encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact += c;
        }
    }

    if (compact.empty()) {
        throw ResolveError(ErrorKind::DecodeFailed, "base64 input is empty");
    }
    if (compact.size() % 4 != 0) {
        throw ResolveError(ErrorKind::DecodeFailed,
                           "base64 length " + std::to_string(compact.size()) + " is not a multiple of 4");
    }

    // '=' may only appear as "x=" or "==" at the very end.
    size_t padding = 0;
    if (compact[compact.size() - 1] == '=') {
        padding = compact[compact.size() - 2] == '=' ? 2 : 1;
    } else if (compact[compact.size() - 2] == '=') {
        throw ResolveError(ErrorKind::DecodeFailed, "misplaced base64 padding");
    }

    auto dataEnd = compact.end() - static_cast<std::ptrdiff_t>(padding);
    auto bad = std::find_if(compact.begin(), dataEnd, [](char c) { return !isBase64Char(c); });
    if (bad != dataEnd) {
        throw ResolveError(ErrorKind::DecodeFailed,
                           "invalid base64 character at offset " + std::to_string(bad - compact.begin()));
    }

    std::vector<std::uint8_t> decoded(compact.size() / 4 * 3);
    int written = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        throw ResolveError(ErrorKind::DecodeFailed, "base64 decoding failed");
    }
    // EVP_DecodeBlock counts the bytes that stand in for '=' padding.
    decoded.resize(static_cast<size_t>(written) - padding);
    return decoded;
}

EncryptedPayload parsePayload(const std::vector<std::uint8_t>& raw, const std::string& marker) {
    const size_t headerSize = marker.size() + kSaltSize;
    if (raw.size() < headerSize) {
        throw ResolveError(ErrorKind::DecodeFailed,
                           "payload is " + std::to_string(raw.size()) + " bytes, shorter than marker and salt ("
                               + std::to_string(headerSize) + ")");
    }
    if (std::memcmp(raw.data(), marker.data(), marker.size()) != 0) {
        throw ResolveError(ErrorKind::DecodeFailed, "payload does not start with '" + marker + "'");
    }

    EncryptedPayload payload;
    payload.salt.assign(raw.begin() + marker.size(), raw.begin() + headerSize);
    payload.ciphertext.assign(raw.begin() + headerSize, raw.end());
    return payload;
}

EncryptedPayload decodePayload(const std::string& encodedWord, const std::string& marker) {
    return parsePayload(decodeBase64(encodedWord), marker);
}

} // namespace bato_core
