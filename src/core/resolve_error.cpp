#include "bato_core/resolve_error.h"

namespace bato_core {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ExtractionFailed:    return "ExtractionFailed";
        case ErrorKind::EvaluatorFailed:     return "EvaluatorFailed";
        case ErrorKind::DecodeFailed:        return "DecodeFailed";
        case ErrorKind::KeyDerivationFailed: return "KeyDerivationFailed";
        case ErrorKind::CipherFailed:        return "CipherFailed";
        case ErrorKind::LengthMismatch:      return "LengthMismatch";
    }
    return "Unknown";
}

const char* stageName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ExtractionFailed:    return "extract";
        case ErrorKind::EvaluatorFailed:     return "evaluate";
        case ErrorKind::DecodeFailed:        return "decode";
        case ErrorKind::KeyDerivationFailed: return "derive";
        case ErrorKind::CipherFailed:        return "decrypt";
        case ErrorKind::LengthMismatch:      return "recombine";
    }
    return "unknown";
}

ResolveError::ResolveError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(stageName(kind)) + ": " + detail),
      kind_(kind),
      detail_(detail) {}

} // namespace bato_core
