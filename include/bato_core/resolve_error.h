#ifndef BATO_CORE_RESOLVE_ERROR_H
#define BATO_CORE_RESOLVE_ERROR_H

#include <stdexcept>
#include <string>

namespace bato_core {

// One tag per pipeline stage. A resolution either returns the full page set
// or throws exactly one ResolveError carrying one of these.
enum class ErrorKind {
    ExtractionFailed,
    EvaluatorFailed,
    DecodeFailed,
    KeyDerivationFailed,
    CipherFailed,
    LengthMismatch
};

const char* errorKindName(ErrorKind kind);
const char* stageName(ErrorKind kind);

class ResolveError : public std::runtime_error {
public:
    ResolveError(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const noexcept { return kind_; }
    const char* stage() const noexcept { return stageName(kind_); }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

} // namespace bato_core

#endif // BATO_CORE_RESOLVE_ERROR_H
