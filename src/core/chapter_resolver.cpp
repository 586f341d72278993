#include "bato_core/chapter_resolver.h"
#include "bato_core/block_decryptor.h"
#include "bato_core/key_deriver.h"
#include "bato_core/payload_codec.h"
#include "bato_core/resolve_error.h"
#include "bato_core/url_recombiner.h"
#include <exception>
#include <openssl/crypto.h>

namespace bato_core {

ChapterResolver::ChapterResolver(const PasswordEvaluator& evaluator, const SiteFormat& format)
    : evaluator_(evaluator), format_(format), extractor_(format) {}

std::string ChapterResolver::evaluatePassword(const std::string& expression) const {
    std::string password;
    try {
        password = evaluator_.evaluate(expression);
    } catch (const ResolveError& e) {
        if (e.kind() == ErrorKind::EvaluatorFailed) {
            throw;
        }
        throw ResolveError(ErrorKind::EvaluatorFailed, e.detail());
    } catch (const std::exception& e) {
        throw ResolveError(ErrorKind::EvaluatorFailed, std::string(evaluator_.name()) + " evaluator: " + e.what());
    }
    if (password.empty()) {
        throw ResolveError(ErrorKind::EvaluatorFailed, "expression evaluated to an empty string");
    }
    return password;
}

ChapterPageSet ChapterResolver::resolve(const std::string& pageText) const {
    PageArtifacts artifacts = extractor_.extract(pageText);
    std::string password = evaluatePassword(artifacts.passwordExpression);

    std::string plaintext;
    try {
        EncryptedPayload payload = decodePayload(artifacts.encodedWord, format_.payloadMarker);
        DerivedKeyMaterial material = deriveKeyMaterial(password, payload.salt, format_.keyLength, format_.ivLength);
        plaintext = decryptPayloadText(payload, material);
    } catch (...) {
        OPENSSL_cleanse(&password[0], password.size());
        throw;
    }
    OPENSSL_cleanse(&password[0], password.size());

    std::vector<std::string> fragments = parseFragmentList(plaintext);
    return recombineUrls(artifacts.baseUrls, fragments);
}

std::vector<std::string> ChapterResolver::resolveUrls(const std::string& pageText) const {
    return resolve(pageText).urls();
}

} // namespace bato_core
