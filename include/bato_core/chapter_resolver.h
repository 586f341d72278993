#ifndef BATO_CORE_CHAPTER_RESOLVER_H
#define BATO_CORE_CHAPTER_RESOLVER_H

#include "bato_core/artifact_extractor.h"
#include "bato_core/chapter_types.h"
#include "bato_core/password_evaluator.h"
#include <string>
#include <vector>

namespace bato_core {

// Page text in, ordered page URLs out. Each call is independent; the resolver
// holds only configuration and may be shared between threads as long as the
// evaluator can be.
class ChapterResolver {
public:
    explicit ChapterResolver(const PasswordEvaluator& evaluator, const SiteFormat& format = SiteFormat{});

    // Throws ResolveError from the first stage that fails; never returns a
    // partial page set.
    ChapterPageSet resolve(const std::string& pageText) const;
    std::vector<std::string> resolveUrls(const std::string& pageText) const;

private:
    std::string evaluatePassword(const std::string& expression) const;

    const PasswordEvaluator& evaluator_;
    SiteFormat format_;
    ArtifactExtractor extractor_;
};

} // namespace bato_core

#endif // BATO_CORE_CHAPTER_RESOLVER_H
