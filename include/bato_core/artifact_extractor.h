#ifndef BATO_CORE_ARTIFACT_EXTRACTOR_H
#define BATO_CORE_ARTIFACT_EXTRACTOR_H

#include "bato_core/chapter_types.h"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace bato_core {

class ArtifactExtractor {
public:
    explicit ArtifactExtractor(const SiteFormat& format = SiteFormat{});

    // Finds the first script that carries the locator marker and all three
    // literals. Throws ResolveError(ExtractionFailed) naming what was missing.
    PageArtifacts extract(const std::string& pageText) const;

    // Bodies of every <script> element in document order. A page with no
    // script elements is returned whole, as a single body.
    static std::vector<std::string> findScriptBlocks(const std::string& pageText);

private:
    PageArtifacts extractFromScript(const std::string& script) const;
    std::optional<std::string> extractArrayLiteral(const std::string& script) const;
    std::optional<std::string> extractStatementValue(const std::string& script, const std::regex& assignment) const;

    SiteFormat format_;
    std::regex baseUrlsRegex_;
    std::regex passwordRegex_;
    std::regex wordRegex_;
};

} // namespace bato_core

#endif // BATO_CORE_ARTIFACT_EXTRACTOR_H
