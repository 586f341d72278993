#include "bato_core/artifact_extractor.h"
#include "bato_core/resolve_error.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>
#include <nlohmann/json.hpp>

namespace bato_core {

static std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string stripQuotes(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

static std::regex compilePattern(const std::string& pattern, const char* what) {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw ResolveError(ErrorKind::ExtractionFailed,
                           std::string("invalid ") + what + " pattern '" + pattern + "': " + e.what());
    }
}

ArtifactExtractor::ArtifactExtractor(const SiteFormat& format)
    : format_(format),
      baseUrlsRegex_(compilePattern(format.baseUrlsPattern, "base-URL")),
      passwordRegex_(compilePattern(format.passwordPattern, "password")),
      wordRegex_(compilePattern(format.wordPattern, "word")) {}

std::vector<std::string> ArtifactExtractor::findScriptBlocks(const std::string& pageText) {
    std::string lowered = pageText;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::vector<std::string> blocks;
    bool sawScriptTag = false;
    size_t pos = 0;
    while ((pos = lowered.find("<script", pos)) != std::string::npos) {
        size_t nameEnd = pos + 7;
        if (nameEnd < lowered.size() && lowered[nameEnd] != '>' && !std::isspace(static_cast<unsigned char>(lowered[nameEnd]))) {
            pos = nameEnd; // e.g. <scripts>
            continue;
        }
        size_t openEnd = lowered.find('>', nameEnd);
        if (openEnd == std::string::npos) break;
        sawScriptTag = true;

        size_t bodyStart = openEnd + 1;
        size_t close = lowered.find("</script", bodyStart);
        if (close == std::string::npos) close = lowered.size();
        blocks.push_back(pageText.substr(bodyStart, close - bodyStart));
        pos = close;
    }

    if (!sawScriptTag) {
        blocks.push_back(pageText);
    }
    return blocks;
}

std::optional<std::string> ArtifactExtractor::extractArrayLiteral(const std::string& script) const {
    std::smatch match;
    if (!std::regex_search(script, match, baseUrlsRegex_)) {
        return std::nullopt;
    }
    size_t start = static_cast<size_t>(match.position(0) + match.length(0));
    if (start >= script.size() || script[start] != '[') {
        return std::nullopt;
    }

    // Bracket matching that skips over string literals, like the brace
    // counting used for embedded JSON objects.
    int depth = 0;
    char quote = 0;
    for (size_t i = start; i < script.size(); ++i) {
        char c = script[i];
        if (quote) {
            if (c == '\\') { ++i; continue; }
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            depth++;
        } else if (c == ']') {
            depth--;
            if (depth == 0) {
                return script.substr(start, i - start + 1);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> ArtifactExtractor::extractStatementValue(const std::string& script,
                                                                     const std::regex& assignment) const {
    std::smatch match;
    if (!std::regex_search(script, match, assignment)) {
        return std::nullopt;
    }
    size_t start = static_cast<size_t>(match.position(0) + match.length(0));
    size_t end = script.find(';', start);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    std::string value = trim(script.substr(start, end - start));
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

PageArtifacts ArtifactExtractor::extractFromScript(const std::string& script) const {
    auto arrayLiteral = extractArrayLiteral(script);
    if (!arrayLiteral) {
        throw ResolveError(ErrorKind::ExtractionFailed, "base-URL array literal not found");
    }

    PageArtifacts artifacts;
    try {
        nlohmann::json images = nlohmann::json::parse(*arrayLiteral);
        if (!images.is_array()) {
            throw ResolveError(ErrorKind::ExtractionFailed, "base-URL literal is not an array");
        }
        for (const auto& item : images) {
            if (!item.is_string()) {
                throw ResolveError(ErrorKind::ExtractionFailed, "base-URL array holds a non-string element");
            }
            artifacts.baseUrls.push_back(item.get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ResolveError(ErrorKind::ExtractionFailed, std::string("base-URL array is not valid JSON: ") + e.what());
    }

    auto passwordExpr = extractStatementValue(script, passwordRegex_);
    if (!passwordExpr) {
        throw ResolveError(ErrorKind::ExtractionFailed, "password expression assignment not found");
    }
    artifacts.passwordExpression = *passwordExpr;

    auto word = extractStatementValue(script, wordRegex_);
    if (!word) {
        throw ResolveError(ErrorKind::ExtractionFailed, "encoded word assignment not found");
    }
    artifacts.encodedWord = trim(stripQuotes(*word));
    if (artifacts.encodedWord.empty()) {
        throw ResolveError(ErrorKind::ExtractionFailed, "encoded word literal is empty");
    }
    return artifacts;
}

PageArtifacts ArtifactExtractor::extract(const std::string& pageText) const {
    std::vector<std::string> candidates;
    for (auto& block : findScriptBlocks(pageText)) {
        if (block.find(format_.locatorMarker) != std::string::npos) {
            candidates.push_back(std::move(block));
        }
    }
    if (candidates.empty()) {
        throw ResolveError(ErrorKind::ExtractionFailed,
                           "no script block contains '" + format_.locatorMarker + "'");
    }

    for (size_t i = 0; i < candidates.size(); ++i) {
        try {
            return extractFromScript(candidates[i]);
        } catch (const ResolveError& e) {
            if (i + 1 == candidates.size()) {
                throw;
            }
            std::cerr << "Skipping script block " << (i + 1) << " of " << candidates.size()
                      << ": " << e.detail() << std::endl;
        }
    }
    // candidates is non-empty, so the loop either returned or rethrew.
    throw ResolveError(ErrorKind::ExtractionFailed, "no usable script block");
}

} // namespace bato_core
