#include "bato_core/url_recombiner.h"
#include "bato_core/resolve_error.h"
#include <iomanip>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include <openssl/sha.h>

namespace bato_core {

std::vector<std::string> parseFragmentList(const std::string& plaintext) {
    std::vector<std::string> fragments;
    try {
        nlohmann::json parsed = nlohmann::json::parse(plaintext);
        if (!parsed.is_array()) {
            throw ResolveError(ErrorKind::DecodeFailed, "fragment list is not a JSON array");
        }
        for (const auto& item : parsed) {
            if (!item.is_string()) {
                throw ResolveError(ErrorKind::DecodeFailed, "fragment list holds a non-string element");
            }
            fragments.push_back(item.get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ResolveError(ErrorKind::DecodeFailed, std::string("fragment list is not valid JSON: ") + e.what());
    }
    return fragments;
}

ChapterPageSet recombineUrls(const std::vector<std::string>& baseUrls,
                             const std::vector<std::string>& fragments) {
    if (!fragments.empty() && fragments.size() != baseUrls.size()) {
        throw ResolveError(ErrorKind::LengthMismatch,
                           std::to_string(fragments.size()) + " fragments for "
                               + std::to_string(baseUrls.size()) + " base URLs");
    }

    ChapterPageSet result;
    result.pages.reserve(baseUrls.size());
    for (size_t i = 0; i < baseUrls.size(); ++i) {
        PageImageEntry entry;
        entry.baseUrl = baseUrls[i];
        if (!fragments.empty()) {
            entry.queryFragment = fragments[i];
        }
        result.pages.push_back(std::move(entry));
    }
    return result;
}

std::string generatePageId(const std::string& url) {
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(url.data()), url.size(), digest);

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned char b : digest) {
        hex << std::setw(2) << static_cast<int>(b);
    }
    return hex.str();
}

} // namespace bato_core
