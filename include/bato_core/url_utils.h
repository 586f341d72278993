#ifndef BATO_CORE_URL_UTILS_H
#define BATO_CORE_URL_UTILS_H

#include <string>

namespace bato_core {

constexpr const char* kDefaultDomain = "bato.si";

bool isValidDomain(const std::string& domain);

// http(s) URL whose host is bato.si, bato.to or @p configuredDomain (an
// optional "www." prefix is ignored) and whose path contains "/chapter/".
bool isAllowedChapterUrl(const std::string& url, const std::string& configuredDomain = kDefaultDomain);

// Leaves absolute http(s) URLs alone; resolves anything else against
// https://<domain>.
std::string toAbsoluteUrl(const std::string& domain, const std::string& path);

} // namespace bato_core

#endif // BATO_CORE_URL_UTILS_H
