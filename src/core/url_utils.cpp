#include "bato_core/url_utils.h"
#include <algorithm>
#include <cctype>
#include <regex>

namespace bato_core {

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string stripWww(const std::string& host) {
    return host.compare(0, 4, "www.") == 0 ? host.substr(4) : host;
}

bool isValidDomain(const std::string& domain) {
    static const std::regex domainRegex(
        R"(^([a-zA-Z0-9]([a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?\.)+[a-zA-Z]{2,63}$)");
    return !domain.empty() && domain.size() <= 253 && std::regex_match(domain, domainRegex);
}

bool isAllowedChapterUrl(const std::string& url, const std::string& configuredDomain) {
    static const std::regex urlRegex(R"(^(https?)://([^/?#:]+)(:[0-9]+)?([/?#].*)?$)", std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        return false;
    }

    std::string host = stripWww(toLower(match[2].str()));
    std::string configured = stripWww(toLower(configuredDomain));
    if (host != "bato.si" && host != "bato.to" && host != configured) {
        return false;
    }
    return toLower(match[4].str()).find("/chapter/") != std::string::npos;
}

std::string toAbsoluteUrl(const std::string& domain, const std::string& path) {
    std::string lowered = toLower(path.substr(0, 8));
    if (lowered.compare(0, 7, "http://") == 0 || lowered.compare(0, 8, "https://") == 0) {
        return path;
    }
    if (path.compare(0, 2, "//") == 0) {
        return "https:" + path;
    }
    if (path.empty() || path[0] != '/') {
        return "https://" + domain + "/" + path;
    }
    return "https://" + domain + path;
}

} // namespace bato_core
