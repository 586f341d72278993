#ifndef BATO_CORE_PAGE_FETCHER_H
#define BATO_CORE_PAGE_FETCHER_H

#include "bato_core/url_utils.h"
#include <optional>
#include <string>

namespace bato_core {

class PageFetcher {
public:
    explicit PageFetcher(std::string domain = kDefaultDomain);

    // GETs a chapter page. Relative paths are resolved against the domain.
    // Returns std::nullopt (after reporting on std::cerr) for disallowed URLs,
    // transport errors and non-200 responses.
    std::optional<std::string> fetchPage(const std::string& urlOrPath) const;

    const std::string& domain() const { return domain_; }

private:
    std::string domain_;
};

} // namespace bato_core

#endif // BATO_CORE_PAGE_FETCHER_H
