#include "bato_core/page_fetcher.h"
#include <iostream>
#include <utility>
#include <cpr/cpr.h>

namespace bato_core {

static const char* kUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36";

PageFetcher::PageFetcher(std::string domain) : domain_(std::move(domain)) {}

std::optional<std::string> PageFetcher::fetchPage(const std::string& urlOrPath) const {
    std::string url = toAbsoluteUrl(domain_, urlOrPath);
    if (!isAllowedChapterUrl(url, domain_)) {
        std::cerr << "Refusing to fetch " << url << ": not a chapter URL on " << domain_ << " or bato.to/bato.si" << std::endl;
        return std::nullopt;
    }

    cpr::Response r = cpr::Get(cpr::Url{url},
                               cpr::Header{{"User-Agent", kUserAgent},
                                           {"Accept-Language", "en-US,en;q=0.9"},
                                           {"Referer", "https://" + domain_ + "/"}},
                               cpr::ConnectTimeout{10000},
                               cpr::Timeout{30000});

    if (r.error) {
        std::cerr << "Failed to fetch URL: " << url << std::endl;
        std::cerr << "CPR Error: " << r.error.message << std::endl;
        return std::nullopt;
    }
    if (r.status_code != 200) {
        std::cerr << "Failed to fetch URL: " << url << " Status code: " << r.status_code << std::endl;
        return std::nullopt;
    }
    return r.text;
}

} // namespace bato_core
