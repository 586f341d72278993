#include "bato_core/chapter_types.h"
#include "bato_core/url_recombiner.h"
#include <utility>
#include <openssl/crypto.h>

namespace bato_core {

DerivedKeyMaterial::DerivedKeyMaterial(std::vector<std::uint8_t> key, std::vector<std::uint8_t> iv)
    : key_(std::move(key)), iv_(std::move(iv)) {}

DerivedKeyMaterial::~DerivedKeyMaterial() {
    wipe();
}

DerivedKeyMaterial::DerivedKeyMaterial(DerivedKeyMaterial&& other) noexcept
    : key_(std::move(other.key_)), iv_(std::move(other.iv_)) {
    other.key_.clear();
    other.iv_.clear();
}

DerivedKeyMaterial& DerivedKeyMaterial::operator=(DerivedKeyMaterial&& other) noexcept {
    if (this != &other) {
        wipe();
        key_ = std::move(other.key_);
        iv_ = std::move(other.iv_);
        other.key_.clear();
        other.iv_.clear();
    }
    return *this;
}

void DerivedKeyMaterial::wipe() {
    if (!key_.empty()) OPENSSL_cleanse(key_.data(), key_.size());
    if (!iv_.empty()) OPENSSL_cleanse(iv_.data(), iv_.size());
}

std::string PageImageEntry::url() const {
    if (queryFragment.empty()) {
        return baseUrl;
    }
    return baseUrl + "?" + queryFragment;
}

std::string PageImageEntry::id() const {
    return generatePageId(url());
}

std::vector<std::string> ChapterPageSet::urls() const {
    std::vector<std::string> out;
    out.reserve(pages.size());
    for (const auto& page : pages) {
        out.push_back(page.url());
    }
    return out;
}

} // namespace bato_core
