#ifndef BATO_CORE_CHAPTER_TYPES_H
#define BATO_CORE_CHAPTER_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bato_core {

constexpr std::size_t kSaltSize = 8;
constexpr std::size_t kAesBlockSize = 16;

// Site-format constants. Everything the site controls lives here so a markup
// change is a one-struct edit.
struct SiteFormat {
    // Text that identifies the inline script carrying the three literals.
    std::string locatorMarker = "const imgHttps =";

    // Each pattern matches up to the first character of the literal's value.
    std::string baseUrlsPattern = R"(const\s+imgHttps\s*=\s*)";
    std::string passwordPattern = R"(\bbatoPass\s*=(?!=)\s*)";
    std::string wordPattern = R"(\bbatoWord\s*=(?!=)\s*)";

    std::string payloadMarker = "Salted__";
    int keyLength = 32; // AES-256
    int ivLength = 16;
};

// The three literals lifted out of the chapter script.
struct PageArtifacts {
    std::vector<std::string> baseUrls;
    std::string passwordExpression; // opaque, never parsed here
    std::string encodedWord;        // base64, quotes stripped
};

// Base64-decoded batoWord with the marker checked and split off.
struct EncryptedPayload {
    std::vector<std::uint8_t> salt;
    std::vector<std::uint8_t> ciphertext;
};

// Key and IV for one decrypt call. Move-only; the bytes are wiped on destruction.
class DerivedKeyMaterial {
public:
    DerivedKeyMaterial() = default;
    DerivedKeyMaterial(std::vector<std::uint8_t> key, std::vector<std::uint8_t> iv);
    ~DerivedKeyMaterial();

    DerivedKeyMaterial(const DerivedKeyMaterial&) = delete;
    DerivedKeyMaterial& operator=(const DerivedKeyMaterial&) = delete;
    DerivedKeyMaterial(DerivedKeyMaterial&& other) noexcept;
    DerivedKeyMaterial& operator=(DerivedKeyMaterial&& other) noexcept;

    const std::vector<std::uint8_t>& key() const { return key_; }
    const std::vector<std::uint8_t>& iv() const { return iv_; }

private:
    void wipe();

    std::vector<std::uint8_t> key_;
    std::vector<std::uint8_t> iv_;
};

struct PageImageEntry {
    std::string baseUrl;
    std::string queryFragment; // may be empty

    // baseUrl, or baseUrl + "?" + queryFragment when a fragment is present.
    std::string url() const;
    // Lowercase hex SHA-1 of url(); stable across runs.
    std::string id() const;
};

// Pages in the order of the site's base-URL array.
struct ChapterPageSet {
    std::vector<PageImageEntry> pages;

    std::vector<std::string> urls() const;
    bool empty() const { return pages.empty(); }
    std::size_t size() const { return pages.size(); }
};

} // namespace bato_core

#endif // BATO_CORE_CHAPTER_TYPES_H
