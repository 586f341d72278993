#ifndef BATO_CORE_URL_RECOMBINER_H
#define BATO_CORE_URL_RECOMBINER_H

#include "bato_core/chapter_types.h"
#include <string>
#include <vector>

namespace bato_core {

// Parses the decrypted plaintext, a JSON array of strings. Throws
// ResolveError(DecodeFailed) for anything else.
std::vector<std::string> parseFragmentList(const std::string& plaintext);

// Pairs baseUrls[i] with fragments[i]. An empty fragment list means every base
// URL is used verbatim; any other size difference throws LengthMismatch.
ChapterPageSet recombineUrls(const std::vector<std::string>& baseUrls,
                             const std::vector<std::string>& fragments);

std::string generatePageId(const std::string& url);

} // namespace bato_core

#endif // BATO_CORE_URL_RECOMBINER_H
