#include "bato_core/chapter_resolver.h"
#include "bato_core/resolve_error.h"
#include "test_support.h"
#include <gtest/gtest.h>

using bato_core::ChapterResolver;
using bato_core::ErrorKind;
using bato_core::ResolveError;

namespace {

const std::string kBase0 = "https://xfs-n03.xfsbb.com/comic/7002/ab1/6650c1b4_1080_1570_201583.webp";
const std::string kBase1 = "https://xfs-n03.xfsbb.com/comic/7002/ab1/6650c1b4_1080_1570_187104.webp";
const std::string kImages = "[\"" + kBase0 + "\",\"" + kBase1 + "\"]";
const std::string kPassword = "0.8453226149392087";

ErrorKind resolveError(const ChapterResolver& resolver, const std::string& page) {
    try {
        auto pages = resolver.resolve(page);
        ADD_FAILURE() << "expected a ResolveError, got " << pages.size() << " page(s)";
    } catch (const ResolveError& e) {
        return e.kind();
    }
    return ErrorKind::ExtractionFailed;
}

} // namespace

TEST(ChapterResolver, ResolvesEncryptedQueryFragments) {
    bato_test::FixedEvaluator evaluator(kPassword);
    ChapterResolver resolver(evaluator);

    std::string page = bato_test::chapterPage(kImages, "[]+(+!![]+(!+[]+!![]))",
                                              bato_test::sealWord(R"(["x=1",""])", kPassword));
    std::vector<std::string> urls = resolver.resolveUrls(page);

    EXPECT_EQ(urls, (std::vector<std::string>{kBase0 + "?x=1", kBase1}));
    EXPECT_EQ(evaluator.calls, 1);
    EXPECT_EQ(evaluator.lastExpression, "[]+(+!![]+(!+[]+!![]))");
}

TEST(ChapterResolver, EmptyFragmentListYieldsBaseUrls) {
    bato_test::FixedEvaluator evaluator(kPassword);
    ChapterResolver resolver(evaluator);

    std::string page = bato_test::chapterPage(kImages, "x", bato_test::sealWord("[]", kPassword));
    bato_core::ChapterPageSet pages = resolver.resolve(page);

    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages.pages[0].url(), kBase0);
    EXPECT_EQ(pages.pages[1].url(), kBase1);
    EXPECT_EQ(pages.pages[0].id().size(), 40u);
}

TEST(ChapterResolver, WorksWithLiteralEvaluator) {
    bato_core::LiteralEvaluator evaluator;
    ChapterResolver resolver(evaluator);

    std::string page = bato_test::chapterPage(kImages, "'0.845' + '3226149392087'",
                                              bato_test::sealWord(R"(["acc=a&exp=1","acc=b&exp=2"])", kPassword));
    EXPECT_EQ(resolver.resolveUrls(page),
              (std::vector<std::string>{kBase0 + "?acc=a&exp=1", kBase1 + "?acc=b&exp=2"}));
}

TEST(ChapterResolver, ExtractionFailureSkipsEvaluation) {
    bato_test::FixedEvaluator evaluator(kPassword);
    ChapterResolver resolver(evaluator);

    EXPECT_EQ(resolveError(resolver, "<html><body>No chapter here</body></html>"), ErrorKind::ExtractionFailed);
    EXPECT_EQ(evaluator.calls, 0);
}

TEST(ChapterResolver, EvaluatorFailuresAreTaggedUniformly) {
    std::string page = bato_test::chapterPage(kImages, "x", bato_test::sealWord("[]", kPassword));

    bato_test::ThrowingEvaluator throwing;
    EXPECT_EQ(resolveError(ChapterResolver(throwing), page), ErrorKind::EvaluatorFailed);

    bato_test::FixedEvaluator empty("");
    EXPECT_EQ(resolveError(ChapterResolver(empty), page), ErrorKind::EvaluatorFailed);

    bato_core::LiteralEvaluator literal; // "x" is not a supported shape
    EXPECT_EQ(resolveError(ChapterResolver(literal), page), ErrorKind::EvaluatorFailed);
}

TEST(ChapterResolver, MalformedWordIsDecodeFailure) {
    bato_test::FixedEvaluator evaluator(kPassword);
    ChapterResolver resolver(evaluator);

    EXPECT_EQ(resolveError(resolver, bato_test::chapterPage(kImages, "x", "%%%not-base64%%%")), ErrorKind::DecodeFailed);

    std::string unsalted = bato_test::encodeBase64(std::vector<std::uint8_t>(48, 'A'));
    EXPECT_EQ(resolveError(resolver, bato_test::chapterPage(kImages, "x", unsalted)), ErrorKind::DecodeFailed);
}

TEST(ChapterResolver, TruncatedCiphertextIsCipherFailure) {
    bato_test::FixedEvaluator evaluator(kPassword);
    ChapterResolver resolver(evaluator);

    std::vector<std::uint8_t> raw = bato_test::sealPayload(R"(["x=1",""])", kPassword);
    raw.pop_back();
    EXPECT_EQ(resolveError(resolver, bato_test::chapterPage(kImages, "x", bato_test::encodeBase64(raw))),
              ErrorKind::CipherFailed);
}

TEST(ChapterResolver, WrongPasswordIsCipherFailure) {
    bato_test::FixedEvaluator evaluator("not the password");
    ChapterResolver resolver(evaluator);

    std::string page = bato_test::chapterPage(kImages, "x", bato_test::sealWord(R"(["x=1","y=2"])", kPassword));
    EXPECT_EQ(resolveError(resolver, page), ErrorKind::CipherFailed);
}

TEST(ChapterResolver, FragmentCountMismatchIsFatal) {
    bato_test::FixedEvaluator evaluator(kPassword);
    ChapterResolver resolver(evaluator);

    std::string page = bato_test::chapterPage(kImages, "x", bato_test::sealWord(R"(["a","b","c"])", kPassword));
    EXPECT_EQ(resolveError(resolver, page), ErrorKind::LengthMismatch);
}

TEST(ChapterResolver, NonJsonPlaintextIsDecodeFailure) {
    bato_test::FixedEvaluator evaluator(kPassword);
    ChapterResolver resolver(evaluator);

    std::string page = bato_test::chapterPage(kImages, "x", bato_test::sealWord("x=1,y=2", kPassword));
    EXPECT_EQ(resolveError(resolver, page), ErrorKind::DecodeFailed);
}

TEST(ChapterResolver, ErrorMessageNamesStage) {
    bato_test::FixedEvaluator evaluator(kPassword);
    ChapterResolver resolver(evaluator);

    std::string page = bato_test::chapterPage(kImages, "x", bato_test::sealWord(R"(["a"])", kPassword));
    try {
        resolver.resolve(page);
        FAIL() << "expected LengthMismatch";
    } catch (const ResolveError& e) {
        EXPECT_STREQ(bato_core::errorKindName(e.kind()), "LengthMismatch");
        EXPECT_EQ(std::string(e.what()).rfind("recombine: ", 0), 0u);
    }
}
