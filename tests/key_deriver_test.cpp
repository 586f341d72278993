#include "bato_core/key_deriver.h"
#include "bato_core/resolve_error.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <utility>
#include <openssl/evp.h>

using bato_core::ErrorKind;
using bato_core::ResolveError;

namespace {

void expectMatchesOpenSsl(const std::string& password, const std::vector<std::uint8_t>& salt) {
    unsigned char key[32];
    unsigned char iv[16];
    ASSERT_EQ(EVP_BytesToKey(EVP_aes_256_cbc(), EVP_md5(), salt.data(),
                             reinterpret_cast<const unsigned char*>(password.data()),
                             static_cast<int>(password.size()), 1, key, iv), 32);

    bato_core::DerivedKeyMaterial material = bato_core::deriveKeyMaterial(password, salt, 32, 16);
    EXPECT_EQ(material.key(), std::vector<std::uint8_t>(key, key + 32)) << "password: " << password;
    EXPECT_EQ(material.iv(), std::vector<std::uint8_t>(iv, iv + 16)) << "password: " << password;
}

ErrorKind derivationError(const std::string& password, const std::vector<std::uint8_t>& salt, int keyLen, int ivLen) {
    try {
        bato_core::deriveKeyMaterial(password, salt, keyLen, ivLen);
    } catch (const ResolveError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a ResolveError";
    return ErrorKind::ExtractionFailed;
}

} // namespace

TEST(KeyDeriver, MatchesEvpBytesToKey) {
    expectMatchesOpenSsl("test_password", {'1', '2', '3', '4', '5', '6', '7', '8'});
    expectMatchesOpenSsl("x", bato_test::kSalt);
    expectMatchesOpenSsl(std::string(200, 'p'), bato_test::kSalt);
    expectMatchesOpenSsl("p\xc3\xa4ss\xe2\x82\xac", bato_test::kSalt);
}

TEST(KeyDeriver, IsDeterministic) {
    auto first = bato_core::deriveKeyMaterial("test_password", bato_test::kSalt, 32, 16);
    auto second = bato_core::deriveKeyMaterial("test_password", bato_test::kSalt, 32, 16);
    EXPECT_EQ(first.key(), second.key());
    EXPECT_EQ(first.iv(), second.iv());
}

TEST(KeyDeriver, PasswordAndSaltBothMatter) {
    auto base = bato_core::deriveKeyMaterial("password1", bato_test::kSalt, 32, 16);
    auto otherPassword = bato_core::deriveKeyMaterial("password2", bato_test::kSalt, 32, 16);
    auto otherSalt = bato_core::deriveKeyMaterial("password1", {'8', '7', '6', '5', '4', '3', '2', '1'}, 32, 16);
    EXPECT_NE(base.key(), otherPassword.key());
    EXPECT_NE(base.key(), otherSalt.key());
}

TEST(KeyDeriver, ShorterLengthsArePrefixesOfTheSameStream) {
    auto full = bato_core::deriveKeyMaterial("pw", bato_test::kSalt, 32, 16);
    auto small = bato_core::deriveKeyMaterial("pw", bato_test::kSalt, 16, 8);

    ASSERT_EQ(small.key().size(), 16u);
    ASSERT_EQ(small.iv().size(), 8u);
    EXPECT_TRUE(std::equal(small.key().begin(), small.key().end(), full.key().begin()));
    EXPECT_TRUE(std::equal(small.iv().begin(), small.iv().end(), full.key().begin() + 16));
}

TEST(KeyDeriver, RejectsInvalidParameters) {
    EXPECT_EQ(derivationError("", bato_test::kSalt, 32, 16), ErrorKind::KeyDerivationFailed);
    EXPECT_EQ(derivationError("pw", {1, 2, 3, 4, 5, 6, 7}, 32, 16), ErrorKind::KeyDerivationFailed);
    EXPECT_EQ(derivationError("pw", {1, 2, 3, 4, 5, 6, 7, 8, 9}, 32, 16), ErrorKind::KeyDerivationFailed);
    EXPECT_EQ(derivationError("pw", {}, 32, 16), ErrorKind::KeyDerivationFailed);
    EXPECT_EQ(derivationError("pw", bato_test::kSalt, 0, 16), ErrorKind::KeyDerivationFailed);
    EXPECT_EQ(derivationError("pw", bato_test::kSalt, 32, -1), ErrorKind::KeyDerivationFailed);
}

TEST(DerivedKeyMaterial, MoveLeavesSourceEmpty) {
    auto material = bato_core::deriveKeyMaterial("pw", bato_test::kSalt, 32, 16);
    bato_core::DerivedKeyMaterial moved(std::move(material));
    EXPECT_EQ(moved.key().size(), 32u);
    EXPECT_TRUE(material.key().empty());
    EXPECT_TRUE(material.iv().empty());
}
