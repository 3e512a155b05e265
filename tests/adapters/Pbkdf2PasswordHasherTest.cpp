#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/Pbkdf2PasswordHasher.hpp"

using namespace iam;
using ::testing::StartsWith;

class Pbkdf2PasswordHasherTest : public ::testing::Test {
protected:
    void SetUp() override {
        hasher_ = std::make_shared<adapters::secondary::Pbkdf2PasswordHasher>(
            std::make_shared<settings::PasswordSettings>(8, 1000));
    }

    std::shared_ptr<adapters::secondary::Pbkdf2PasswordHasher> hasher_;
};

TEST_F(Pbkdf2PasswordHasherTest, Hash_HasSchemeAndIterations) {
    auto hash = hasher_->hash("P@ss1234");

    EXPECT_THAT(hash, StartsWith("pbkdf2_sha256$1000$"));
    EXPECT_EQ(hash.find("P@ss1234"), std::string::npos);
}

TEST_F(Pbkdf2PasswordHasherTest, Verify_CorrectPassword) {
    auto hash = hasher_->hash("P@ss1234");

    EXPECT_TRUE(hasher_->verify("P@ss1234", hash));
    EXPECT_FALSE(hasher_->verify("P@ss1235", hash));
    EXPECT_FALSE(hasher_->verify("", hash));
}

TEST_F(Pbkdf2PasswordHasherTest, Hash_SaltDiffersPerCall) {
    EXPECT_NE(hasher_->hash("P@ss1234"), hasher_->hash("P@ss1234"));
}

TEST_F(Pbkdf2PasswordHasherTest, Verify_UsesIterationsFromStoredHash) {
    auto hash = hasher_->hash("P@ss1234");

    adapters::secondary::Pbkdf2PasswordHasher stronger(
        std::make_shared<settings::PasswordSettings>(8, 5000));

    EXPECT_TRUE(stronger.verify("P@ss1234", hash));
}

TEST_F(Pbkdf2PasswordHasherTest, Verify_MalformedHash_ReturnsFalse) {
    EXPECT_FALSE(hasher_->verify("P@ss1234", ""));
    EXPECT_FALSE(hasher_->verify("P@ss1234", "hash:P@ss1234"));
    EXPECT_FALSE(hasher_->verify("P@ss1234", "pbkdf2_sha256$abc$00$00"));
    EXPECT_FALSE(hasher_->verify("P@ss1234", "md5$1000$00$00"));
}
