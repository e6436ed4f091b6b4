#include <chatgate/webhook/signature.hpp>

#include <gtest/gtest.h>
#include <cctype>

using namespace chatgate;

TEST(SignatureTest, SameSecretSameBytesVerifies) {
    std::string body = "{\"event\":\"message\",\"id\":\"e1\"}";
    std::string header = sign_body("S1", body);
    EXPECT_EQ(0u, header.find("sha256="));
    EXPECT_EQ(7u + 64u, header.size());
    EXPECT_EQ(SignatureCheck::VALID, check_signature("S1", body, header));
    EXPECT_TRUE(verify_signature("S1", body, header));
}

TEST(SignatureTest, DifferentSecretFails) {
    std::string body = "{\"event\":\"message\"}";
    std::string header = sign_body("S1", body);
    EXPECT_EQ(SignatureCheck::MISMATCH, check_signature("S2", body, header));
    EXPECT_FALSE(verify_signature("S2", body, header));
}

TEST(SignatureTest, SingleByteMutationFails) {
    std::string body = "{\"event\":\"message\",\"n\":1}";
    std::string header = sign_body("S1", body);
    std::string mutated = body;
    mutated[mutated.size() - 2] = '2';
    EXPECT_EQ(SignatureCheck::MISMATCH, check_signature("S1", mutated, header));

    // reserialising is a mutation too: whitespace counts
    EXPECT_FALSE(verify_signature("S1", "{\"event\": \"message\",\"n\":1}", header));
}

TEST(SignatureTest, KnownVector) {
    // RFC 4231 test case 2
    EXPECT_EQ("sha256=5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
              sign_body("Jefe", "what do ya want for nothing?"));
}

TEST(SignatureTest, HeaderCaseIsNotSignificant) {
    std::string body = "payload";
    std::string header = sign_body("S1", body);
    std::string upper = "SHA256=";
    for (size_t i = 7; i < header.size(); ++i) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(header[i])));
    }
    EXPECT_EQ(SignatureCheck::VALID, check_signature("S1", body, upper));
}

TEST(SignatureTest, MissingOrMalformedHeaderRejected) {
    EXPECT_EQ(SignatureCheck::MISSING, check_signature("S1", "x", ""));
    EXPECT_EQ(SignatureCheck::MISSING, check_signature("S1", "x", "   "));
    EXPECT_EQ(SignatureCheck::MALFORMED, check_signature("S1", "x", "md5=abc"));
    EXPECT_EQ(SignatureCheck::MALFORMED, check_signature("S1", "x", "sha256=zz"));
    EXPECT_EQ(SignatureCheck::MALFORMED,
              check_signature("S1", "x", "sha256=" + std::string(64, 'g')));
    EXPECT_FALSE(verify_signature("S1", "x", ""));
}

TEST(SignatureTest, NoSecretSkipsCheck) {
    EXPECT_EQ(SignatureCheck::SKIPPED, check_signature("", "x", ""));
    EXPECT_TRUE(verify_signature("", "x", "garbage"));
    EXPECT_STREQ("skipped", signature_check_str(SignatureCheck::SKIPPED));
}
