#include "appcast/trust/artifact_signer.hpp"
#include "appcast/trust/signature_verifier.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace {

class SignatureVerifierTest : public ::testing::TestWithParam<const char*> {
  protected:
    testutil::TemporaryDirectory tmp;
    appcast::SignatureVerifier verifier;

    std::string MakeArtifact(const std::string& name, const std::string& contents) {
        const std::string p = tmp.File(name);
        testutil::WriteFile(p, contents);
        return p;
    }
};

TEST_P(SignatureVerifierTest, SignedArtifactVerifies) {
    const auto keys = testutil::GenerateKeyPair(tmp.Path(), GetParam());
    const auto artifact = MakeArtifact("app.bin", std::string(200000, 'x') + "payload");

    auto sig = appcast::ArtifactSigner::SignFile(keys.private_pem, artifact);
    ASSERT_TRUE(sig.has_value()) << sig.error();

    EXPECT_EQ(verifier.Verify(*sig, artifact, keys.public_pem), appcast::TrustVerdict::Verified);
    auto r = verifier.CheckSignature(*sig, artifact, keys.public_pem);
    EXPECT_TRUE(r.is_ok()) << r.message();
}

TEST_P(SignatureVerifierTest, TamperedArtifactFails) {
    const auto keys = testutil::GenerateKeyPair(tmp.Path(), GetParam());
    const auto artifact = MakeArtifact("app.bin", "original contents");

    auto sig = appcast::ArtifactSigner::SignFile(keys.private_pem, artifact);
    ASSERT_TRUE(sig.has_value()) << sig.error();

    testutil::WriteFile(artifact, "original contentz");
    EXPECT_EQ(verifier.Verify(*sig, artifact, keys.public_pem), appcast::TrustVerdict::VerificationFailed);
    // Verification never deletes or rewrites the artifact.
    EXPECT_EQ(testutil::ReadFile(artifact), "original contentz");
}

TEST_P(SignatureVerifierTest, SignatureFromOtherKeyFails) {
    const auto signer = testutil::GenerateKeyPair(tmp.Path(), GetParam(), "signer");
    const auto other = testutil::GenerateKeyPair(tmp.Path(), GetParam(), "other");
    const auto artifact = MakeArtifact("app.bin", "contents");

    auto sig = appcast::ArtifactSigner::SignFile(signer.private_pem, artifact);
    ASSERT_TRUE(sig.has_value()) << sig.error();

    EXPECT_EQ(verifier.Verify(*sig, artifact, other.public_pem), appcast::TrustVerdict::VerificationFailed);
}

INSTANTIATE_TEST_SUITE_P(KeyTypes, SignatureVerifierTest, ::testing::Values("ED25519", "EC", "RSA", "DSA"));

class SignatureVerifierEdgeTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    appcast::SignatureVerifier verifier;
};

TEST_F(SignatureVerifierEdgeTest, AbsentOrEmptySignatureIsNotVerified) {
    const std::string artifact = tmp.File("a.bin");
    testutil::WriteFile(artifact, "x");

    EXPECT_EQ(verifier.Verify(std::nullopt, artifact, ""), appcast::TrustVerdict::NoSignaturePresent);
    EXPECT_EQ(verifier.Verify(std::string{}, artifact, ""), appcast::TrustVerdict::NoSignaturePresent);
}

TEST_F(SignatureVerifierEdgeTest, MalformedBase64Fails) {
    const auto keys = testutil::GenerateKeyPair(tmp.Path(), "ED25519");
    const std::string artifact = tmp.File("a.bin");
    testutil::WriteFile(artifact, "x");

    EXPECT_EQ(verifier.Verify(std::string("!!not base64!!"), artifact, keys.public_pem),
              appcast::TrustVerdict::VerificationFailed);
    auto r = verifier.CheckSignature("!!not base64!!", artifact, keys.public_pem);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.message().find("base64"), std::string::npos) << r.message();
}

TEST_F(SignatureVerifierEdgeTest, MissingPublicKeyFails) {
    const auto keys = testutil::GenerateKeyPair(tmp.Path(), "ED25519");
    const std::string artifact = tmp.File("a.bin");
    testutil::WriteFile(artifact, "x");
    auto sig = appcast::ArtifactSigner::SignFile(keys.private_pem, artifact);
    ASSERT_TRUE(sig.has_value()) << sig.error();

    EXPECT_EQ(verifier.Verify(*sig, artifact, ""), appcast::TrustVerdict::VerificationFailed);
    EXPECT_EQ(verifier.Verify(*sig, artifact, tmp.File("missing.pem")), appcast::TrustVerdict::VerificationFailed);
}

TEST_F(SignatureVerifierEdgeTest, MissingArtifactFails) {
    const auto keys = testutil::GenerateKeyPair(tmp.Path(), "EC");
    const std::string artifact = tmp.File("a.bin");
    testutil::WriteFile(artifact, "x");
    auto sig = appcast::ArtifactSigner::SignFile(keys.private_pem, artifact);
    ASSERT_TRUE(sig.has_value()) << sig.error();

    EXPECT_EQ(verifier.Verify(*sig, tmp.File("gone.bin"), keys.public_pem),
              appcast::TrustVerdict::VerificationFailed);
}

TEST_F(SignatureVerifierEdgeTest, SignerRejectsMissingPrivateKey) {
    const std::string artifact = tmp.File("a.bin");
    testutil::WriteFile(artifact, "x");
    auto sig = appcast::ArtifactSigner::SignFile(tmp.File("nokey.pem"), artifact);
    EXPECT_FALSE(sig.has_value());
}

} // namespace
