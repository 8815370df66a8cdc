#include "appcast/trust/signature_verifier.hpp"

#include "appcast/io/file_reader.hpp"
#include "appcast/util/errors.hpp"
#include "appcast/util/logger.hpp"
#include "evp_util.hpp"

#include <array>

namespace appcast {

namespace {

std::expected<evp::PkeyPtr, std::string> LoadPublicKey(const std::string& path) {
    if (path.empty())
        return std::unexpected("no public key configured");
    evp::BioPtr bio(BIO_new_file(path.c_str(), "r"));
    if (!bio)
        return std::unexpected("cannot open public key " + path);
    evp::PkeyPtr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key)
        return std::unexpected("cannot read public key " + path + ": " + evp::LastError());
    return key;
}

Result VerifyStreaming(EVP_PKEY* key,
                       const std::vector<std::uint8_t>& sig,
                       const std::string& artifact_path) {
    FileReader reader;
    if (auto r = FileReader::Open(artifact_path, reader); !r.is_ok())
        return r;

    evp::MdCtx ctx;
    if (!ctx.ok() || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1)
        return Result::Fail(errc::kCrypto, "digest init failed: " + evp::LastError());

    std::array<std::uint8_t, 64 * 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n < 0)
            return Result::Fail(errc::kIo, "read failed: " + artifact_path);
        if (n == 0)
            break;
        if (EVP_DigestVerifyUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1)
            return Result::Fail(errc::kCrypto, "digest update failed: " + evp::LastError());
    }

    if (EVP_DigestVerifyFinal(ctx.get(), sig.data(), sig.size()) != 1) {
        ERR_clear_error();
        return Result::Fail(errc::kCrypto, "signature mismatch");
    }
    return Result::Ok();
}

Result VerifyOneShot(EVP_PKEY* key,
                     const std::vector<std::uint8_t>& sig,
                     const std::string& artifact_path) {
    std::string message;
    if (auto r = ReadFileToBytes(artifact_path, message); !r.is_ok())
        return r;

    evp::MdCtx ctx;
    if (!ctx.ok() || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key) != 1)
        return Result::Fail(errc::kCrypto, "verify init failed: " + evp::LastError());

    const int rc = EVP_DigestVerify(ctx.get(),
                                    sig.data(),
                                    sig.size(),
                                    reinterpret_cast<const unsigned char*>(message.data()),
                                    message.size());
    if (rc != 1) {
        ERR_clear_error();
        return Result::Fail(errc::kCrypto, "signature mismatch");
    }
    return Result::Ok();
}

} // namespace

const char* ToString(TrustVerdict verdict) {
    switch (verdict) {
        case TrustVerdict::Verified:           return "Verified";
        case TrustVerdict::NoSignaturePresent: return "NoSignaturePresent";
        case TrustVerdict::VerificationFailed: return "VerificationFailed";
    }
    return "Unknown";
}

Result SignatureVerifier::CheckSignature(const std::string& signature_b64,
                                         const std::string& artifact_path,
                                         const std::string& public_key_path) const {
    auto sig = evp::Base64Decode(signature_b64);
    if (!sig)
        return Result::Fail(errc::kInvalidArgument, sig.error());

    auto key = LoadPublicKey(public_key_path);
    if (!key)
        return Result::Fail(errc::kCrypto, key.error());

    if (evp::IsOneShotKey(key->get()))
        return VerifyOneShot(key->get(), *sig, artifact_path);
    return VerifyStreaming(key->get(), *sig, artifact_path);
}

TrustVerdict SignatureVerifier::Verify(const std::optional<std::string>& signature,
                                       const std::string& artifact_path,
                                       const std::string& public_key_path) const {
    if (!signature || signature->empty())
        return TrustVerdict::NoSignaturePresent;

    auto res = CheckSignature(*signature, artifact_path, public_key_path);
    if (!res.is_ok()) {
        LogError("Signature verification failed for %s: %s",
                 artifact_path.c_str(),
                 res.message().c_str());
        return TrustVerdict::VerificationFailed;
    }
    return TrustVerdict::Verified;
}

} // namespace appcast
