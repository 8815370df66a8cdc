#include "appcast/trust/artifact_signer.hpp"

#include "appcast/io/file_reader.hpp"
#include "evp_util.hpp"

#include <array>

namespace appcast {

std::expected<std::string, std::string> ArtifactSigner::SignFile(const std::string& private_key_path,
                                                                 const std::string& artifact_path) {
    evp::BioPtr bio(BIO_new_file(private_key_path.c_str(), "r"));
    if (!bio)
        return std::unexpected("cannot open private key " + private_key_path);
    evp::PkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key)
        return std::unexpected("cannot read private key " + private_key_path + ": " + evp::LastError());

    evp::MdCtx ctx;
    if (!ctx.ok())
        return std::unexpected("EVP_MD_CTX_new failed");

    std::vector<std::uint8_t> sig;

    if (evp::IsOneShotKey(key.get())) {
        std::string message;
        if (auto r = ReadFileToBytes(artifact_path, message); !r.is_ok())
            return std::unexpected(r.message());
        if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1)
            return std::unexpected("sign init failed: " + evp::LastError());

        const auto* data = reinterpret_cast<const unsigned char*>(message.data());
        size_t len = 0;
        if (EVP_DigestSign(ctx.get(), nullptr, &len, data, message.size()) != 1)
            return std::unexpected("sign failed: " + evp::LastError());
        sig.resize(len);
        if (EVP_DigestSign(ctx.get(), sig.data(), &len, data, message.size()) != 1)
            return std::unexpected("sign failed: " + evp::LastError());
        sig.resize(len);
        return evp::Base64Encode(sig);
    }

    FileReader reader;
    if (auto r = FileReader::Open(artifact_path, reader); !r.is_ok())
        return std::unexpected(r.message());
    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1)
        return std::unexpected("sign init failed: " + evp::LastError());

    std::array<std::uint8_t, 64 * 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n < 0)
            return std::unexpected("read failed: " + artifact_path);
        if (n == 0)
            break;
        if (EVP_DigestSignUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1)
            return std::unexpected("digest update failed: " + evp::LastError());
    }

    size_t len = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &len) != 1)
        return std::unexpected("sign failed: " + evp::LastError());
    sig.resize(len);
    if (EVP_DigestSignFinal(ctx.get(), sig.data(), &len) != 1)
        return std::unexpected("sign failed: " + evp::LastError());
    sig.resize(len);
    return evp::Base64Encode(sig);
}

} // namespace appcast
