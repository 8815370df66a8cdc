#pragma once

#include "appcast/util/result.hpp"

#include <optional>
#include <string>

namespace appcast {

enum class TrustVerdict {
    Verified,
    NoSignaturePresent,
    VerificationFailed,
};

const char* ToString(TrustVerdict verdict);

// Checks a base64 signature over an artifact on disk against a PEM public key.
// DSA, RSA and ECDSA keys verify a SHA-256 digest streamed from the file;
// Ed25519/Ed448 keys verify the whole message in one shot.
// Reads the artifact and the key, never modifies either.
class SignatureVerifier {
public:
    TrustVerdict Verify(const std::optional<std::string>& signature,
                        const std::string& artifact_path,
                        const std::string& public_key_path) const;

    // Ok only for a matching signature; the message names the failure otherwise.
    Result CheckSignature(const std::string& signature_b64,
                          const std::string& artifact_path,
                          const std::string& public_key_path) const;
};

} // namespace appcast
