#pragma once

#include <expected>
#include <string>

namespace appcast {

// Produces the base64 `signature` feed value for an artifact. Inverse of
// SignatureVerifier; used by publishers and by tests.
class ArtifactSigner {
public:
    static std::expected<std::string, std::string> SignFile(const std::string& private_key_path,
                                                            const std::string& artifact_path);
};

} // namespace appcast
