#include "appcast/trust/artifact_signer.hpp"
#include "appcast/trust/signature_verifier.hpp"

#include <cstdio>
#include <getopt.h>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -k <private.pem> -i <artifact> [-p <public.pem>]\n"
        "\n"
        "Prints the base64 signature to put in the feed's \"signature\" field.\n"
        "\n"
        "Options:\n"
        "  -k, --key          PEM private key (DSA, RSA, ECDSA or Ed25519)\n"
        "  -i, --input        Artifact to sign\n"
        "  -p, --verify-with  Check the new signature against this public key\n"
        "  -h, --help         Show this help\n",
        argv);
}

} // namespace

int main(int argc, char **argv) {
    const char *key = nullptr;
    const char *in = nullptr;
    const char *pub = nullptr;

    static option long_opts[] = {
        {"key", required_argument, nullptr, 'k'},
        {"input", required_argument, nullptr, 'i'},
        {"verify-with", required_argument, nullptr, 'p'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hk:i:p:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'k':
                key = optarg;
                break;
            case 'i':
                in = optarg;
                break;
            case 'p':
                pub = optarg;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (!key || !in) {
        PrintUsage(argv[0]);
        return 2;
    }

    auto sig = appcast::ArtifactSigner::SignFile(key, in);
    if (!sig) {
        std::fprintf(stderr, "ERROR: %s\n", sig.error().c_str());
        return 1;
    }

    if (pub) {
        appcast::SignatureVerifier verifier;
        if (auto r = verifier.CheckSignature(*sig, in, pub); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: signature does not verify with %s: %s\n", pub, r.message().c_str());
            return 1;
        }
    }

    std::printf("%s\n", sig->c_str());
    return 0;
}
