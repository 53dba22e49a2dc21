#pragma once

#include <array>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include "signed_policy.h"

/*
Concrete Verifier implementations.

Hard requirement:
- libsodium must be initialized (sodium_init()) somewhere early in process
  startup. Ed25519Verifier and the base64 decoding both call into it.
*/

namespace authorizer {

    // RSA or ECDSA public key (PEM, "BEGIN PUBLIC KEY"), SHA-256 digest.
    // Signatures are ybase64 encoded, as the policy authorities emit them.
    class PemPublicKeyVerifier : public Verifier {
    public:
        // Throws std::runtime_error("bad public key") if the PEM does not parse.
        explicit PemPublicKeyVerifier(const std::string& pem);
        ~PemPublicKeyVerifier() override;

        PemPublicKeyVerifier(const PemPublicKeyVerifier&) = delete;
        PemPublicKeyVerifier& operator=(const PemPublicKeyVerifier&) = delete;

        void verify(const std::string& data, const std::string& signature) const override;

    private:
        EVP_PKEY* pkey_ = nullptr;
    };

    // Raw 32-byte Ed25519 public key; signature is standard or URL-safe base64.
    class Ed25519Verifier : public Verifier {
    public:
        explicit Ed25519Verifier(const std::array<unsigned char, 32>& pk);

        // Throws std::runtime_error on bad encoding or size.
        static Ed25519Verifier from_b64(const std::string& pk_b64);

        void verify(const std::string& data, const std::string& signature) const override;

    private:
        std::array<unsigned char, 32> pk_{};
    };

    // The policy authorities publish PEM keys ybase64 encoded. Accepts either
    // a literal PEM block or its ybase64 form and returns the PEM text.
    std::string pem_from_key_material(const std::string& key);

} // namespace authorizer
