#include "verify_crypto.h"

#include "authorizer_util.h"   // ybase64_decode, b64decode_loose
#include <cstring>
#include <stdexcept>

#include <sodium.h>
#include <openssl/bio.h>
#include <openssl/pem.h>


namespace authorizer {

// -----------------------------------------------------------------------------
// PEM public key (RSA / ECDSA, SHA-256)
// -----------------------------------------------------------------------------

PemPublicKeyVerifier::PemPublicKeyVerifier(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), (int)pem.size());
    if (!bio) throw std::runtime_error("BIO_new_mem_buf failed");

    pkey_ = PEM_read_bio_PUBKEY(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!pkey_) throw std::runtime_error("bad public key");
}

PemPublicKeyVerifier::~PemPublicKeyVerifier() {
    EVP_PKEY_free(pkey_);
}

void PemPublicKeyVerifier::verify(const std::string& data, const std::string& signature) const {
    if (signature.empty()) throw std::runtime_error("empty signature");

    const std::vector<unsigned char> sig = ybase64_decode(signature);

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    if (EVP_DigestVerifyInit(ctx, nullptr, EVP_sha256(), nullptr, pkey_) != 1 ||
        EVP_DigestVerifyUpdate(ctx, data.data(), data.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP digest verify init failed");
    }

    const int rc = EVP_DigestVerifyFinal(ctx, sig.data(), sig.size());
    EVP_MD_CTX_free(ctx);

    // 1 = valid, 0 = mismatch, <0 = malformed signature
    if (rc != 1) throw std::runtime_error("invalid signature");
}

// -----------------------------------------------------------------------------
// Ed25519 (libsodium)
// -----------------------------------------------------------------------------

Ed25519Verifier::Ed25519Verifier(const std::array<unsigned char, 32>& pk) : pk_(pk) {}

Ed25519Verifier Ed25519Verifier::from_b64(const std::string& pk_b64) {
    const std::vector<unsigned char> pk = b64decode_loose(pk_b64);
    if (pk.size() != crypto_sign_PUBLICKEYBYTES) throw std::runtime_error("bad public key size");

    std::array<unsigned char, 32> a{};
    std::memcpy(a.data(), pk.data(), a.size());
    return Ed25519Verifier(a);
}

void Ed25519Verifier::verify(const std::string& data, const std::string& signature) const {
    const std::vector<unsigned char> sig = b64decode_loose(signature);
    if (sig.size() != crypto_sign_BYTES) throw std::runtime_error("bad signature size");

    if (crypto_sign_verify_detached(sig.data(),
                                    reinterpret_cast<const unsigned char*>(data.data()),
                                    (unsigned long long)data.size(),
                                    pk_.data()) != 0) {
        throw std::runtime_error("invalid signature");
    }
}

std::string pem_from_key_material(const std::string& key) {
    if (key.find("-----BEGIN") != std::string::npos) return key;

    const std::vector<unsigned char> pem = ybase64_decode(key);
    return std::string(pem.begin(), pem.end());
}

} // namespace authorizer
