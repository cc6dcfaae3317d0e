#include "exampack/verifier.hpp"
#include "evp_util.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>

namespace exampack {

// ============================================================================
// Ed25519 (OpenSSL EVP one-shot sign/verify)
// ============================================================================

namespace {

using detail::EvpMdCtx;
using detail::EvpPkey;
using detail::EvpPkeyCtx;
using detail::to_lower;

constexpr size_t ED25519_KEY_BYTES = 32;
constexpr size_t ED25519_SIGNATURE_BYTES = 64;

} // namespace

std::string signing_payload(const PackManifest& manifest) {
    std::string payload = SIGNING_PAYLOAD_PREFIX;
    payload += "\n" + manifest.id;
    payload += "\n" + manifest.version;
    payload += "\n" + to_lower(manifest.checksum);
    payload += "\n" + std::to_string(manifest.created_at);
    payload += "\n" + manifest.min_app_version;
    payload += "\n" + manifest.max_app_version.value_or("");
    payload += "\n" + manifest.files.questions;
    payload += "\n" + manifest.files.exam_templates;
    payload += "\n" + manifest.files.tips;
    payload += "\n" + std::to_string(manifest.files.media.size());
    for (const auto& media : manifest.files.media) {
        payload += "\n" + media;
    }
    return payload;
}

SigningKey generate_signing_key() {
    SigningKey result;

    EvpPkeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx) {
        result.error = "EVP_PKEY_CTX_new_id failed";
        return result;
    }
    if (EVP_PKEY_keygen_init(ctx.get()) != 1) {
        result.error = "EVP_PKEY_keygen_init failed";
        return result;
    }

    EvpPkey key;
    if (EVP_PKEY_keygen(ctx.get(), key.out()) != 1 || !key) {
        result.error = "EVP_PKEY_keygen failed";
        return result;
    }

    uint8_t pub[ED25519_KEY_BYTES];
    size_t pub_len = sizeof(pub);
    if (EVP_PKEY_get_raw_public_key(key.get(), pub, &pub_len) != 1) {
        result.error = "EVP_PKEY_get_raw_public_key failed";
        return result;
    }

    uint8_t priv[ED25519_KEY_BYTES];
    size_t priv_len = sizeof(priv);
    if (EVP_PKEY_get_raw_private_key(key.get(), priv, &priv_len) != 1) {
        result.error = "EVP_PKEY_get_raw_private_key failed";
        return result;
    }

    result.public_key_hex = to_hex(pub, pub_len);
    result.private_key_hex = to_hex(priv, priv_len);
    result.ok = true;
    return result;
}

SignResult sign_manifest(const PackManifest& manifest, const std::string& private_key_hex) {
    SignResult result;

    auto raw = from_hex(private_key_hex);
    if (!raw || raw->size() != ED25519_KEY_BYTES) {
        result.error = "Invalid private key format - must be 64 character hex string";
        return result;
    }

    EvpPkey key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, raw->data(), raw->size()));
    if (!key) {
        result.error = "EVP_PKEY_new_raw_private_key failed";
        return result;
    }

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        result.error = "EVP_DigestSignInit failed";
        return result;
    }

    std::string payload = signing_payload(manifest);
    uint8_t sig[ED25519_SIGNATURE_BYTES];
    size_t sig_len = sizeof(sig);
    if (EVP_DigestSign(ctx.get(), sig, &sig_len,
                       reinterpret_cast<const unsigned char*>(payload.data()),
                       payload.size()) != 1) {
        result.error = "EVP_DigestSign failed";
        return result;
    }

    result.signature_hex = to_hex(sig, sig_len);
    result.ok = true;
    return result;
}

SignatureCheck verify_ed25519(const std::string& message,
                              const std::string& signature_hex,
                              const std::string& public_key_hex) {
    SignatureCheck result;

    auto sig = from_hex(signature_hex);
    if (!sig) {
        result.error = "Invalid signature format - must be hexadecimal";
        return result;
    }
    if (sig->size() != ED25519_SIGNATURE_BYTES) {
        result.error = "Invalid signature format - must be 128 character hex string";
        return result;
    }

    auto pub = from_hex(public_key_hex);
    if (!pub || pub->size() != ED25519_KEY_BYTES) {
        result.error = "Invalid public key format - must be 64 character hex string";
        return result;
    }

    EvpPkey key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, pub->data(), pub->size()));
    if (!key) {
        result.error = "EVP_PKEY_new_raw_public_key failed";
        return result;
    }

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        result.error = "EVP_DigestVerifyInit failed";
        return result;
    }

    if (EVP_DigestVerify(ctx.get(), sig->data(), sig->size(),
                         reinterpret_cast<const unsigned char*>(message.data()),
                         message.size()) != 1) {
        result.error = "Signature verification failed - pack may be tampered with";
        return result;
    }

    result.is_valid = true;
    return result;
}

} // namespace exampack
