#pragma once

#include "exampack/manifest.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace exampack {

// ============================================================================
// SHA-256 (OpenSSL EVP)
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;  // lowercase
};

HashResult compute_sha256(const std::vector<uint8_t>& data);
HashResult compute_sha256_file(const std::string& file_path);

struct ChecksumResult {
    bool is_valid = false;
    std::string computed_hash;
    std::string error;
};

// Case-insensitive comparison of SHA-256(data) against expected_hex
ChecksumResult verify_checksum(const std::vector<uint8_t>& data, const std::string& expected_hex);

// ============================================================================
// Hex Encoding
// ============================================================================

std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const std::vector<uint8_t>& data);

// nullopt on odd length or non-hex characters
std::optional<std::vector<uint8_t>> from_hex(const std::string& hex);

// ============================================================================
// Ed25519 Signatures
// ============================================================================
//
// A manifest signature covers the canonical payload
//
//   "exampack-manifest-v1\n" id "\n" version "\n" lowercase(checksum) "\n" createdAt
//   "\n" minAppVersion "\n" maxAppVersion "\n" files.questions "\n" files.examTemplates
//   "\n" files.tips "\n" count(files.media) { "\n" media }
//
// so that it binds the pack identity, compatibility window and file layout
// to the archive digest. An absent maxAppVersion signs as "". Keys and
// signatures travel as lowercase hex: 64 chars per public or private key,
// 128 chars per signature.

inline constexpr const char* SIGNING_PAYLOAD_PREFIX = "exampack-manifest-v1";
inline constexpr size_t ED25519_KEY_HEX_LENGTH = 64;
inline constexpr size_t ED25519_SIGNATURE_HEX_LENGTH = 128;

std::string signing_payload(const PackManifest& manifest);

struct SigningKey {
    bool ok = false;
    std::string error;
    std::string public_key_hex;
    std::string private_key_hex;
};

SigningKey generate_signing_key();

struct SignResult {
    bool ok = false;
    std::string error;
    std::string signature_hex;
};

SignResult sign_manifest(const PackManifest& manifest, const std::string& private_key_hex);

struct SignatureCheck {
    bool is_valid = false;
    std::string error;
    std::optional<size_t> key_index;  // which trusted key accepted the signature
};

// Verify one signature against one public key
SignatureCheck verify_ed25519(const std::string& message,
                              const std::string& signature_hex,
                              const std::string& public_key_hex);

// ============================================================================
// Pack Verifier
// ============================================================================

struct IntegrityResult {
    bool is_valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/**
 * Decides whether downloaded pack bytes may become an installed pack.
 *
 * Trust anchors are pinned public keys. A signature accepted by any of them
 * is trusted, so keys can be rotated by shipping the new key alongside the
 * old one. With no trusted keys every signature check fails.
 */
class PackVerifier {
public:
    explicit PackVerifier(std::vector<std::string> trusted_keys,
                          int64_t max_pack_age_days = 365);

    SignatureCheck verify_signature(const PackManifest& manifest) const;

    // Checksum and signature must both pass; either failure is an error.
    // Also checks identity fields and warns about stale packs.
    IntegrityResult verify_pack_integrity(const std::vector<uint8_t>& data,
                                          const PackManifest& manifest) const;

    // Re-hash installed or cached bytes against the manifest they came with
    IntegrityResult detect_tampering(const PackManifest& manifest,
                                     const std::vector<uint8_t>& data) const;

    const std::vector<std::string>& trusted_keys() const { return trusted_keys_; }

private:
    std::vector<std::string> trusted_keys_;
    int64_t max_pack_age_days_;
};

} // namespace exampack
