#include "exampack/verifier.hpp"
#include "exampack/platform.hpp"
#include "evp_util.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace exampack {

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

using detail::EvpMdCtx;
using detail::to_lower;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr int64_t MS_PER_DAY = 24LL * 60 * 60 * 1000;

} // namespace

std::string to_hex(const uint8_t* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

std::string to_hex(const std::vector<uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

HashResult compute_sha256_file(const std::string& file_path) {
    HashResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

ChecksumResult verify_checksum(const std::vector<uint8_t>& data, const std::string& expected_hex) {
    ChecksumResult result;

    auto hash = compute_sha256(data);
    if (!hash.ok) {
        result.error = "Checksum verification failed: " + hash.error;
        return result;
    }

    result.computed_hash = hash.hex_digest;
    if (hash.hex_digest != to_lower(expected_hex)) {
        result.error = "Checksum mismatch. Expected: " + expected_hex +
                       ", Got: " + hash.hex_digest;
        return result;
    }

    result.is_valid = true;
    return result;
}

// ============================================================================
// Pack Verifier
// ============================================================================

PackVerifier::PackVerifier(std::vector<std::string> trusted_keys, int64_t max_pack_age_days)
    : trusted_keys_(std::move(trusted_keys)), max_pack_age_days_(max_pack_age_days) {}

SignatureCheck PackVerifier::verify_signature(const PackManifest& manifest) const {
    SignatureCheck result;

    if (trusted_keys_.empty()) {
        result.error = "No trusted public key available for signature verification";
        return result;
    }

    std::string payload = signing_payload(manifest);
    std::string last_error;
    for (size_t i = 0; i < trusted_keys_.size(); ++i) {
        auto check = verify_ed25519(payload, manifest.signature, trusted_keys_[i]);
        if (check.is_valid) {
            result.is_valid = true;
            result.key_index = i;
            return result;
        }
        last_error = check.error;
    }

    // A malformed signature is reported as such; otherwise no key matched
    if (manifest.signature.size() != ED25519_SIGNATURE_HEX_LENGTH ||
        !from_hex(manifest.signature)) {
        result.error = last_error;
    } else {
        result.error = "Signature verification failed - pack may be tampered with";
    }
    return result;
}

IntegrityResult PackVerifier::verify_pack_integrity(const std::vector<uint8_t>& data,
                                                    const PackManifest& manifest) const {
    IntegrityResult result;

    auto checksum = verify_checksum(data, manifest.checksum);
    if (!checksum.is_valid) {
        result.errors.push_back(checksum.error);
    }

    auto signature = verify_signature(manifest);
    if (!signature.is_valid) {
        result.errors.push_back(signature.error);
    }

    if (manifest.id.empty() || manifest.version.empty()) {
        result.errors.push_back("Pack manifest missing required identification fields");
    }

    if (manifest.created_at <= 0) {
        result.errors.push_back("Pack manifest missing or invalid creation timestamp");
    } else if (max_pack_age_days_ > 0 &&
               current_time_ms() - manifest.created_at > max_pack_age_days_ * MS_PER_DAY) {
        result.warnings.push_back("Pack is more than " + std::to_string(max_pack_age_days_) +
                                  " days old - consider updating");
    }

    result.is_valid = result.errors.empty();
    return result;
}

IntegrityResult PackVerifier::detect_tampering(const PackManifest& manifest,
                                               const std::vector<uint8_t>& data) const {
    IntegrityResult result;

    auto hash = compute_sha256(data);
    if (!hash.ok) {
        result.errors.push_back("Tampering detection failed: " + hash.error);
        return result;
    }

    if (hash.hex_digest != to_lower(manifest.checksum)) {
        result.errors.push_back("Pack data has been modified since installation");

        if (data.empty()) {
            result.errors.push_back("Pack file is empty or corrupted");
        } else if (data.size() < 1000) {
            result.errors.push_back("Pack file is unusually small - may be truncated");
        }
    }

    result.is_valid = result.errors.empty();
    return result;
}

} // namespace exampack
