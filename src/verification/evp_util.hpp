#pragma once

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace exampack {
namespace detail {

// RAII owners for the OpenSSL EVP handles used by hashing and signing

class EvpPkey {
public:
    explicit EvpPkey(EVP_PKEY* key = nullptr) : key_(key) {}
    ~EvpPkey() { if (key_) EVP_PKEY_free(key_); }

    EvpPkey(const EvpPkey&) = delete;
    EvpPkey& operator=(const EvpPkey&) = delete;

    EVP_PKEY* get() { return key_; }
    EVP_PKEY** out() { return &key_; }
    explicit operator bool() const { return key_ != nullptr; }

private:
    EVP_PKEY* key_;
};

class EvpPkeyCtx {
public:
    explicit EvpPkeyCtx(EVP_PKEY_CTX* ctx) : ctx_(ctx) {}
    ~EvpPkeyCtx() { if (ctx_) EVP_PKEY_CTX_free(ctx_); }

    EvpPkeyCtx(const EvpPkeyCtx&) = delete;
    EvpPkeyCtx& operator=(const EvpPkeyCtx&) = delete;

    EVP_PKEY_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_PKEY_CTX* ctx_;
};

class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace detail
} // namespace exampack
