/*
 * mediadl/src/downloader/integrity_verifier.cpp
 *
 * Streaming digest over the received body (OpenSSL EVP).
 * - reset() selects SHA-256 or SHA-512 and starts a fresh context.
 * - update() feeds byte spans in arrival order.
 * - finalize() returns { algo, lower-case hex } and re-arms the same algorithm.
 *
 * Dependencies: OpenSSL::Crypto
 */

#include <mediadl/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <openssl/evp.h>

#include <span>
#include <cstddef>
#include <memory>
#include <string>

namespace mediadl::downloader {

namespace {

struct MdCtxFree {
    void operator()(EVP_MD_CTX* c) const noexcept { EVP_MD_CTX_free(c); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;

const char* algo_name(HashAlgo algo) {
    return algo == HashAlgo::Sha512 ? "sha512" : "sha256";
}

std::string hex_digest(std::span<const unsigned char> digest) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest.size() * 2);
    for (unsigned char b : digest) {
        hex.push_back(kDigits[b >> 4]);
        hex.push_back(kDigits[b & 0x0F]);
    }
    return hex;
}

class EvpIntegrityVerifier final : public IIntegrityVerifier {
public:
    EvpIntegrityVerifier() : ctx_(EVP_MD_CTX_new()) { reset(HashAlgo::Sha256); }

    void reset(HashAlgo algo) override {
        algo_ = algo;
        armed_ = false;
        if (!ctx_) {
            spdlog::error("Digest context allocation failed; checksums will not match");
            return;
        }
        const EVP_MD* md = algo == HashAlgo::Sha512 ? EVP_sha512() : EVP_sha256();
        armed_ = EVP_DigestInit_ex(ctx_.get(), md, nullptr) == 1;
        if (!armed_)
            spdlog::error("Failed to start {} digest", algo_name(algo));
    }

    void update(std::span<const std::byte> data) override {
        if (armed_ && !data.empty())
            armed_ = EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) == 1;
    }

    // An empty hex never equals an expected checksum
    Checksum finalize() override {
        Checksum result{algo_, {}};
        if (armed_) {
            unsigned char digest[EVP_MAX_MD_SIZE];
            unsigned int n = 0;
            if (EVP_DigestFinal_ex(ctx_.get(), digest, &n) == 1)
                result.hex = hex_digest({digest, n});
        }
        reset(algo_);
        return result;
    }

private:
    MdCtxPtr ctx_;
    HashAlgo algo_{HashAlgo::Sha256};
    bool armed_{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier() {
    return std::make_unique<EvpIntegrityVerifier>();
}

} // namespace mediadl::downloader
