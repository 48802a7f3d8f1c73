#include "sectrust/crypto/sha3.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <string>

namespace sectrust::crypto {

namespace {
    struct MdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const noexcept {
            EVP_MD_CTX_free(ctx);
        }
    };

    std::string LastOpenSslError() {
        char buffer[256] = {};
        ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
        return buffer;
    }
}

Result<Sha3Digest, RoutingFailure> Sha3::Digest256(
    const std::initializer_list<std::span<const uint8_t>> parts) {
    const std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<Sha3Digest, RoutingFailure>::Err(
            RoutingFailure::InvalidState("Failed to allocate digest context"));
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != OpenSSLConstants::SUCCESS) {
        return Result<Sha3Digest, RoutingFailure>::Err(
            RoutingFailure::InvalidState("SHA3-256 init failed: " + LastOpenSslError()));
    }
    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != OpenSSLConstants::SUCCESS) {
            return Result<Sha3Digest, RoutingFailure>::Err(
                RoutingFailure::InvalidState("SHA3-256 update failed: " + LastOpenSslError()));
        }
    }
    Sha3Digest digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != OpenSSLConstants::SUCCESS ||
        digest_len != digest.size()) {
        return Result<Sha3Digest, RoutingFailure>::Err(
            RoutingFailure::InvalidState("SHA3-256 final failed: " + LastOpenSslError()));
    }
    return Result<Sha3Digest, RoutingFailure>::Ok(digest);
}

Result<Sha3Digest, RoutingFailure> Sha3::Digest256(const std::span<const uint8_t> data) {
    return Digest256({data});
}

}
