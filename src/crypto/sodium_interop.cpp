#include "sectrust/crypto/sodium_interop.hpp"

namespace sectrust::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

bool SodiumInterop::ConstantTimeEquals(
    const std::span<const uint8_t> a,
    const std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS;
}

void SodiumInterop::SecureWipe(const std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

Result<std::pair<SecureMemoryHandle, Ed25519PublicKey>, RoutingFailure>
SodiumInterop::GenerateEd25519KeyPair(const std::span<const uint8_t> seed) {
    using ResultType = Result<std::pair<SecureMemoryHandle, Ed25519PublicKey>, RoutingFailure>;

    if (auto init = Initialize(); init.IsErr()) {
        return ResultType::Err(RoutingFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    if (!seed.empty() && seed.size() != Constants::ED_25519_SEED_SIZE) {
        return ResultType::Err(RoutingFailure::InvalidInput(
            "Ed25519 seed must be " + std::to_string(Constants::ED_25519_SEED_SIZE) + " bytes"));
    }

    Ed25519PublicKey public_key{};
    std::array<uint8_t, Constants::ED_25519_SECRET_KEY_SIZE> secret_key{};
    const int rc = seed.empty()
        ? crypto_sign_keypair(public_key.data(), secret_key.data())
        : crypto_sign_seed_keypair(public_key.data(), secret_key.data(), seed.data());
    if (rc != SodiumConstants::SUCCESS) {
        SecureWipe(secret_key);
        return ResultType::Err(RoutingFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }

    auto handle_result = SecureMemoryHandle::Allocate(secret_key.size());
    if (handle_result.IsErr()) {
        SecureWipe(secret_key);
        return ResultType::Err(RoutingFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto handle = std::move(handle_result).Unwrap();
    auto write_result = handle.Write(secret_key);
    SecureWipe(secret_key);
    if (write_result.IsErr()) {
        return ResultType::Err(RoutingFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return ResultType::Ok(std::make_pair(std::move(handle), public_key));
}

Result<Ed25519Signature, RoutingFailure> SodiumInterop::SignDetached(
    const SecureMemoryHandle& secret_key,
    const std::span<const uint8_t> message) {
    if (secret_key.Size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<Ed25519Signature, RoutingFailure>::Err(
            RoutingFailure::InvalidState("Secret key handle has the wrong size for Ed25519"));
    }

    Ed25519Signature signature{};
    auto sign_result = secret_key.WithReadAccess([&](const std::span<const uint8_t> sk) {
        unsigned long long sig_len = 0;
        const int rc = crypto_sign_detached(
            signature.data(),
            &sig_len,
            message.data(),
            message.size(),
            sk.data());
        return rc == SodiumConstants::SUCCESS && sig_len == signature.size();
    });
    if (sign_result.IsErr()) {
        return Result<Ed25519Signature, RoutingFailure>::Err(
            RoutingFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    if (!sign_result.Unwrap()) {
        return Result<Ed25519Signature, RoutingFailure>::Err(
            RoutingFailure::InvalidState("Ed25519 signing failed"));
    }
    return Result<Ed25519Signature, RoutingFailure>::Ok(signature);
}

bool SodiumInterop::VerifyDetached(
    const Ed25519PublicKey& public_key,
    const std::span<const uint8_t> message,
    const Ed25519Signature& signature) {
    if (Initialize().IsErr()) {
        return false;
    }
    return crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()) == SodiumConstants::SUCCESS;
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace sectrust::crypto
