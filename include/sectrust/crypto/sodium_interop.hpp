#pragma once

#include "sectrust/core/result.hpp"
#include "sectrust/core/failures.hpp"
#include "sectrust/core/constants.hpp"
#include "sectrust/crypto/secure_memory_handle.hpp"

#include <sodium.h>
#include <array>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace sectrust::crypto {

using Ed25519PublicKey = std::array<uint8_t, Constants::ED_25519_PUBLIC_KEY_SIZE>;
using Ed25519Signature = std::array<uint8_t, Constants::ED_25519_SIGNATURE_SIZE>;

/**
 * @brief Interop layer for the libsodium operations the routing core needs.
 *
 * Ed25519 is the only signature scheme in use: node identities sign with it
 * directly and every elder signature share is an Ed25519 signature.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium.
     *
     * Thread-safe and idempotent. Every other operation requires it.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Constant-time comparison of two buffers.
     *
     * Buffers of different length compare unequal without touching content.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Generate an Ed25519 key pair.
     *
     * When a seed is given the pair is derived deterministically from it.
     * The secret key is returned in secure memory.
     */
    static Result<std::pair<SecureMemoryHandle, Ed25519PublicKey>, RoutingFailure>
    GenerateEd25519KeyPair(std::span<const uint8_t> seed = {});

    static Result<Ed25519Signature, RoutingFailure> SignDetached(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> message);

    /**
     * @brief Verify a detached Ed25519 signature.
     *
     * Initializes libsodium first, so receive-only callers need no setup.
     * False when initialization fails.
     */
    [[nodiscard]] static bool VerifyDetached(
        const Ed25519PublicKey& public_key,
        std::span<const uint8_t> message,
        const Ed25519Signature& signature);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
};

} // namespace sectrust::crypto
