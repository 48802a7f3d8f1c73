#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
namespace sectrust {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SEED_SIZE = 32;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t XOR_NAME_SIZE = 32;
    static constexpr size_t XOR_NAME_BITS = XOR_NAME_SIZE * 8;
    static constexpr size_t SHA3_256_DIGEST_SIZE = 32;
    static constexpr size_t MESSAGE_HASH_SIZE = SHA3_256_DIGEST_SIZE;
    static constexpr size_t KEY_DIGEST_SIZE = SHA3_256_DIGEST_SIZE;
    static constexpr size_t LOG_KEY_PREFIX_BYTES = 4;
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
};
struct RoutingConstants {
    static constexpr size_t DEFAULT_ELDER_SIZE = 7;
    static constexpr size_t MIN_ELDER_SIZE = 1;
    static constexpr size_t MAX_ELDER_SIZE = 255;
    static constexpr size_t DEFAULT_MAX_MESSAGE_SIZE = 10 * 1024 * 1024;
    /// Protobuf parses at most INT_MAX bytes in one call.
    static constexpr size_t MAX_MESSAGE_SIZE_LIMIT = static_cast<size_t>(std::numeric_limits<int>::max());
    static constexpr size_t DEFAULT_MAX_PROOF_CHAIN_LENGTH = 1024;
    static constexpr std::string_view SECTION_KEY_DOMAIN = "sectrust-section-key-v1";
    static constexpr std::string_view SECTION_SHARE_DOMAIN = "sectrust-section-share-v1";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view NODE_SIGNATURE_MISMATCH = "Node signature does not match the signed content";
    static constexpr std::string_view SECTION_SIGNATURE_MISMATCH = "Section signature does not match the proof chain's last key";
    static constexpr std::string_view SIGNING_KEY_NOT_LAST_KEY = "Signature claims a key other than the proof chain's last key";
    static constexpr std::string_view BROKEN_PROOF_CHAIN = "Proof chain contains a link not signed by its predecessor";
    static constexpr std::string_view NON_CANONICAL_ENCODING = "Wire bytes are not the canonical encoding of the message";
    static constexpr std::string_view PARSE_PROTOBUF_FAILED = "Failed to parse message from protobuf";
    static constexpr std::string_view SERIALIZE_PROTOBUF_FAILED = "Failed to serialize message to protobuf";
};
}
