#pragma once
#include <string>
#include <string_view>
namespace sectrust {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class RoutingFailureType {
    Serialize,
    Deserialize,
    FailedSignature,
    InvalidProof,
    UntrustedMessage,
    ShareRejected,
    AlreadyFinalized,
    QuorumNotReached,
    InvalidInput,
    KeyGeneration,
    InvalidState,
    CryptoInit
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class RoutingFailure {
public:
    RoutingFailureType type;
    std::string message;
    RoutingFailure(const RoutingFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static RoutingFailure Serialize(std::string msg) {
        return {RoutingFailureType::Serialize, std::move(msg)};
    }
    static RoutingFailure Deserialize(std::string msg) {
        return {RoutingFailureType::Deserialize, std::move(msg)};
    }
    static RoutingFailure FailedSignature(std::string msg) {
        return {RoutingFailureType::FailedSignature, std::move(msg)};
    }
    static RoutingFailure InvalidProof(std::string msg) {
        return {RoutingFailureType::InvalidProof, std::move(msg)};
    }
    static RoutingFailure UntrustedMessage(std::string msg) {
        return {RoutingFailureType::UntrustedMessage, std::move(msg)};
    }
    static RoutingFailure ShareRejected(std::string msg) {
        return {RoutingFailureType::ShareRejected, std::move(msg)};
    }
    static RoutingFailure AlreadyFinalized(std::string msg) {
        return {RoutingFailureType::AlreadyFinalized, std::move(msg)};
    }
    static RoutingFailure QuorumNotReached(std::string msg) {
        return {RoutingFailureType::QuorumNotReached, std::move(msg)};
    }
    static RoutingFailure InvalidInput(std::string msg) {
        return {RoutingFailureType::InvalidInput, std::move(msg)};
    }
    static RoutingFailure KeyGeneration(std::string msg) {
        return {RoutingFailureType::KeyGeneration, std::move(msg)};
    }
    static RoutingFailure InvalidState(std::string msg) {
        return {RoutingFailureType::InvalidState, std::move(msg)};
    }
    static RoutingFailure CryptoInit(std::string msg) {
        return {RoutingFailureType::CryptoInit, std::move(msg)};
    }
    static RoutingFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return CryptoInit(sf.message);
        }
        return InvalidState(sf.message);
    }
    [[nodiscard]] bool IsAuthenticityFailure() const noexcept {
        return type == RoutingFailureType::FailedSignature ||
               type == RoutingFailureType::InvalidProof;
    }
};
[[nodiscard]] std::string_view ToString(RoutingFailureType type) noexcept;
}
