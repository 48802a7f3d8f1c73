#include "sectrust/messages/src_authority.hpp"
#include "sectrust/messages/plain_message.hpp"
#include "sectrust/core/constants.hpp"
#include "sectrust/core/logging.hpp"
#include "sectrust/core/overloaded.hpp"
#include "sectrust/crypto/sodium_interop.hpp"
#include <exception>

namespace sectrust::routing {

    namespace {
        Result<Unit, RoutingFailure> CheckNode(
            const NodeAuthority& node,
            const std::span<const uint8_t> signed_bytes) {
            if (!node.public_id.Verify(signed_bytes, node.signature)) {
                return Result<Unit, RoutingFailure>::Err(
                    RoutingFailure::FailedSignature(std::string(ErrorMessages::NODE_SIGNATURE_MISMATCH)));
            }
            return Result<Unit, RoutingFailure>::Ok(unit);
        }

        Result<Unit, RoutingFailure> CheckSection(
            const SectionAuthority& section,
            const std::span<const uint8_t> signed_bytes) {
            const auto& last_key = section.proof.LastKey();
            if (!crypto::SodiumInterop::ConstantTimeEquals(section.signature.ClaimedKey(), last_key.Digest())) {
                return Result<Unit, RoutingFailure>::Err(
                    RoutingFailure::FailedSignature(std::string(ErrorMessages::SIGNING_KEY_NOT_LAST_KEY)));
            }
            if (!last_key.Verify(signed_bytes, section.signature)) {
                return Result<Unit, RoutingFailure>::Err(
                    RoutingFailure::FailedSignature(std::string(ErrorMessages::SECTION_SIGNATURE_MISMATCH)));
            }
            return Result<Unit, RoutingFailure>::Ok(unit);
        }
    }

    std::string SrcAuthority::SrcLocation() const {
        return std::visit(Overloaded{
            [](const NodeAuthority& node) { return "node " + node.public_id.ToString(); },
            [](const SectionAuthority& section) { return "section (" + section.prefix.ToString() + ")"; }
        }, kind_);
    }

    Result<Unit, RoutingFailure> SrcAuthority::CheckSignature(const std::span<const uint8_t> signed_bytes) const {
        if (const auto* node = std::get_if<NodeAuthority>(&kind_)) {
            return CheckNode(*node, signed_bytes);
        }
        return CheckSection(std::get<SectionAuthority>(kind_), signed_bytes);
    }

    Result<VerifyStatus, RoutingFailure> SrcAuthority::Verify(
        const DstLocation& dst,
        const std::optional<SectionPublicKey>& dst_key,
        const Variant& variant,
        const std::span<const TrustedKey> trusted) const {
        try {
            auto signed_bytes = SerializeForSigning(dst, dst_key, variant);
            if (signed_bytes.IsErr()) {
                SECTRUST_LOG_ERROR("Cannot compute signing bytes for message from {}: {}",
                                   SrcLocation(), signed_bytes.UnwrapErr().message);
                return Result<VerifyStatus, RoutingFailure>::Err(
                    RoutingFailure::FailedSignature(signed_bytes.UnwrapErr().message));
            }

            auto signature = CheckSignature(signed_bytes.Unwrap());
            if (signature.IsErr()) {
                return Result<VerifyStatus, RoutingFailure>::Err(std::move(signature).UnwrapErr());
            }

            const auto* section = std::get_if<SectionAuthority>(&kind_);
            if (section == nullptr) {
                return Result<VerifyStatus, RoutingFailure>::Ok(VerifyStatus::Full);
            }

            switch (section->proof.CheckTrust(trusted, section->prefix)) {
                case TrustStatus::Trusted:
                    return Result<VerifyStatus, RoutingFailure>::Ok(VerifyStatus::Full);
                case TrustStatus::Unknown:
                    SECTRUST_LOG_DEBUG("Proof chain of {} ({} keys) reaches no trusted key",
                                       SrcLocation(), section->proof.Length());
                    return Result<VerifyStatus, RoutingFailure>::Ok(VerifyStatus::Unknown);
                case TrustStatus::Invalid:
                    break;
            }
            return Result<VerifyStatus, RoutingFailure>::Err(
                RoutingFailure::FailedSignature(std::string(ErrorMessages::BROKEN_PROOF_CHAIN)));
        } catch (const std::exception& ex) {
            SECTRUST_LOG_ERROR("Verification of message from {} raised: {}", SrcLocation(), ex.what());
            return Result<VerifyStatus, RoutingFailure>::Err(
                RoutingFailure::FailedSignature(ex.what()));
        }
    }

}
