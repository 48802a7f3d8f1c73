#pragma once
#include "sectrust/core/failures.hpp"
#include "sectrust/core/result.hpp"
#include "sectrust/interfaces/i_identity_provider.hpp"
#include "sectrust/messages/plain_message.hpp"
#include "sectrust/section/proof_chain.hpp"
#include "sectrust/section/section_key.hpp"

namespace sectrust::routing {

/**
 * @brief One elder's share of a section message.
 *
 * Carries the agreed content, the proof chain the elder holds for its
 * section and the elder's signature over the content's signing bytes.
 */
class AccumulatingMessage {
public:
    AccumulatingMessage(PlainMessage content, ProofChain proof, SignatureShare share);

    /// Sign `content` as `elder`.
    [[nodiscard]] static Result<AccumulatingMessage, RoutingFailure> Sign(
        PlainMessage content,
        ProofChain proof,
        const interfaces::IIdentityProvider& elder);

    [[nodiscard]] const PlainMessage& Content() const noexcept { return content_; }
    [[nodiscard]] const ProofChain& Proof() const noexcept { return proof_; }
    [[nodiscard]] const SignatureShare& Share() const noexcept { return share_; }

    bool operator==(const AccumulatingMessage&) const = default;

private:
    PlainMessage content_;
    ProofChain proof_;
    SignatureShare share_;
};

}
