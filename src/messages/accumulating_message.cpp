#include "sectrust/messages/accumulating_message.hpp"
#include "sectrust/core/logging.hpp"

namespace sectrust::routing {

AccumulatingMessage::AccumulatingMessage(PlainMessage content, ProofChain proof, SignatureShare share)
    : content_(std::move(content))
      , proof_(std::move(proof))
      , share_(std::move(share)) {
}

Result<AccumulatingMessage, RoutingFailure> AccumulatingMessage::Sign(
    PlainMessage content,
    ProofChain proof,
    const interfaces::IIdentityProvider& elder) {
    const auto& signer = elder.GetPublicId();
    if (!proof.LastKey().Contains(signer)) {
        return Result<AccumulatingMessage, RoutingFailure>::Err(
            RoutingFailure::InvalidInput(
                "Signer " + signer.ToString() + " is not an elder of " + proof.LastKey().ToString()));
    }

    auto bytes = content.SigningBytes();
    if (bytes.IsErr()) {
        return Result<AccumulatingMessage, RoutingFailure>::Err(std::move(bytes).UnwrapErr());
    }
    auto share = SignShare(elder, bytes.Unwrap());
    if (share.IsErr()) {
        return Result<AccumulatingMessage, RoutingFailure>::Err(std::move(share).UnwrapErr());
    }

    SECTRUST_LOG_TRACE("Elder {} signed {} for {}",
                       signer.ToString(), content.variant.Name(), content.dst.ToString());
    return Result<AccumulatingMessage, RoutingFailure>::Ok(AccumulatingMessage(
        std::move(content), std::move(proof), std::move(share).Unwrap()));
}

}
