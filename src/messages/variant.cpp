#include "sectrust/messages/variant.hpp"
#include "sectrust/messages/accumulating_message.hpp"
#include "sectrust/core/overloaded.hpp"

namespace sectrust::routing {

bool MessageSignature::operator==(const MessageSignature& other) const {
    if (message == other.message) {
        return true;
    }
    if (!message || !other.message) {
        return false;
    }
    return *message == *other.message;
}

std::string_view Variant::Name() const noexcept {
    return std::visit(Overloaded{
        [](const UserMessage&) -> std::string_view { return "UserMessage"; },
        [](const Ping&) -> std::string_view { return "Ping"; },
        [](const BootstrapRequest&) -> std::string_view { return "BootstrapRequest"; },
        [](const BootstrapResponse&) -> std::string_view { return "BootstrapResponse"; },
        [](const JoinRequest&) -> std::string_view { return "JoinRequest"; },
        [](const MessageSignature&) -> std::string_view { return "MessageSignature"; },
        [](const BouncedUntrustedMessage&) -> std::string_view { return "BouncedUntrustedMessage"; }
    }, kind_);
}

}
