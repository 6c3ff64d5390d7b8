#include "link/actuator.hpp"

namespace durin {

Actuator::Actuator(TcpLink& link, std::chrono::milliseconds default_timeout)
    : link_(link), default_timeout_(default_timeout) {}

std::optional<Reply> Actuator::operator()(const Command& command) {
    return (*this)(command, default_timeout_);
}

std::optional<Reply> Actuator::operator()(const Command& command, std::chrono::milliseconds timeout) {
    const Bytes encoded = encodeCommand(command);
    if (isNoopEncoding(encoded)) {
        return Reply{};
    }
    (void)link_.send(encoded, timeout);
    return std::nullopt;
}

}  // namespace durin
