#include "errors.hpp"

namespace Tether {
namespace Core {

const char* to_string(CloseReason reason) {
    switch (reason) {
        case CloseReason::ExplicitClose:
            return "Connection.close";
        case CloseReason::TargetDetached:
            return "Target.detachedFromTarget";
        case CloseReason::TransportClosed:
            return "Transport.closed";
        case CloseReason::TransportError:
            return "Transport.error";
    }
    return "unknown";
}

namespace {

std::string format_protocol_error(const std::string& method,
                                  const std::string& message,
                                  const std::string& data) {
    std::string text = "Protocol error (" + method + "): " + message;
    if (!data.empty())
        text += " " + data;
    return text;
}

}  // namespace

ProtocolError::ProtocolError(std::string method, int code, std::string message, std::string data)
    : std::runtime_error(format_protocol_error(method, message, data)),
      method_(std::move(method)),
      code_(code),
      message_(std::move(message)),
      data_(std::move(data)) {
}

TargetClosedError::TargetClosedError(const std::string& what, CloseReason reason)
    : std::runtime_error(what), reason_(reason) {
}

TargetClosedError TargetClosedError::for_command(const std::string& method, CloseReason reason) {
    return TargetClosedError("Protocol error (" + method + "): Target closed. ("
                                 + to_string(reason) + ")",
                             reason);
}

TargetClosedError TargetClosedError::for_wait(const std::string& what, CloseReason reason) {
    return TargetClosedError(what + " failed: Target closed. (" + to_string(reason) + ")", reason);
}

TimeoutError::TimeoutError(const std::string& what, std::chrono::milliseconds timeout)
    : std::runtime_error(what + ": Timeout of " + std::to_string(timeout.count())
                         + " ms exceeded"),
      timeout_(timeout) {
}

TransportFault::TransportFault(const std::string& what, CloseReason reason)
    : std::runtime_error(what), reason_(reason) {
}

}  // namespace Core
}  // namespace Tether
