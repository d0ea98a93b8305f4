#pragma once
#include <chrono>
#include <stdexcept>
#include <string>

namespace Tether {
namespace Core {

enum class CloseReason { ExplicitClose, TargetDetached, TransportClosed, TransportError };

// Protocol-flavoured name of a close reason, e.g. "Target.detachedFromTarget".
const char* to_string(CloseReason reason);

// Remote end answered a command with an error payload.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(std::string method, int code, std::string message, std::string data = "");

    const std::string& method() const {
        return method_;
    }
    int code() const {
        return code_;
    }
    const std::string& remote_message() const {
        return message_;
    }
    const std::string& data() const {
        return data_;
    }

private:
    std::string method_;
    int         code_;
    std::string message_;
    std::string data_;
};

// A command or wait was cut short because its session or connection closed.
class TargetClosedError : public std::runtime_error {
public:
    TargetClosedError(const std::string& what, CloseReason reason);

    static TargetClosedError for_command(const std::string& method, CloseReason reason);
    static TargetClosedError for_wait(const std::string& what, CloseReason reason);

    CloseReason reason() const {
        return reason_;
    }
    std::string close_reason() const {
        return to_string(reason_);
    }

private:
    CloseReason reason_;
};

class TimeoutError : public std::runtime_error {
public:
    TimeoutError(const std::string& what, std::chrono::milliseconds timeout);

    std::chrono::milliseconds timeout() const {
        return timeout_;
    }

private:
    std::chrono::milliseconds timeout_;
};

// Raised by transports; the connection turns it into a close cascade.
class TransportFault : public std::runtime_error {
public:
    TransportFault(const std::string& what, CloseReason reason);

    CloseReason reason() const {
        return reason_;
    }

private:
    CloseReason reason_;
};

class MalformedFrame : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace Core
}  // namespace Tether
