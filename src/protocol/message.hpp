#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace Tether {
namespace Protocol {

struct Command {
    std::uint64_t  id = 0;
    std::string    method;
    nlohmann::json params = nlohmann::json::object();
    std::string    session_id;
};

struct ErrorPayload {
    int         code = 0;
    std::string message;
    std::string data;
};

struct Event {
    std::string    session_id;
    std::string    method;
    nlohmann::json params = nlohmann::json::object();
};

enum class MessageKind { Response, Event };

struct Message {
    MessageKind                 kind = MessageKind::Event;
    std::uint64_t               id   = 0;
    std::string                 session_id;
    std::string                 method;
    nlohmann::json              params = nlohmann::json::object();
    nlohmann::json              result = nlohmann::json::object();
    std::optional<ErrorPayload> error;

    bool is_response() const {
        return kind == MessageKind::Response;
    }
    Event to_event() const;
};

std::string serialize(const Command& command);

// Throws Core::MalformedFrame when the text is not a protocol message.
Message parse(std::string_view frame);

}  // namespace Protocol
}  // namespace Tether
