#include "message.hpp"
#include "../core/errors/errors.hpp"

namespace Tether {
namespace Protocol {

using Core::MalformedFrame;

Event Message::to_event() const {
    return Event{session_id, method, params};
}

std::string serialize(const Command& command) {
    nlohmann::json j = {{"id", command.id}, {"method", command.method}};
    j["params"]      = command.params.is_null() ? nlohmann::json::object() : command.params;
    if (!command.session_id.empty())
        j["sessionId"] = command.session_id;
    return j.dump();
}

Message parse(std::string_view frame) {
    nlohmann::json j = nlohmann::json::parse(frame, nullptr, false);
    if (j.is_discarded())
        throw MalformedFrame("Frame is not valid JSON");
    if (!j.is_object())
        throw MalformedFrame("Frame is not a JSON object");

    Message msg;
    if (j.contains("sessionId")) {
        if (!j["sessionId"].is_string())
            throw MalformedFrame("sessionId must be a string");
        msg.session_id = j["sessionId"].get<std::string>();
    }

    if (j.contains("id")) {
        const auto& id = j["id"];
        if (!id.is_number_integer() || (!id.is_number_unsigned() && id.get<std::int64_t>() < 0))
            throw MalformedFrame("id must be a non-negative integer");
        msg.kind = MessageKind::Response;
        msg.id   = id.get<std::uint64_t>();

        if (j.contains("error")) {
            const auto&  err = j["error"];
            ErrorPayload payload;
            if (err.is_object()) {
                payload.code    = err.value("code", 0);
                payload.message = err.value("message", std::string());
                if (err.contains("data"))
                    payload.data = err["data"].is_string() ? err["data"].get<std::string>()
                                                           : err["data"].dump();
            }
            else {
                payload.message = err.dump();
            }
            msg.error = std::move(payload);
        }
        else if (j.contains("result")) {
            msg.result = j["result"];
        }
        return msg;
    }

    if (!j.contains("method") || !j["method"].is_string())
        throw MalformedFrame("Frame has neither id nor method");

    msg.kind   = MessageKind::Event;
    msg.method = j["method"].get<std::string>();
    if (j.contains("params") && !j["params"].is_null())
        msg.params = j["params"];
    return msg;
}

}  // namespace Protocol
}  // namespace Tether
