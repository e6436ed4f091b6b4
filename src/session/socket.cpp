#include <chatgate/session/socket.hpp>

namespace chatgate {

Json InboundMessage::to_json() const {
    Json j = Json::object();
    j["id"] = id;
    j["from"] = from;
    j["chat"] = chat.empty() ? from : chat;
    j["pushName"] = push_name.empty() ? Json() : Json(push_name);
    j["type"] = type.empty() ? std::string("text") : type;
    j["text"] = text;
    j["timestamp"] = timestamp;
    j["fromMe"] = from_me;
    if (!raw.is_null()) {
        j["raw"] = raw;
    }
    return j;
}

} // namespace chatgate
