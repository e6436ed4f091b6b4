#include <chatgate/gateway/requests.hpp>
#include <chatgate/core/utils.hpp>

#include <cstdlib>

namespace chatgate {

namespace {

// Accepts either spelling used by clients for the same field
std::string string_field(const Json& body, const char* key, const char* alt = nullptr) {
    if (body[key].is_string()) return body[key].as_string();
    if (alt && body[alt].is_string()) return body[alt].as_string();
    return "";
}

bool bool_field(const Json& body, const char* key, bool def) {
    const Json& v = body[key];
    if (v.is_bool()) return v.as_bool();
    if (v.is_string()) return parse_flag(v.as_string().c_str(), def);
    return def;
}

} // anonymous namespace

Json parse_body(const std::string& body) {
    if (trim(body).empty()) return Json::object();

    Json parsed;
    try {
        parsed = Json::parse(body);
    } catch (const JsonParseError& e) {
        throw GatewayError(ErrorKind::VALIDATION, "invalid_json", e.what());
    }
    if (!parsed.is_object()) {
        throw GatewayError(ErrorKind::VALIDATION, "invalid_json", "body must be a JSON object");
    }
    return parsed;
}

int64_t parse_wait_ack(const Json& body) {
    const Json& v = body["waitAckMs"];
    int64_t ms = 0;
    if (v.is_number()) {
        ms = v.as_int();
    } else if (v.is_string()) {
        ms = std::strtoll(v.as_string().c_str(), nullptr, 10);
    }
    if (ms < 0) return 0;
    return ms > WAIT_ACK_MAX_MS ? WAIT_ACK_MAX_MS : ms;
}

ButtonsMessage parse_buttons_message(const Json& body) {
    ButtonsMessage msg;
    msg.text = string_field(body, "text");
    msg.footer = string_field(body, "footer");

    const Json& buttons = body["buttons"];
    if (buttons.is_array()) {
        const Json::Array& arr = buttons.as_array();
        for (size_t i = 0; i < arr.size(); ++i) {
            ButtonSpec b;
            if (arr[i].is_string()) {
                b.title = arr[i].as_string();
                b.id = "btn_" + std::to_string(i + 1);
            } else {
                b.id = string_field(arr[i], "id");
                b.title = string_field(arr[i], "title", "text");
            }
            msg.buttons.push_back(b);
        }
    }
    return msg;
}

ListMessage parse_list_message(const Json& body) {
    ListMessage msg;
    msg.text = string_field(body, "text");
    msg.button_text = string_field(body, "buttonText");
    msg.title = string_field(body, "title");
    msg.footer = string_field(body, "footer");

    const Json& sections = body["sections"];
    if (sections.is_array()) {
        const Json::Array& arr = sections.as_array();
        for (size_t i = 0; i < arr.size(); ++i) {
            ListSection section;
            section.title = string_field(arr[i], "title");
            const Json& rows = arr[i]["rows"].is_array() ? arr[i]["rows"] : arr[i]["options"];
            if (rows.is_array()) {
                const Json::Array& items = rows.as_array();
                for (size_t k = 0; k < items.size(); ++k) {
                    ListOption opt;
                    opt.id = string_field(items[k], "id");
                    opt.title = string_field(items[k], "title");
                    opt.description = string_field(items[k], "description");
                    section.options.push_back(opt);
                }
            }
            msg.sections.push_back(section);
        }
    }
    return msg;
}

MediaMessage parse_media_message(const Json& body) {
    MediaMessage msg;
    msg.type = to_lower(string_field(body, "mediaType", "type"));
    msg.url = string_field(body, "url");
    msg.base64 = string_field(body, "base64");
    msg.caption = string_field(body, "caption");
    msg.mimetype = string_field(body, "mimetype", "mimeType");
    msg.file_name = string_field(body, "fileName");
    msg.ptt = bool_field(body, "ptt", false);
    msg.gif_playback = bool_field(body, "gifPlayback", false);
    return msg;
}

PollMessage parse_poll_message(const Json& body) {
    PollMessage msg;
    msg.question = string_field(body, "question", "name");

    const Json& options = body["options"];
    if (options.is_array()) {
        const Json::Array& arr = options.as_array();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (arr[i].is_string()) msg.options.push_back(arr[i].as_string());
        }
    }
    msg.selectable_count = body.value("selectableCount", 1);
    return msg;
}

PatchRequest parse_patch_request(const Json& body) {
    PatchRequest req;
    if (body.contains("name") && !body["name"].is_null()) {
        if (!body["name"].is_string()) {
            throw GatewayError(ErrorKind::VALIDATION, "name_invalid", "name must be a string");
        }
        req.has_name = true;
        req.name = body["name"].as_string();
    }
    if (body.contains("note") && !body["note"].is_null()) {
        if (!body["note"].is_string()) {
            throw GatewayError(ErrorKind::VALIDATION, "note_invalid", "note must be a string");
        }
        req.has_note = true;
        req.note = body["note"].as_string();
    }
    req.author = string_field(body, "author");
    return req;
}

bool parse_flag(const char* value, bool def) {
    if (!value) return def;
    std::string v = to_lower(trim(value));
    if (v.empty()) return def;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return true;
}

std::vector<std::string> parse_id_list(const Json& body) {
    std::vector<std::string> ids;
    const Json& list = body["ids"];
    if (list.is_array()) {
        const Json::Array& arr = list.as_array();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (arr[i].is_string() && !arr[i].as_string().empty()) {
                ids.push_back(arr[i].as_string());
            }
        }
    }
    if (ids.empty()) {
        throw GatewayError(ErrorKind::VALIDATION, "ids_required", "ids must be a non-empty array");
    }
    return ids;
}

int parse_limit(const char* value, int def) {
    if (!value || !*value) return def;
    long n = std::strtol(value, nullptr, 10);
    if (n < 1) return 1;
    return n > 200 ? 200 : static_cast<int>(n);
}

Json error_body(const std::string& code, const std::string& detail) {
    Json j = Json::object();
    j["error"] = code;
    j["detail"] = detail;
    return j;
}

bool api_key_allowed(const std::vector<std::string>& keys, const std::string& presented) {
    if (keys.empty()) return true;
    if (presented.empty()) return false;

    bool match = false;
    for (size_t i = 0; i < keys.size(); ++i) {
        // every key is compared so timing does not reveal which one matched
        if (constant_time_equals(keys[i], presented)) match = true;
    }
    return match;
}

} // namespace chatgate
