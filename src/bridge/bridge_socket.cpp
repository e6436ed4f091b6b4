#include <chatgate/bridge/bridge_socket.hpp>
#include <chatgate/core/logger.hpp>
#include <chatgate/core/utils.hpp>

namespace chatgate {

namespace {

ConnectionState parse_bridge_state(const std::string& s) {
    if (s == "open") return ConnectionState::OPEN;
    if (s == "close" || s == "closed") return ConnectionState::CLOSE;
    return ConnectionState::CONNECTING;
}

std::string bridge_error(const HttpResponse& resp) {
    if (!resp.error.empty()) return resp.error;
    Json body = resp.json();
    std::string err = body.value("error", std::string(""));
    if (!err.empty()) return err;
    return "HTTP " + std::to_string(resp.status_code);
}

} // anonymous namespace

BridgeSocket::BridgeSocket(const std::string& bridge_url, const std::string& session_id,
                           const std::string& credentials_dir,
                           std::shared_ptr<SocketListener> listener, long timeout_ms)
    : base_url_(rtrim(bridge_url))
    , session_id_(session_id)
    , credentials_dir_(credentials_dir)
    , listener_(listener)
    , closed_(false) {
    while (!base_url_.empty() && base_url_[base_url_.size() - 1] == '/') {
        base_url_.erase(base_url_.size() - 1);
    }
    http_.set_timeout(timeout_ms);
}

BridgeSocket::~BridgeSocket() {}

std::string BridgeSocket::endpoint(const std::string& action) const {
    return base_url_ + "/sessions/" + HttpClient::url_encode(session_id_) + "/" + action;
}

bool BridgeSocket::open() {
    Json body = Json::object();
    body["credentialsDir"] = credentials_dir_;

    HttpResponse resp;
    {
        std::lock_guard<std::mutex> lock(http_mutex_);
        closed_ = false;
        resp = http_.post_json(endpoint("start"), body);
    }
    if (!resp.ok()) {
        LOG_WARN("bridge.start.failed id=%s error=%s", session_id_.c_str(),
                 bridge_error(resp).c_str());
        return false;
    }
    LOG_DEBUG("bridge.started id=%s", session_id_.c_str());
    return true;
}

SendResult BridgeSocket::send(const Json& message) {
    HttpResponse resp;
    {
        std::lock_guard<std::mutex> lock(http_mutex_);
        if (closed_) return SendResult::fail("socket closed");
        resp = http_.post_json(endpoint("send"), message);
    }

    if (!resp.ok()) {
        return SendResult::fail("HTTP error: " + bridge_error(resp));
    }

    Json result = resp.json();
    if (!result.value("success", false)) {
        return SendResult::fail("Bridge error: " + result.value("error", std::string("unknown error")));
    }

    std::string msg_id = result.value("message_id", std::string(""));
    LOG_DEBUG("bridge.sent id=%s to=%s message=%s", session_id_.c_str(),
              message.value("to", std::string("")).c_str(), msg_id.c_str());
    return SendResult::ok(msg_id);
}

bool BridgeSocket::logout() {
    HttpResponse resp;
    {
        std::lock_guard<std::mutex> lock(http_mutex_);
        resp = http_.post_json(endpoint("logout"), Json::object());
    }
    if (!resp.ok()) {
        LOG_WARN("bridge.logout.failed id=%s error=%s", session_id_.c_str(),
                 bridge_error(resp).c_str());
        return false;
    }
    return true;
}

bool BridgeSocket::request_pairing_code(const std::string& phone, std::string& code,
                                        std::string& error) {
    Json body = Json::object();
    body["phone"] = phone;

    HttpResponse resp;
    {
        std::lock_guard<std::mutex> lock(http_mutex_);
        resp = http_.post_json(endpoint("pair"), body);
    }
    if (!resp.ok()) {
        error = bridge_error(resp);
        return false;
    }

    Json result = resp.json();
    code = result.value("code", std::string(""));
    if (!result.value("success", false) || code.empty()) {
        error = result.value("error", std::string("no pairing code returned"));
        return false;
    }
    return true;
}

bool BridgeSocket::qr_image(std::string& png, std::string& error) {
    HttpResponse resp;
    {
        std::lock_guard<std::mutex> lock(http_mutex_);
        resp = http_.get(endpoint("qr.png"));
    }
    if (!resp.ok() || resp.body.empty()) {
        error = resp.ok() ? std::string("empty image") : bridge_error(resp);
        return false;
    }
    png = resp.body;
    return true;
}

void BridgeSocket::poll() {
    HttpResponse resp;
    {
        std::lock_guard<std::mutex> lock(http_mutex_);
        if (closed_) return;
        resp = http_.get(endpoint("events"));
    }
    if (!resp.ok()) {
        LOG_WARN("bridge.poll.failed id=%s error=%s", session_id_.c_str(),
                 bridge_error(resp).c_str());
        return;
    }

    Json result = resp.json();
    const Json& events = result["events"];
    if (!events.is_array()) return;

    const Json::Array& list = events.as_array();
    for (size_t i = 0; i < list.size(); ++i) {
        if (!dispatch_event(list[i], *listener_)) {
            LOG_DEBUG("bridge.event.ignored id=%s kind=%s", session_id_.c_str(),
                      list[i].value("kind", std::string("")).c_str());
        }
    }
}

void BridgeSocket::close() {
    std::lock_guard<std::mutex> lock(http_mutex_);
    closed_ = true;
}

bool BridgeSocket::dispatch_event(const Json& event, SocketListener& listener) {
    std::string kind = event.value("kind", std::string(""));

    if (kind == "connection") {
        ConnectionUpdate update;
        update.state = parse_bridge_state(event.value("state", std::string("")));
        update.status_code = event.value("statusCode", 0);
        update.reason = event.value("reason", std::string(""));
        update.logged_out = event.value("loggedOut", false);
        update.phone_number = event.value("phone", std::string(""));
        listener.on_connection(update);
        return true;
    }

    if (kind == "qr") {
        std::string challenge = event.value("qr", std::string(""));
        if (challenge.empty()) return false;
        listener.on_qr(challenge);
        return true;
    }

    if (kind == "message") {
        InboundMessage m;
        m.id = event.value("id", std::string(""));
        m.from = event.value("from", std::string(""));
        m.chat = event.value("chat", m.from);
        m.push_name = event.value("from_name", std::string(""));
        m.type = event.value("type", std::string("text"));
        m.text = event.value("text", std::string(""));
        m.timestamp = event.value("timestamp", int64_t(0));
        m.from_me = event.value("fromMe", false);
        m.raw = event["raw"];
        listener.on_message(m);
        return true;
    }

    if (kind == "status") {
        StatusUpdate update(event.value("id", std::string("")), event.value("status", -1));
        if (update.message_id.empty()) return false;
        listener.on_status(update);
        return true;
    }

    return false;
}

std::unique_ptr<SessionSocket> BridgeSocketFactory::create(const std::string& session_id,
                                                           const std::string& credentials_dir,
                                                           std::shared_ptr<SocketListener> listener) {
    return std::unique_ptr<SessionSocket>(
        new BridgeSocket(bridge_url_, session_id, credentials_dir, listener, timeout_ms_));
}

} // namespace chatgate
