/*
 * chatgate - Chat platform socket seam
 *
 * A SessionSocket is one connection of one session to the chat platform.
 * The gateway never speaks the platform protocol itself: the production
 * socket (BridgeSocket) drives a local bridge process, tests drive a
 * scripted fake. Sockets report what happens through a SocketListener,
 * possibly from inside open() or poll() on the calling thread.
 */
#ifndef CHATGATE_SESSION_SOCKET_HPP
#define CHATGATE_SESSION_SOCKET_HPP

#include <chatgate/core/types.hpp>
#include <chatgate/core/json.hpp>

#include <string>
#include <memory>
#include <cstdint>

namespace chatgate {

struct ConnectionUpdate {
    ConnectionState state;      // CONNECTING, OPEN or CLOSE
    int status_code;            // platform disconnect code, 0 if none
    std::string reason;
    bool logged_out;
    std::string phone_number;   // account number once open, when known

    ConnectionUpdate()
        : state(ConnectionState::CONNECTING), status_code(0), logged_out(false) {}
};

struct InboundMessage {
    std::string id;
    std::string from;           // sender JID
    std::string chat;           // chat JID, equals from for direct chats
    std::string push_name;
    std::string type;           // text, image, buttons_reply, list_reply, poll_vote, ...
    std::string text;
    int64_t timestamp;
    bool from_me;
    Json raw;

    InboundMessage() : timestamp(0), from_me(false) {}

    Json to_json() const;
};

struct StatusUpdate {
    std::string message_id;
    int status;                 // 0..5

    StatusUpdate() : status(-1) {}
    StatusUpdate(const std::string& id, int s) : message_id(id), status(s) {}
};

class SocketListener {
public:
    virtual ~SocketListener() {}

    virtual void on_connection(const ConnectionUpdate& update) = 0;

    // A pairing challenge to render as a QR code
    virtual void on_qr(const std::string& challenge) = 0;

    virtual void on_message(const InboundMessage& message) = 0;
    virtual void on_status(const StatusUpdate& update) = 0;
};

class SessionSocket {
public:
    virtual ~SessionSocket() {}

    // Starts connecting. False when the attempt could not even begin; the
    // owner treats that as an unexpected close.
    virtual bool open() = 0;

    // message: {"to": jid, "type": "text"|"buttons"|"list"|"media"|"poll", ...}
    virtual SendResult send(const Json& message) = 0;

    // Invalidates the platform credentials of this session
    virtual bool logout() = 0;

    virtual bool request_pairing_code(const std::string& phone, std::string& code,
                                      std::string& error) = 0;

    // Current pairing challenge rendered as PNG
    virtual bool qr_image(std::string& png, std::string& error) = 0;

    // Pulls pending events and reports them to the listener
    virtual void poll() = 0;

    virtual void close() = 0;
};

class SocketFactory {
public:
    virtual ~SocketFactory() {}

    virtual std::unique_ptr<SessionSocket> create(const std::string& session_id,
                                                  const std::string& credentials_dir,
                                                  std::shared_ptr<SocketListener> listener) = 0;
};

} // namespace chatgate

#endif // CHATGATE_SESSION_SOCKET_HPP
