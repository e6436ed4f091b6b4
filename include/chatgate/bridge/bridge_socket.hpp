/*
 * chatgate - Bridge socket
 *
 * Production SessionSocket. The platform protocol is spoken by a local
 * bridge process; this socket drives it over HTTP:
 *
 *   POST /sessions/<id>/start     {"credentialsDir": "..."}
 *   POST /sessions/<id>/send      message json -> {"success", "message_id", "error"}
 *   POST /sessions/<id>/logout
 *   POST /sessions/<id>/pair      {"phone"} -> {"success", "code", "error"}
 *   GET  /sessions/<id>/qr.png    current challenge as PNG
 *   GET  /sessions/<id>/events    {"events": [{"kind": "connection"|"qr"|"message"|"status", ...}]}
 */
#ifndef CHATGATE_BRIDGE_BRIDGE_SOCKET_HPP
#define CHATGATE_BRIDGE_BRIDGE_SOCKET_HPP

#include <chatgate/session/socket.hpp>
#include <chatgate/core/http_client.hpp>

#include <string>
#include <mutex>
#include <memory>

namespace chatgate {

class BridgeSocket : public SessionSocket {
public:
    BridgeSocket(const std::string& bridge_url, const std::string& session_id,
                 const std::string& credentials_dir, std::shared_ptr<SocketListener> listener,
                 long timeout_ms = 10000);
    ~BridgeSocket();

    bool open() override;
    SendResult send(const Json& message) override;
    bool logout() override;
    bool request_pairing_code(const std::string& phone, std::string& code,
                              std::string& error) override;
    bool qr_image(std::string& png, std::string& error) override;
    void poll() override;
    void close() override;

    // Turns one bridge event into a listener callback. False for unknown kinds.
    static bool dispatch_event(const Json& event, SocketListener& listener);

private:
    std::string endpoint(const std::string& action) const;

    std::string base_url_;
    std::string session_id_;
    std::string credentials_dir_;
    std::shared_ptr<SocketListener> listener_;

    std::mutex http_mutex_;
    HttpClient http_;
    bool closed_;
};

class BridgeSocketFactory : public SocketFactory {
public:
    explicit BridgeSocketFactory(const std::string& bridge_url, long timeout_ms = 10000)
        : bridge_url_(bridge_url), timeout_ms_(timeout_ms) {}

    std::unique_ptr<SessionSocket> create(const std::string& session_id,
                                          const std::string& credentials_dir,
                                          std::shared_ptr<SocketListener> listener) override;

private:
    std::string bridge_url_;
    long timeout_ms_;
};

} // namespace chatgate

#endif // CHATGATE_BRIDGE_BRIDGE_SOCKET_HPP
