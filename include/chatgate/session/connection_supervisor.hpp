/*
 * chatgate - Per-session connection state machine
 *
 *   connecting --ready--> open --disconnect--> close --backoff--> connecting
 *   close is terminal when the platform reports a logout
 *   a QR challenge that expires unconsumed moves the session to qr_timeout
 *
 * Every start, stop and reconnect advances the generation. Socket callbacks
 * and timers remember the generation they were created under and are
 * ignored once it has moved on.
 */
#ifndef CHATGATE_SESSION_CONNECTION_SUPERVISOR_HPP
#define CHATGATE_SESSION_CONNECTION_SUPERVISOR_HPP

#include <chatgate/session/socket.hpp>
#include <chatgate/broker/event_broker.hpp>
#include <chatgate/core/scheduler.hpp>

#include <string>
#include <mutex>
#include <memory>
#include <functional>
#include <cstdint>

namespace chatgate {

struct ConnectionDetail {
    int status_code;
    std::string reason;
    bool logged_out;

    ConnectionDetail() : status_code(0), logged_out(false) {}
};

struct ConnectionSnapshot {
    ConnectionState state;
    bool stopping;
    uint64_t generation;
    int64_t current_delay_ms;
    std::string last_challenge;
    int qr_version;
    int64_t qr_expires_at;
    int pairing_attempts;
    std::string last_error;
    ConnectionDetail detail;
    int64_t updated_at;
    std::string phone_number;

    ConnectionSnapshot()
        : state(ConnectionState::CLOSE), stopping(true), generation(0), current_delay_ms(0)
        , qr_version(0), qr_expires_at(0), pairing_attempts(0), updated_at(0) {}

    Json to_json() const;
};

class ConnectionSupervisor : public std::enable_shared_from_this<ConnectionSupervisor> {
public:
    struct Options {
        int64_t reconnect_min_ms;
        int64_t reconnect_max_ms;
        int64_t qr_initial_ttl_ms;
        int64_t qr_subsequent_ttl_ms;

        Options()
            : reconnect_min_ms(1000)
            , reconnect_max_ms(30000)
            , qr_initial_ttl_ms(60000)
            , qr_subsequent_ttl_ms(20000) {}
    };

    typedef std::function<void(const InboundMessage&)> MessageHandler;
    typedef std::function<void(const StatusUpdate&)> StatusHandler;
    // Hands a task to another thread; false when it was not accepted
    typedef std::function<bool(const std::function<void()>&)> Executor;

    ConnectionSupervisor(const std::string& session_id, const std::string& credentials_dir,
                         SocketFactory& factory, Scheduler& scheduler, EventBroker& broker,
                         const Options& options = Options());
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    // Handlers run on the socket's thread, outside the supervisor lock
    void set_message_handler(const MessageHandler& handler);
    void set_status_handler(const StatusHandler& handler);

    // Reconnects run through the executor so that opening a socket never
    // holds up the scheduler thread. Without one they run on the timer.
    void set_executor(const Executor& executor);

    // Opens a fresh socket with the backoff reset
    void start();

    // Cancels reconnect and QR timers and closes the socket. With
    // logout, the platform credentials are invalidated first.
    void stop(bool logout = false);

    // Throws GatewayError(UNAVAILABLE, "socket_unavailable") unless open
    SendResult send(const Json& message);

    std::string request_pairing_code(const std::string& phone);
    std::string qr_image();

    // Drives socket event polling; a no-op without a socket
    void poll();

    ConnectionState state() const;
    bool is_open() const;
    uint64_t generation() const;
    ConnectionSnapshot snapshot() const;

    // Socket callbacks, routed here with the generation of their socket
    void handle_connection(uint64_t generation, const ConnectionUpdate& update);
    void handle_qr(uint64_t generation, const std::string& challenge);
    void handle_message(uint64_t generation, const InboundMessage& message);
    void handle_status(uint64_t generation, const StatusUpdate& update);

private:
    // expected_generation 0 connects unconditionally; otherwise the attempt
    // is dropped if the generation moved on or the supervisor stopped
    void connect(bool reset_backoff, uint64_t expected_generation = 0);
    void reconnect(uint64_t generation);
    void arm_reconnect_locked(int64_t delay);
    void on_qr_expired(uint64_t generation, int qr_version);

    // Caller holds mutex_; returns the connection event to append
    EventDraft transition_locked(ConnectionState next);
    void cancel_timers_locked();
    std::shared_ptr<SessionSocket> current_socket() const;

    std::string session_id_;
    std::string credentials_dir_;
    SocketFactory& factory_;
    Scheduler& scheduler_;
    EventBroker& broker_;
    Options options_;

    mutable std::mutex mutex_;
    std::shared_ptr<SessionSocket> socket_;
    ConnectionState state_;
    bool stopping_;
    uint64_t generation_;
    int64_t current_delay_ms_;
    TimerId reconnect_timer_;
    TimerId qr_timer_;

    std::string last_challenge_;
    int qr_version_;
    int64_t qr_expires_at_;
    int pairing_attempts_;
    std::string last_error_;
    ConnectionDetail detail_;
    int64_t updated_at_;
    std::string phone_number_;

    MessageHandler message_handler_;
    StatusHandler status_handler_;
    Executor executor_;
};

} // namespace chatgate

#endif // CHATGATE_SESSION_CONNECTION_SUPERVISOR_HPP
