/*
 * chatgate - One chat-platform session
 *
 * A Session owns its connection supervisor, delivery ledger and send
 * window. Sends are admitted by the rate window on the caller's thread,
 * then run one at a time on the session's serial queue.
 */
#ifndef CHATGATE_SESSION_SESSION_HPP
#define CHATGATE_SESSION_SESSION_HPP

#include <chatgate/session/connection_supervisor.hpp>
#include <chatgate/status/status_ledger.hpp>
#include <chatgate/rate_limiter/rate_limiter.hpp>
#include <chatgate/broker/event_broker.hpp>
#include <chatgate/core/thread_pool.hpp>
#include <chatgate/core/scheduler.hpp>

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>
#include <memory>
#include <cstdint>

namespace chatgate {

const size_t NOTE_MAX_LENGTH = 280;
const size_t NAME_MAX_LENGTH = 80;
const size_t NOTE_REVISIONS_MAX = 20;
const int64_t MEDIA_MAX_BYTES = 16 * 1024 * 1024;

struct NoteRevision {
    int64_t timestamp;
    std::string author;
    std::string before;
    std::string after;

    NoteRevision() : timestamp(0) {}

    Json to_json() const;
};

struct SessionMetadata {
    std::string id;
    std::string name;
    std::string note;
    std::string phone_number;
    int64_t created_at;
    int64_t updated_at;
    std::vector<NoteRevision> revisions;    // oldest first

    SessionMetadata() : created_at(0), updated_at(0) {}

    Json to_json() const;
};

// ============ Send requests ============

struct ButtonSpec {
    std::string id;
    std::string title;
};

struct ButtonsMessage {
    std::string text;
    std::string footer;
    std::vector<ButtonSpec> buttons;
};

struct ListOption {
    std::string id;
    std::string title;
    std::string description;
};

struct ListSection {
    std::string title;
    std::vector<ListOption> options;
};

struct ListMessage {
    std::string text;
    std::string button_text;
    std::string title;
    std::string footer;
    std::vector<ListSection> sections;
};

struct MediaMessage {
    std::string type;           // image | video | audio | document
    std::string url;
    std::string base64;
    std::string caption;
    std::string mimetype;
    std::string file_name;
    bool ptt;
    bool gif_playback;

    MediaMessage() : ptt(false), gif_playback(false) {}
};

struct PollMessage {
    std::string question;
    std::vector<std::string> options;
    int selectable_count;

    PollMessage() : selectable_count(1) {}
};

struct SendReceipt {
    std::string message_id;
    std::string to;
    std::string type;
    AckResult ack;
    Json extra;                 // per-kind details (media size, poll options, ...)

    Json to_json() const;
};

struct SendMetrics {
    int64_t sent;
    std::map<std::string, int64_t> by_type;
    std::string last_sent_id;

    SendMetrics();

    Json to_json() const;
};

class Session : public std::enable_shared_from_this<Session> {
public:
    struct Options {
        int rate_max_sends;
        int64_t rate_window_ms;
        int64_t send_timeout_ms;
        size_t send_queue_limit;
        StatusLedger::Options ledger;
        ConnectionSupervisor::Options connection;

        Options()
            : rate_max_sends(20)
            , rate_window_ms(15000)
            , send_timeout_ms(30000)
            , send_queue_limit(100) {}
    };

    Session(const SessionMetadata& metadata, const std::string& credentials_dir,
            SocketFactory& factory, Scheduler& scheduler, ThreadPool& pool,
            EventBroker& broker, const Options& options = Options());
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Wires callbacks; must run once after construction through a shared_ptr
    void init();

    void start();

    // Timers are cancelled and outstanding ack waits resolve with no ack
    void stop(bool logout = false);

    // ============ Sends ============
    // All of them throw GatewayError for validation, admission and socket
    // failures. wait_ack_ms <= 0 returns without waiting for an ack.

    SendReceipt send_text(const std::string& to, const std::string& text, int64_t wait_ack_ms = 0);
    SendReceipt send_buttons(const std::string& to, const ButtonsMessage& msg, int64_t wait_ack_ms = 0);
    SendReceipt send_list(const std::string& to, const ListMessage& msg, int64_t wait_ack_ms = 0);
    SendReceipt send_media(const std::string& to, const MediaMessage& msg, int64_t wait_ack_ms = 0);
    SendReceipt send_poll(const std::string& to, const PollMessage& msg, int64_t wait_ack_ms = 0);

    // ============ Connection ============

    std::string request_pairing_code(const std::string& phone);
    std::string qr_image();

    // Queues one socket poll on the session's control lane and returns at
    // once; skipped while the previous poll is still running
    void poll();

    ConnectionState state() const;
    ConnectionSnapshot connection() const;

    // ============ Metadata ============

    const std::string& id() const { return id_; }
    const std::string& credentials_dir() const { return credentials_dir_; }
    SessionMetadata metadata() const;

    // Applies name and/or note; returns the updated metadata. Values are
    // expected to be validated by the caller.
    SessionMetadata update_metadata(const std::string* name, const std::string* note,
                                    const std::string& author, int64_t now_ms);

    // Puts back a snapshot taken before a change that failed to persist
    void replace_metadata(const SessionMetadata& metadata);

    // ============ Delivery status ============

    int status_of(const std::string& message_id) const;
    std::shared_ptr<StatusLedger> ledger() const { return ledger_; }

    Json metrics_json() const;
    Json to_json() const;

private:
    SendReceipt dispatch(const std::string& to, const std::string& type,
                         const std::string& metric_type, const Json& message,
                         int64_t wait_ack_ms, const Json& extra);

    // Runs on the send queue once the socket took the message
    void record_sent(const std::string& message_id, const std::string& to,
                     const std::string& type, const std::string& metric_type);

    void on_inbound(const InboundMessage& message);
    void on_status(const StatusUpdate& update);
    void on_status_change(const StatusChange& change);

    std::string id_;
    std::string credentials_dir_;
    Scheduler& scheduler_;
    EventBroker& broker_;
    Options options_;

    std::shared_ptr<ConnectionSupervisor> supervisor_;
    std::shared_ptr<StatusLedger> ledger_;
    SerialQueue send_queue_;
    SerialQueue control_queue_;     // reconnects and socket polls
    std::atomic<bool> poll_pending_;

    mutable std::mutex mutex_;
    SessionMetadata metadata_;
    RateWindow rate_;
    SendMetrics send_metrics_;
};

} // namespace chatgate

#endif // CHATGATE_SESSION_SESSION_HPP
