#include <chatgate/session/session.hpp>
#include <chatgate/core/logger.hpp>
#include <chatgate/core/utils.hpp>
#include <chatgate/core/types.hpp>
#include <future>
#include <chrono>

namespace chatgate {

namespace {

const char* const DEFAULT_JID_SUFFIX = "@s.whatsapp.net";
const size_t CONTROL_QUEUE_LIMIT = 8;

GatewayError invalid(const std::string& code, const std::string& detail) {
    return GatewayError(ErrorKind::VALIDATION, code, detail);
}

std::string require_recipient(const std::string& to) {
    if (trim(to).empty()) {
        throw invalid("to_required", "recipient is required");
    }
    std::string normalized = normalize_recipient(to);
    if (normalized.empty()) {
        throw invalid("to_invalid", "recipient must be a platform JID or 10 to 15 digits in E.164");
    }
    if (normalized.find('@') == std::string::npos) {
        normalized += DEFAULT_JID_SUFFIX;
    }
    return normalized;
}

std::string require_text(const std::string& text, const std::string& code, const std::string& what) {
    std::string t = trim(text);
    if (t.empty()) throw invalid(code, what + " is required");
    return t;
}

bool is_media_type(const std::string& type) {
    return type == "image" || type == "video" || type == "audio" || type == "document";
}

} // namespace

// ============ Value types ============

Json NoteRevision::to_json() const {
    Json j = Json::object();
    j["timestamp"] = timestamp;
    j["author"] = author.empty() ? Json() : Json(author);
    j["before"] = before;
    j["after"] = after;
    return j;
}

Json SessionMetadata::to_json() const {
    Json j = Json::object();
    j["id"] = id;
    j["name"] = name;
    j["note"] = note;
    j["phoneNumber"] = phone_number.empty() ? Json() : Json(phone_number);
    j["createdAt"] = created_at;
    j["updatedAt"] = updated_at;

    Json revs = Json::array();
    for (size_t i = 0; i < revisions.size(); ++i) {
        revs.push_back(revisions[i].to_json());
    }
    j["noteRevisions"] = revs;
    return j;
}

Json SendReceipt::to_json() const {
    Json j = extra.is_object() ? extra : Json::object();
    j["id"] = message_id;
    j["to"] = to;
    j["type"] = type;
    j["status"] = message_status::PENDING;
    j["ack"] = ack.acked ? Json(ack.status) : Json();
    return j;
}

SendMetrics::SendMetrics() : sent(0) {
    const char* kinds[] = { "text", "image", "video", "audio", "document", "buttons", "lists", "polls" };
    for (size_t i = 0; i < sizeof(kinds) / sizeof(kinds[0]); ++i) {
        by_type[kinds[i]] = 0;
    }
}

Json SendMetrics::to_json() const {
    Json j = Json::object();
    j["sent"] = sent;
    Json types = Json::object();
    for (std::map<std::string, int64_t>::const_iterator it = by_type.begin(); it != by_type.end(); ++it) {
        types[it->first] = it->second;
    }
    j["sentByType"] = types;
    return j;
}

// ============ Session ============

Session::Session(const SessionMetadata& metadata, const std::string& credentials_dir,
                 SocketFactory& factory, Scheduler& scheduler, ThreadPool& pool,
                 EventBroker& broker, const Options& options)
    : id_(metadata.id)
    , credentials_dir_(credentials_dir)
    , scheduler_(scheduler)
    , broker_(broker)
    , options_(options)
    , supervisor_(std::make_shared<ConnectionSupervisor>(metadata.id, credentials_dir, factory,
                                                         scheduler, broker, options.connection))
    , ledger_(std::make_shared<StatusLedger>(scheduler, options.ledger))
    , send_queue_(pool, options.send_queue_limit)
    , control_queue_(pool, CONTROL_QUEUE_LIMIT)
    , poll_pending_(false)
    , metadata_(metadata)
    , rate_(options.rate_max_sends, options.rate_window_ms) {}

Session::~Session() {
    ledger_->stop();
}

void Session::init() {
    std::weak_ptr<Session> weak = shared_from_this();

    supervisor_->set_message_handler([weak](const InboundMessage& message) {
        std::shared_ptr<Session> self = weak.lock();
        if (self) self->on_inbound(message);
    });
    supervisor_->set_status_handler([weak](const StatusUpdate& update) {
        std::shared_ptr<Session> self = weak.lock();
        if (self) self->on_status(update);
    });
    ledger_->set_listener([weak](const StatusChange& change) {
        std::shared_ptr<Session> self = weak.lock();
        if (self) self->on_status_change(change);
    });
    supervisor_->set_executor([weak](const std::function<void()>& task) {
        std::shared_ptr<Session> self = weak.lock();
        return self && self->control_queue_.post(task);
    });
}

void Session::start() {
    ledger_->start();
    supervisor_->start();
}

void Session::stop(bool logout) {
    supervisor_->stop(logout);
    ledger_->stop();
}

// ============ Sends ============

SendReceipt Session::send_text(const std::string& to, const std::string& text, int64_t wait_ack_ms) {
    std::string jid = require_recipient(to);
    std::string body = require_text(text, "text_required", "text");

    Json message = Json::object();
    message["to"] = jid;
    message["type"] = "text";
    message["text"] = body;
    return dispatch(jid, "text", "text", message, wait_ack_ms, Json::object());
}

SendReceipt Session::send_buttons(const std::string& to, const ButtonsMessage& msg, int64_t wait_ack_ms) {
    std::string jid = require_recipient(to);
    std::string body = require_text(msg.text, "text_required", "text");

    if (msg.buttons.empty() || msg.buttons.size() > 3) {
        throw invalid("buttons_invalid", "between 1 and 3 buttons are required");
    }

    Json buttons = Json::array();
    for (size_t i = 0; i < msg.buttons.size(); ++i) {
        std::string id = trim(msg.buttons[i].id);
        std::string title = trim(msg.buttons[i].title);
        if (id.empty() || title.empty()) {
            throw invalid("buttons_invalid", "every button needs an id and a title");
        }
        Json b = Json::object();
        b["id"] = id;
        b["title"] = title;
        buttons.push_back(b);
    }

    Json message = Json::object();
    message["to"] = jid;
    message["type"] = "buttons";
    message["text"] = body;
    if (!trim(msg.footer).empty()) message["footer"] = trim(msg.footer);
    message["buttons"] = buttons;
    return dispatch(jid, "buttons", "buttons", message, wait_ack_ms, Json::object());
}

SendReceipt Session::send_list(const std::string& to, const ListMessage& msg, int64_t wait_ack_ms) {
    std::string jid = require_recipient(to);
    std::string body = require_text(msg.text, "text_required", "text");
    std::string button_text = require_text(msg.button_text, "button_text_required", "buttonText");

    if (msg.sections.empty()) {
        throw invalid("sections_invalid", "at least one section is required");
    }

    Json sections = Json::array();
    for (size_t s = 0; s < msg.sections.size(); ++s) {
        const ListSection& section = msg.sections[s];
        if (section.options.empty()) {
            throw invalid("sections_invalid", "every section needs at least one option");
        }

        Json rows = Json::array();
        for (size_t o = 0; o < section.options.size(); ++o) {
            std::string id = trim(section.options[o].id);
            std::string title = trim(section.options[o].title);
            if (id.empty() || title.empty()) {
                throw invalid("sections_invalid", "every option needs an id and a title");
            }
            Json row = Json::object();
            row["id"] = id;
            row["title"] = title;
            if (!trim(section.options[o].description).empty()) {
                row["description"] = trim(section.options[o].description);
            }
            rows.push_back(row);
        }

        Json sec = Json::object();
        sec["title"] = trim(section.title);
        sec["options"] = rows;
        sections.push_back(sec);
    }

    Json message = Json::object();
    message["to"] = jid;
    message["type"] = "list";
    message["text"] = body;
    message["buttonText"] = button_text;
    if (!trim(msg.title).empty()) message["title"] = trim(msg.title);
    if (!trim(msg.footer).empty()) message["footer"] = trim(msg.footer);
    message["sections"] = sections;
    return dispatch(jid, "list", "lists", message, wait_ack_ms, Json::object());
}

SendReceipt Session::send_media(const std::string& to, const MediaMessage& msg, int64_t wait_ack_ms) {
    std::string type = to_lower(trim(msg.type));
    if (!is_media_type(type)) {
        throw invalid("type_invalid", "type must be one of image, video, audio, document");
    }
    std::string jid = require_recipient(to);

    std::string url = trim(msg.url);
    std::string base64 = trim(msg.base64);
    if (url.empty() == base64.empty()) {
        throw invalid("media_invalid", "exactly one of media.url or media.base64 is required");
    }

    Json extra = Json::object();
    extra["mediaType"] = type;

    Json media = Json::object();
    if (!url.empty()) {
        std::string lower = to_lower(url);
        if (!starts_with(lower, "http://") && !starts_with(lower, "https://")) {
            throw invalid("media_url_invalid", "media.url must be http or https");
        }
        media["url"] = url;
        extra["source"] = "url";
    } else {
        int64_t size = base64_decoded_size(base64);
        if (size < 0) {
            throw invalid("media_invalid", "media.base64 is not valid base64");
        }
        if (size > MEDIA_MAX_BYTES) {
            throw invalid("media_too_large", "media exceeds " + std::to_string(MEDIA_MAX_BYTES) + " bytes");
        }
        media["base64"] = base64;
        extra["source"] = "base64";
        extra["size"] = size;
    }

    std::string mimetype = trim(msg.mimetype);
    if (mimetype.empty() && type == "document") {
        mimetype = "application/octet-stream";
    }
    std::string file_name = trim(msg.file_name);
    if (file_name.empty() && type == "document") {
        file_name = "file";
    }

    if (!mimetype.empty()) media["mimetype"] = mimetype;
    if (!file_name.empty()) media["fileName"] = file_name;
    if (type == "audio" && msg.ptt) media["ptt"] = true;
    if (type == "video" && msg.gif_playback) media["gifPlayback"] = true;

    extra["mimetype"] = mimetype.empty() ? Json() : Json(mimetype);
    extra["fileName"] = file_name.empty() ? Json() : Json(file_name);

    Json message = Json::object();
    message["to"] = jid;
    message["type"] = "media";
    message["mediaType"] = type;
    message["media"] = media;
    if (!trim(msg.caption).empty()) message["caption"] = trim(msg.caption);
    return dispatch(jid, type, type, message, wait_ack_ms, extra);
}

SendReceipt Session::send_poll(const std::string& to, const PollMessage& msg, int64_t wait_ack_ms) {
    std::string jid = require_recipient(to);
    std::string question = require_text(msg.question, "question_invalid", "question");

    Json options = Json::array();
    int count = 0;
    for (size_t i = 0; i < msg.options.size(); ++i) {
        std::string option = trim(msg.options[i]);
        if (option.empty()) continue;
        options.push_back(option);
        ++count;
    }
    if (count < 2) {
        throw invalid("options_invalid", "a poll needs at least 2 options");
    }
    int selectable = clamp(msg.selectable_count, 1, count);

    Json message = Json::object();
    message["to"] = jid;
    message["type"] = "poll";
    message["question"] = question;
    message["options"] = options;
    message["selectableCount"] = selectable;

    Json extra = Json::object();
    extra["options"] = options;
    extra["selectableCount"] = selectable;
    return dispatch(jid, "poll", "polls", message, wait_ack_ms, extra);
}

SendReceipt Session::dispatch(const std::string& to, const std::string& type,
                              const std::string& metric_type, const Json& message,
                              int64_t wait_ack_ms, const Json& extra) {
    if (!supervisor_->is_open()) {
        throw GatewayError(ErrorKind::UNAVAILABLE, "socket_unavailable",
                           "session " + id_ + " is not connected");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        RateLimitResult admitted = rate_.try_acquire(scheduler_.now_ms());
        if (!admitted.allowed) {
            LOG_WARN("send.rate_limited id=%s retry_after=%lld", id_.c_str(),
                     static_cast<long long>(admitted.retry_after_ms));
            throw GatewayError(ErrorKind::RATE_LIMITED, "rate_limit_exceeded",
                               "retry after " + std::to_string(admitted.retry_after_ms) + " ms");
        }
    }

    std::shared_ptr<std::promise<SendResult> > done = std::make_shared<std::promise<SendResult> >();
    std::future<SendResult> result = done->get_future();
    std::shared_ptr<ConnectionSupervisor> supervisor = supervisor_;
    std::weak_ptr<Session> weak = shared_from_this();

    // Bookkeeping happens here so a message the socket took is tracked even
    // when the caller gave up waiting
    bool queued = send_queue_.post([weak, supervisor, done, message, to, type, metric_type] {
        SendResult r;
        try {
            r = supervisor->send(message);
        } catch (const GatewayError& e) {
            r = SendResult::fail(e.code());
        } catch (const std::exception& e) {
            r = SendResult::fail(e.what());
        }
        if (r.success && !r.message_id.empty()) {
            std::shared_ptr<Session> self = weak.lock();
            if (self) self->record_sent(r.message_id, to, type, metric_type);
        }
        done->set_value(r);
    });
    if (!queued) {
        LOG_WARN("send.queue_full id=%s", id_.c_str());
        throw GatewayError(ErrorKind::UNAVAILABLE, "send_queue_full",
                           "too many sends pending for session " + id_);
    }

    if (result.wait_for(std::chrono::milliseconds(options_.send_timeout_ms)) != std::future_status::ready) {
        // The queued send still runs and is tracked if the socket takes it
        LOG_WARN("send.timeout id=%s type=%s", id_.c_str(), type.c_str());
        throw GatewayError(ErrorKind::UNAVAILABLE, "send_timeout",
                           "socket did not accept the message in time");
    }

    SendResult sent = result.get();
    if (!sent.success) {
        LOG_WARN("send.failed id=%s type=%s error=%s", id_.c_str(), type.c_str(), sent.error.c_str());
        if (sent.error == "socket_unavailable") {
            throw GatewayError(ErrorKind::UNAVAILABLE, "socket_unavailable",
                               "session " + id_ + " disconnected before sending");
        }
        throw GatewayError(ErrorKind::INTERNAL, "send_failed", sent.error);
    }
    if (sent.message_id.empty()) {
        throw GatewayError(ErrorKind::INTERNAL, "send_failed", "socket returned no message id");
    }

    SendReceipt receipt;
    receipt.message_id = sent.message_id;
    receipt.to = to;
    receipt.type = type;
    receipt.extra = extra;
    if (wait_ack_ms > 0) {
        receipt.ack = ledger_->wait_for_ack(sent.message_id, wait_ack_ms).get();
    }
    return receipt;
}

void Session::record_sent(const std::string& message_id, const std::string& to,
                          const std::string& type, const std::string& metric_type) {
    int in_window;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_window = rate_.in_window(scheduler_.now_ms());
        send_metrics_.sent += 1;
        send_metrics_.by_type[metric_type] += 1;
        send_metrics_.last_sent_id = message_id;
    }

    ledger_->record_dispatch(message_id, in_window);

    Json payload = Json::object();
    payload["messageId"] = message_id;
    payload["to"] = to;
    payload["type"] = type;
    payload["status"] = message_status::PENDING;
    broker_.append(EventDraft("message", id_, EventDirection::OUTBOUND, payload));

    LOG_INFO("send.accepted id=%s msg=%s type=%s", id_.c_str(), message_id.c_str(), type.c_str());
}

// ============ Socket events ============

void Session::on_inbound(const InboundMessage& message) {
    LOG_DEBUG("message.inbound id=%s from=%s type=%s", id_.c_str(),
              message.from.c_str(), message.type.c_str());
    broker_.append(EventDraft("message", id_, EventDirection::INBOUND, message.to_json()));
}

void Session::on_status(const StatusUpdate& update) {
    if (update.message_id.empty()) return;
    ledger_->apply(update.message_id, update.status);
}

void Session::on_status_change(const StatusChange& change) {
    Json payload = Json::object();
    payload["messageId"] = change.message_id;
    payload["status"] = change.status;
    payload["previous"] = change.previous >= 0 ? Json(change.previous) : Json();
    payload["latencyMs"] = change.latency_ms >= 0 ? Json(change.latency_ms) : Json();
    broker_.append(EventDraft("message.status", id_, EventDirection::OUTBOUND, payload));
}

// ============ Connection ============

std::string Session::request_pairing_code(const std::string& phone) {
    std::string digits = digits_only(phone);
    if (digits.size() < 10 || digits.size() > 15) {
        throw invalid("phone_invalid", "phoneNumber must hold 10 to 15 digits");
    }

    std::string code = supervisor_->request_pairing_code(digits);

    std::lock_guard<std::mutex> lock(mutex_);
    metadata_.phone_number = digits;
    return code;
}

std::string Session::qr_image() {
    return supervisor_->qr_image();
}

void Session::poll() {
    bool idle = false;
    if (!poll_pending_.compare_exchange_strong(idle, true)) return;

    std::weak_ptr<Session> weak = shared_from_this();
    bool queued = control_queue_.post([weak] {
        std::shared_ptr<Session> self = weak.lock();
        if (!self) return;
        try {
            self->supervisor_->poll();
        } catch (const std::exception& e) {
            LOG_ERROR("session.poll.failed id=%s error=%s", self->id_.c_str(), e.what());
        }
        self->poll_pending_.store(false);
    });
    if (!queued) {
        poll_pending_.store(false);
        LOG_WARN("session.poll.skipped id=%s reason=queue_full", id_.c_str());
    }
}

ConnectionState Session::state() const {
    return supervisor_->state();
}

ConnectionSnapshot Session::connection() const {
    return supervisor_->snapshot();
}

// ============ Metadata ============

SessionMetadata Session::metadata() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
}

SessionMetadata Session::update_metadata(const std::string* name, const std::string* note,
                                         const std::string& author, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (name) {
        metadata_.name = *name;
    }
    if (note && *note != metadata_.note) {
        NoteRevision rev;
        rev.timestamp = now_ms;
        rev.author = author;
        rev.before = metadata_.note;
        rev.after = *note;
        metadata_.revisions.push_back(rev);
        if (metadata_.revisions.size() > NOTE_REVISIONS_MAX) {
            metadata_.revisions.erase(metadata_.revisions.begin(),
                                      metadata_.revisions.end() - NOTE_REVISIONS_MAX);
        }
        metadata_.note = *note;
    }
    metadata_.updated_at = now_ms;
    return metadata_;
}

void Session::replace_metadata(const SessionMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    metadata_ = metadata;
}

// ============ Status and metrics ============

int Session::status_of(const std::string& message_id) const {
    return ledger_->status_of(message_id);
}

Json Session::metrics_json() const {
    Json j = ledger_->metrics().to_json();

    std::lock_guard<std::mutex> lock(mutex_);
    Json sends = send_metrics_.to_json();
    j["sent"] = sends["sent"];
    j["sentByType"] = sends["sentByType"];
    j["last"]["sentId"] = send_metrics_.last_sent_id.empty()
        ? Json() : Json(send_metrics_.last_sent_id);

    Json rate = Json::object();
    rate["limit"] = rate_.max_sends();
    rate["windowMs"] = rate_.window_ms();
    j["rate"] = rate;
    return j;
}

Json Session::to_json() const {
    ConnectionSnapshot conn = supervisor_->snapshot();
    LedgerMetrics ledger = ledger_->metrics();

    Json j = metadata().to_json();
    j["connected"] = conn.state == ConnectionState::OPEN;
    j["connectionState"] = connection_state_str(conn.state);
    j["connection"] = conn.to_json();

    Json counters = Json::object();
    counters["sent"] = ledger.sent;
    Json statuses = Json::object();
    for (int i = 0; i < 6; ++i) {
        statuses[std::to_string(i)] = ledger.status_counts[i];
    }
    counters["statusCounts"] = statuses;
    j["counters"] = counters;
    return j;
}

} // namespace chatgate
