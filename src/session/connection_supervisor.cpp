#include <chatgate/session/connection_supervisor.hpp>
#include <chatgate/core/logger.hpp>
#include <chatgate/core/utils.hpp>
#include <algorithm>

namespace chatgate {

namespace {

// Binds one socket's callbacks to the generation it was opened under
class GenerationListener : public SocketListener {
public:
    GenerationListener(std::weak_ptr<ConnectionSupervisor> owner, uint64_t generation)
        : owner_(owner), generation_(generation) {}

    virtual void on_connection(const ConnectionUpdate& update) {
        std::shared_ptr<ConnectionSupervisor> owner = owner_.lock();
        if (owner) owner->handle_connection(generation_, update);
    }

    virtual void on_qr(const std::string& challenge) {
        std::shared_ptr<ConnectionSupervisor> owner = owner_.lock();
        if (owner) owner->handle_qr(generation_, challenge);
    }

    virtual void on_message(const InboundMessage& message) {
        std::shared_ptr<ConnectionSupervisor> owner = owner_.lock();
        if (owner) owner->handle_message(generation_, message);
    }

    virtual void on_status(const StatusUpdate& update) {
        std::shared_ptr<ConnectionSupervisor> owner = owner_.lock();
        if (owner) owner->handle_status(generation_, update);
    }

private:
    std::weak_ptr<ConnectionSupervisor> owner_;
    uint64_t generation_;
};

} // namespace

Json ConnectionSnapshot::to_json() const {
    Json j = Json::object();
    j["state"] = connection_state_str(state);
    j["stopping"] = stopping;
    j["generation"] = static_cast<int64_t>(generation);
    j["reconnectDelayMs"] = current_delay_ms;
    j["qrVersion"] = qr_version;
    j["qrExpiresAt"] = qr_expires_at > 0 ? Json(qr_expires_at) : Json();
    j["hasQr"] = !last_challenge.empty();
    j["pairingAttempts"] = pairing_attempts;
    j["lastError"] = last_error.empty() ? Json() : Json(last_error);
    j["updatedAt"] = updated_at > 0 ? Json(updated_at) : Json();
    j["phoneNumber"] = phone_number.empty() ? Json() : Json(phone_number);

    Json d = Json::object();
    d["statusCode"] = detail.status_code != 0 ? Json(detail.status_code) : Json();
    d["reason"] = detail.reason.empty() ? Json() : Json(detail.reason);
    d["isLoggedOut"] = detail.logged_out;
    j["connectionDetail"] = d;
    return j;
}

ConnectionSupervisor::ConnectionSupervisor(const std::string& session_id,
                                           const std::string& credentials_dir,
                                           SocketFactory& factory, Scheduler& scheduler,
                                           EventBroker& broker, const Options& options)
    : session_id_(session_id)
    , credentials_dir_(credentials_dir)
    , factory_(factory)
    , scheduler_(scheduler)
    , broker_(broker)
    , options_(options)
    , state_(ConnectionState::CLOSE)
    , stopping_(true)
    , generation_(0)
    , current_delay_ms_(options.reconnect_min_ms)
    , reconnect_timer_(0)
    , qr_timer_(0)
    , qr_version_(0)
    , qr_expires_at_(0)
    , pairing_attempts_(0)
    , updated_at_(0) {
    if (options_.reconnect_min_ms <= 0) options_.reconnect_min_ms = 1;
    if (options_.reconnect_max_ms < options_.reconnect_min_ms) {
        options_.reconnect_max_ms = options_.reconnect_min_ms;
    }
    current_delay_ms_ = options_.reconnect_min_ms;
}

ConnectionSupervisor::~ConnectionSupervisor() {
    std::shared_ptr<SessionSocket> sock;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_timers_locked();
        sock.swap(socket_);
    }
    if (sock) sock->close();
}

void ConnectionSupervisor::set_message_handler(const MessageHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    message_handler_ = handler;
}

void ConnectionSupervisor::set_status_handler(const StatusHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_handler_ = handler;
}

void ConnectionSupervisor::set_executor(const Executor& executor) {
    std::lock_guard<std::mutex> lock(mutex_);
    executor_ = executor;
}

// ============ Lifecycle ============

void ConnectionSupervisor::cancel_timers_locked() {
    if (reconnect_timer_ != 0) {
        scheduler_.cancel(reconnect_timer_);
        reconnect_timer_ = 0;
    }
    if (qr_timer_ != 0) {
        scheduler_.cancel(qr_timer_);
        qr_timer_ = 0;
    }
}

EventDraft ConnectionSupervisor::transition_locked(ConnectionState next) {
    state_ = next;
    updated_at_ = scheduler_.now_ms();

    Json payload = Json::object();
    payload["state"] = connection_state_str(next);
    payload["statusCode"] = detail_.status_code != 0 ? Json(detail_.status_code) : Json();
    payload["reason"] = detail_.reason.empty() ? Json() : Json(detail_.reason);
    payload["isLoggedOut"] = detail_.logged_out;
    return EventDraft("connection", session_id_, EventDirection::SYSTEM, payload);
}

void ConnectionSupervisor::start() {
    connect(true);
}

void ConnectionSupervisor::connect(bool reset_backoff, uint64_t expected_generation) {
    uint64_t gen;
    std::shared_ptr<SessionSocket> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (expected_generation != 0 && (expected_generation != generation_ || stopping_)) {
            LOG_DEBUG("session.reconnect.stale id=%s", session_id_.c_str());
            return;
        }
        stopping_ = false;
        gen = ++generation_;
        cancel_timers_locked();
        previous.swap(socket_);
        last_challenge_.clear();
        qr_expires_at_ = 0;
        if (reset_backoff) {
            current_delay_ms_ = options_.reconnect_min_ms;
        }
    }
    if (previous) previous->close();

    std::shared_ptr<SocketListener> listener =
        std::make_shared<GenerationListener>(shared_from_this(), gen);
    std::shared_ptr<SessionSocket> sock(factory_.create(session_id_, credentials_dir_, listener));

    EventDraft event;
    bool stale = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ != gen || stopping_) {
            stale = true;
        } else {
            socket_ = sock;
            detail_ = ConnectionDetail();
            event = transition_locked(ConnectionState::CONNECTING);
        }
    }
    if (stale) {
        if (sock) sock->close();
        return;
    }

    LOG_INFO("session.connecting id=%s generation=%llu", session_id_.c_str(),
             static_cast<unsigned long long>(gen));
    broker_.append(event);

    if (!sock || !sock->open()) {
        ConnectionUpdate failed;
        failed.state = ConnectionState::CLOSE;
        failed.reason = "open_failed";
        handle_connection(gen, failed);
    }
}

void ConnectionSupervisor::arm_reconnect_locked(int64_t delay) {
    std::weak_ptr<ConnectionSupervisor> weak = shared_from_this();
    uint64_t gen = generation_;
    if (reconnect_timer_ != 0) scheduler_.cancel(reconnect_timer_);
    reconnect_timer_ = scheduler_.schedule(delay, [weak, gen] {
        std::shared_ptr<ConnectionSupervisor> self = weak.lock();
        if (self) self->reconnect(gen);
    });
}

// Runs on the scheduler thread
void ConnectionSupervisor::reconnect(uint64_t generation) {
    Executor executor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || stopping_) return;
        reconnect_timer_ = 0;
        executor = executor_;
    }
    LOG_INFO("session.reconnect id=%s", session_id_.c_str());

    if (!executor) {
        connect(false, generation);
        return;
    }

    std::weak_ptr<ConnectionSupervisor> weak = shared_from_this();
    bool queued = executor([weak, generation] {
        std::shared_ptr<ConnectionSupervisor> self = weak.lock();
        if (self) self->connect(false, generation);
    });
    if (!queued) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || stopping_) return;
        LOG_WARN("session.reconnect.deferred id=%s delay=%lld", session_id_.c_str(),
                 static_cast<long long>(current_delay_ms_));
        arm_reconnect_locked(current_delay_ms_);
    }
}

void ConnectionSupervisor::stop(bool logout) {
    std::shared_ptr<SessionSocket> sock;
    EventDraft event;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        ++generation_;
        cancel_timers_locked();
        sock.swap(socket_);
        current_delay_ms_ = options_.reconnect_min_ms;
        last_challenge_.clear();
        qr_expires_at_ = 0;

        if (logout) {
            detail_ = ConnectionDetail();
            detail_.reason = "logout";
            detail_.logged_out = true;
        }
        if (state_ != ConnectionState::CLOSE || logout) {
            if (!logout) {
                detail_ = ConnectionDetail();
                detail_.reason = "stopped";
            }
            event = transition_locked(ConnectionState::CLOSE);
            changed = true;
        }
    }

    if (sock) {
        if (logout && !sock->logout()) {
            LOG_WARN("session.logout.failed id=%s", session_id_.c_str());
        }
        sock->close();
    } else if (logout) {
        LOG_WARN("session.logout.skipped id=%s reason=no_socket", session_id_.c_str());
    }

    LOG_INFO("session.stopped id=%s logout=%s", session_id_.c_str(), logout ? "yes" : "no");
    if (changed) broker_.append(event);
}

// ============ Socket callbacks ============

void ConnectionSupervisor::handle_connection(uint64_t generation, const ConnectionUpdate& update) {
    EventDraft event;
    bool changed = false;
    std::shared_ptr<SessionSocket> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || stopping_) {
            LOG_DEBUG("session.update.stale id=%s generation=%llu", session_id_.c_str(),
                      static_cast<unsigned long long>(generation));
            return;
        }

        switch (update.state) {
            case ConnectionState::OPEN:
                current_delay_ms_ = options_.reconnect_min_ms;
                last_challenge_.clear();
                qr_expires_at_ = 0;
                pairing_attempts_ = 0;
                last_error_.clear();
                detail_ = ConnectionDetail();
                if (qr_timer_ != 0) {
                    scheduler_.cancel(qr_timer_);
                    qr_timer_ = 0;
                }
                if (!update.phone_number.empty()) {
                    phone_number_ = update.phone_number;
                }
                event = transition_locked(ConnectionState::OPEN);
                changed = true;
                LOG_INFO("session.open id=%s", session_id_.c_str());
                break;

            case ConnectionState::CONNECTING:
                if (state_ != ConnectionState::CONNECTING) {
                    event = transition_locked(ConnectionState::CONNECTING);
                    changed = true;
                }
                break;

            case ConnectionState::CLOSE:
            case ConnectionState::QR_TIMEOUT: {
                detail_.status_code = update.status_code;
                detail_.reason = update.reason;
                detail_.logged_out = update.logged_out;
                last_error_ = trim(update.reason);
                dropped.swap(socket_);
                ++generation_;      // late callbacks from the dropped socket are stale
                if (qr_timer_ != 0) {
                    scheduler_.cancel(qr_timer_);
                    qr_timer_ = 0;
                }
                event = transition_locked(ConnectionState::CLOSE);
                changed = true;

                if (update.logged_out) {
                    LOG_ERROR("session.logged_out id=%s code=%d", session_id_.c_str(),
                              update.status_code);
                    break;
                }

                int64_t delay = std::min(current_delay_ms_, options_.reconnect_max_ms);
                current_delay_ms_ = std::min(current_delay_ms_ * 2, options_.reconnect_max_ms);

                arm_reconnect_locked(delay);
                LOG_WARN("session.reconnect.scheduled id=%s code=%d delay=%lld",
                         session_id_.c_str(), update.status_code, static_cast<long long>(delay));
                break;
            }
        }
    }

    if (dropped) dropped->close();
    if (changed) broker_.append(event);
}

void ConnectionSupervisor::handle_qr(uint64_t generation, const std::string& challenge) {
    EventDraft event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || stopping_) return;
        if (challenge.empty() || challenge == last_challenge_) return;

        last_challenge_ = challenge;
        ++qr_version_;
        int64_t ttl = qr_version_ > 1 ? options_.qr_subsequent_ttl_ms : options_.qr_initial_ttl_ms;
        qr_expires_at_ = scheduler_.now_ms() + ttl;
        pairing_attempts_ = std::max(pairing_attempts_ + 1, 1);

        if (qr_timer_ != 0) scheduler_.cancel(qr_timer_);
        std::weak_ptr<ConnectionSupervisor> weak = shared_from_this();
        int version = qr_version_;
        qr_timer_ = scheduler_.schedule(ttl, [weak, generation, version] {
            std::shared_ptr<ConnectionSupervisor> self = weak.lock();
            if (self) self->on_qr_expired(generation, version);
        });

        Json payload = Json::object();
        payload["qr"] = challenge;
        payload["qrVersion"] = qr_version_;
        payload["expiresAt"] = qr_expires_at_;
        payload["attempt"] = pairing_attempts_;
        event = EventDraft("qr", session_id_, EventDirection::SYSTEM, payload);

        LOG_INFO("session.qr id=%s version=%d ttl=%lld", session_id_.c_str(), qr_version_,
                 static_cast<long long>(ttl));
    }
    broker_.append(event);
}

void ConnectionSupervisor::on_qr_expired(uint64_t generation, int qr_version) {
    EventDraft event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        qr_timer_ = 0;
        if (generation != generation_ || stopping_) return;
        if (qr_version != qr_version_ || last_challenge_.empty()) return;
        if (state_ == ConnectionState::OPEN) return;

        last_challenge_.clear();
        qr_expires_at_ = 0;
        event = transition_locked(ConnectionState::QR_TIMEOUT);
        LOG_WARN("session.qr.timeout id=%s version=%d", session_id_.c_str(), qr_version);
    }
    broker_.append(event);
}

void ConnectionSupervisor::handle_message(uint64_t generation, const InboundMessage& message) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || stopping_) return;
        handler = message_handler_;
    }
    if (handler) handler(message);
}

void ConnectionSupervisor::handle_status(uint64_t generation, const StatusUpdate& update) {
    StatusHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || stopping_) return;
        handler = status_handler_;
    }
    if (handler) handler(update);
}

// ============ Socket operations ============

std::shared_ptr<SessionSocket> ConnectionSupervisor::current_socket() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return socket_;
}

SendResult ConnectionSupervisor::send(const Json& message) {
    std::shared_ptr<SessionSocket> sock;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::OPEN || !socket_) {
            throw GatewayError(ErrorKind::UNAVAILABLE, "socket_unavailable",
                               "session " + session_id_ + " is not connected");
        }
        sock = socket_;
    }
    return sock->send(message);
}

std::string ConnectionSupervisor::request_pairing_code(const std::string& phone) {
    std::shared_ptr<SessionSocket> sock;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::OPEN) {
            throw GatewayError(ErrorKind::CONFLICT, "already_connected",
                               "session " + session_id_ + " is already paired");
        }
        if (!socket_) {
            throw GatewayError(ErrorKind::UNAVAILABLE, "socket_unavailable",
                               "session " + session_id_ + " has no active socket");
        }
        sock = socket_;
    }

    std::string code;
    std::string error;
    if (!sock->request_pairing_code(phone, code, error)) {
        LOG_WARN("session.pairing.failed id=%s error=%s", session_id_.c_str(), error.c_str());
        throw GatewayError(ErrorKind::UNAVAILABLE, "pairing_failed", error);
    }

    EventDraft event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        phone_number_ = phone;
        pairing_attempts_ = std::max(pairing_attempts_ + 1, 1);

        Json payload = Json::object();
        payload["phoneNumber"] = phone;
        payload["attempt"] = pairing_attempts_;
        event = EventDraft("pairing_code", session_id_, EventDirection::SYSTEM, payload);
    }
    LOG_INFO("session.pairing.issued id=%s", session_id_.c_str());
    broker_.append(event);
    return code;
}

std::string ConnectionSupervisor::qr_image() {
    std::shared_ptr<SessionSocket> sock = current_socket();
    if (!sock) {
        throw GatewayError(ErrorKind::UNAVAILABLE, "socket_unavailable",
                           "session " + session_id_ + " has no active socket");
    }

    std::string png;
    std::string error;
    if (!sock->qr_image(png, error) || png.empty()) {
        throw GatewayError(ErrorKind::NOT_FOUND, "qr_unavailable",
                           error.empty() ? "no pending QR challenge" : error);
    }
    return png;
}

void ConnectionSupervisor::poll() {
    std::shared_ptr<SessionSocket> sock = current_socket();
    if (sock) sock->poll();
}

// ============ Queries ============

ConnectionState ConnectionSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionSupervisor::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ConnectionState::OPEN && socket_;
}

uint64_t ConnectionSupervisor::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

ConnectionSnapshot ConnectionSupervisor::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ConnectionSnapshot s;
    s.state = state_;
    s.stopping = stopping_;
    s.generation = generation_;
    s.current_delay_ms = current_delay_ms_;
    s.last_challenge = last_challenge_;
    s.qr_version = qr_version_;
    s.qr_expires_at = qr_expires_at_;
    s.pairing_attempts = pairing_attempts_;
    s.last_error = last_error_;
    s.detail = detail_;
    s.updated_at = updated_at_;
    s.phone_number = phone_number_;
    return s;
}

} // namespace chatgate
