#include <chatgate/webhook/dispatcher.hpp>
#include <chatgate/webhook/signature.hpp>
#include <chatgate/core/logger.hpp>

namespace chatgate {

HttpResponse CurlWebhookTransport::post(const std::string& url, const std::string& body,
                                        const HttpHeaders& headers) {
    HttpClient client;
    client.set_timeout(timeout_ms_);
    return client.post_raw(url, body, "application/json", headers);
}

Json DispatcherMetrics::to_json() const {
    Json j = Json::object();
    j["attempts"] = attempts;
    j["delivered"] = delivered;
    j["retried"] = retried;
    j["failed"] = failed;
    j["inFlight"] = in_flight;
    return j;
}

WebhookDispatcher::WebhookDispatcher(EventBroker& broker, Scheduler& scheduler, ThreadPool& pool,
                                     std::shared_ptr<WebhookTransport> transport,
                                     const Options& options)
    : broker_(broker)
    , scheduler_(scheduler)
    , pool_(pool)
    , transport_(transport)
    , options_(options)
    , stopped_(false) {
    if (options_.retry_base_ms <= 0) options_.retry_base_ms = 2000;
}

WebhookDispatcher::~WebhookDispatcher() {
    stop();
}

std::string WebhookDispatcher::build_body(const BrokerEvent& ev) {
    Json body = Json::object();
    body["id"] = ev.id;
    body["sequence"] = ev.sequence;
    body["event"] = ev.type;
    body["sessionId"] = ev.scope;
    body["direction"] = event_direction_str(ev.direction);
    body["payload"] = ev.payload;
    body["createdAt"] = ev.created_at;
    return body.dump();
}

void WebhookDispatcher::start() {
    std::weak_ptr<WebhookDispatcher> weak = shared_from_this();
    broker_.add_listener([weak](const BrokerEvent& ev) {
        std::shared_ptr<WebhookDispatcher> self = weak.lock();
        if (self && ev.has_delivery) self->dispatch(ev);
    });

    if (enabled()) {
        LOG_INFO("webhook.started url=%s signed=%s", options_.url.c_str(),
                 options_.secret.empty() ? "no" : "yes");
    } else {
        LOG_INFO("webhook.disabled reason=no_url");
    }
}

void WebhookDispatcher::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return;
    stopped_ = true;
    for (std::map<std::string, Pending>::iterator it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->second.retry_timer != 0) {
            scheduler_.cancel(it->second.retry_timer);
        }
    }
    if (!pending_.empty()) {
        LOG_WARN("webhook.stop abandoned=%zu", pending_.size());
    }
    pending_.clear();
    metrics_.in_flight = 0;
}

void WebhookDispatcher::dispatch(const BrokerEvent& ev) {
    if (!enabled()) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_ || pending_.count(ev.id)) return;

        Pending p;
        p.body = build_body(ev);
        p.record = ev.delivery;
        if (p.record.max_attempts <= 0) p.record.max_attempts = 1;
        p.retry_timer = 0;
        pending_[ev.id] = p;
        metrics_.in_flight = static_cast<int64_t>(pending_.size());
    }

    std::weak_ptr<WebhookDispatcher> weak = shared_from_this();
    std::string id = ev.id;
    if (!pool_.enqueue([weak, id] {
            std::shared_ptr<WebhookDispatcher> self = weak.lock();
            if (self) self->attempt(id);
        })) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
        metrics_.in_flight = static_cast<int64_t>(pending_.size());
    }
}

void WebhookDispatcher::attempt(const std::string& event_id) {
    std::string body;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, Pending>::iterator it = pending_.find(event_id);
        if (stopped_ || it == pending_.end()) return;
        it->second.retry_timer = 0;
        body = it->second.body;
    }

    HttpHeaders headers;
    if (!options_.secret.empty()) {
        headers[SIGNATURE_HEADER] = sign_body(options_.secret, body);
    }
    if (!options_.api_key.empty()) {
        headers["x-api-key"] = options_.api_key;
    }

    HttpResponse resp = transport_->post(options_.url, body, headers);

    DeliveryRecord record;
    int64_t retry_delay = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, Pending>::iterator it = pending_.find(event_id);
        if (it == pending_.end()) return;

        Pending& p = it->second;
        p.record.attempts += 1;
        p.record.last_attempt_at = scheduler_.now_ms();
        p.record.last_status = resp.status_code;
        ++metrics_.attempts;

        if (resp.ok()) {
            p.record.state = "success";
            p.record.last_error.clear();
            ++metrics_.delivered;
        } else {
            p.record.last_error = resp.error.empty()
                ? "HTTP " + std::to_string(resp.status_code) : resp.error;
            if (p.record.attempts >= p.record.max_attempts) {
                p.record.state = "failed";
                ++metrics_.failed;
            } else {
                p.record.state = "retry";
                retry_delay = p.record.attempts * options_.retry_base_ms;
                ++metrics_.retried;
            }
        }

        record = p.record;
        if (retry_delay == 0) {
            pending_.erase(it);
        }
        metrics_.in_flight = static_cast<int64_t>(pending_.size());
    }

    broker_.update_delivery(event_id, record);

    if (record.state == "success") {
        LOG_DEBUG("webhook.delivered id=%s attempt=%d status=%ld",
                  event_id.c_str(), record.attempts, record.last_status);
    } else if (record.state == "failed") {
        LOG_ERROR("webhook.failed id=%s attempts=%d error=%s",
                  event_id.c_str(), record.attempts, record.last_error.c_str());
    } else {
        LOG_WARN("webhook.retry id=%s attempt=%d delay=%lld error=%s",
                 event_id.c_str(), record.attempts,
                 static_cast<long long>(retry_delay), record.last_error.c_str());
        schedule_retry(event_id, retry_delay);
    }
}

void WebhookDispatcher::schedule_retry(const std::string& event_id, int64_t delay_ms) {
    std::weak_ptr<WebhookDispatcher> weak = shared_from_this();

    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Pending>::iterator it = pending_.find(event_id);
    if (stopped_ || it == pending_.end()) return;

    it->second.retry_timer = scheduler_.schedule(delay_ms, [weak, event_id] {
        std::shared_ptr<WebhookDispatcher> self = weak.lock();
        if (!self) return;
        bool queued = self->pool_.enqueue([weak, event_id] {
            std::shared_ptr<WebhookDispatcher> inner = weak.lock();
            if (inner) inner->attempt(event_id);
        });
        if (!queued) {
            LOG_WARN("webhook.retry.dropped id=%s reason=pool_stopped", event_id.c_str());
        }
    });
}

DispatcherMetrics WebhookDispatcher::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

} // namespace chatgate
