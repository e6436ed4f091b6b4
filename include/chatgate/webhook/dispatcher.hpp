/*
 * chatgate - Outbound webhook fan-out
 *
 * Listens to the broker for deliverable events and POSTs each one, signed,
 * to the configured URL. Failed attempts are retried with a linear backoff
 * until the event's attempt budget runs out. Delivery is at-least-once.
 */
#ifndef CHATGATE_WEBHOOK_DISPATCHER_HPP
#define CHATGATE_WEBHOOK_DISPATCHER_HPP

#include <chatgate/broker/event_broker.hpp>
#include <chatgate/core/http_client.hpp>
#include <chatgate/core/scheduler.hpp>
#include <chatgate/core/thread_pool.hpp>

#include <string>
#include <map>
#include <mutex>
#include <memory>
#include <cstdint>

namespace chatgate {

class WebhookTransport {
public:
    virtual ~WebhookTransport() {}

    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const HttpHeaders& headers) = 0;
};

// libcurl transport; a fresh HttpClient per POST since pool threads share it
class CurlWebhookTransport : public WebhookTransport {
public:
    explicit CurlWebhookTransport(long timeout_ms = 5000) : timeout_ms_(timeout_ms) {}

    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const HttpHeaders& headers);

private:
    long timeout_ms_;
};

struct DispatcherMetrics {
    int64_t attempts;
    int64_t delivered;
    int64_t retried;
    int64_t failed;
    int64_t in_flight;

    DispatcherMetrics() : attempts(0), delivered(0), retried(0), failed(0), in_flight(0) {}

    Json to_json() const;
};

class WebhookDispatcher : public std::enable_shared_from_this<WebhookDispatcher> {
public:
    struct Options {
        std::string url;
        std::string secret;
        std::string api_key;        // sent as x-api-key when set
        int64_t retry_base_ms;

        Options() : retry_base_ms(2000) {}
    };

    WebhookDispatcher(EventBroker& broker, Scheduler& scheduler, ThreadPool& pool,
                      std::shared_ptr<WebhookTransport> transport,
                      const Options& options = Options());
    ~WebhookDispatcher();

    WebhookDispatcher(const WebhookDispatcher&) = delete;
    WebhookDispatcher& operator=(const WebhookDispatcher&) = delete;

    // Registers with the broker. Requires ownership by a shared_ptr.
    void start();

    // Cancels pending retries; attempts already running finish
    void stop();

    bool enabled() const { return !options_.url.empty(); }

    // Queues the first attempt for a deliverable event
    void dispatch(const BrokerEvent& ev);

    DispatcherMetrics metrics() const;

    // Raw webhook body; the signature covers these exact bytes
    static std::string build_body(const BrokerEvent& ev);

private:
    struct Pending {
        std::string body;
        DeliveryRecord record;
        TimerId retry_timer;
    };

    void attempt(const std::string& event_id);
    void schedule_retry(const std::string& event_id, int64_t delay_ms);

    EventBroker& broker_;
    Scheduler& scheduler_;
    ThreadPool& pool_;
    std::shared_ptr<WebhookTransport> transport_;
    Options options_;

    mutable std::mutex mutex_;
    std::map<std::string, Pending> pending_;
    DispatcherMetrics metrics_;
    bool stopped_;
};

} // namespace chatgate

#endif // CHATGATE_WEBHOOK_DISPATCHER_HPP
