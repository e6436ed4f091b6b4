#ifndef CHATGATE_WEBHOOK_INBOUND_HPP
#define CHATGATE_WEBHOOK_INBOUND_HPP

#include <chatgate/broker/event_broker.hpp>
#include <chatgate/rate_limiter/rate_limiter.hpp>
#include <chatgate/core/scheduler.hpp>

#include <string>

namespace chatgate {

// Header naming the delivery for de-duplication; the body "id" is the fallback
extern const char* const IDEMPOTENCY_HEADER;

struct InboundReceipt {
    bool duplicate;
    std::string key;
    std::string event_id;       // empty for duplicates

    InboundReceipt() : duplicate(false) {}

    Json to_json() const;
};

// Accepts webhooks signed with the outbound scheme, drops repeats of the
// same idempotency key within the window, and republishes the body on the
// broker as an inbound "webhook" event.
class InboundWebhookReceiver {
public:
    InboundWebhookReceiver(EventBroker& broker, Scheduler& scheduler, const std::string& secret,
                           int64_t dedup_window_ms = 10 * 60 * 1000);

    // Throws GatewayError: signature_missing / signature_invalid (401),
    // invalid_json (400)
    InboundReceipt receive(const std::string& raw_body, const std::string& signature,
                           const std::string& idempotency_key);

    size_t remembered() const { return guard_.size(); }

private:
    EventBroker& broker_;
    Scheduler& scheduler_;
    std::string secret_;
    IdempotencyGuard guard_;
};

} // namespace chatgate

#endif // CHATGATE_WEBHOOK_INBOUND_HPP
