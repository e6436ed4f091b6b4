#include <chatgate/webhook/inbound.hpp>
#include <chatgate/webhook/signature.hpp>
#include <chatgate/core/logger.hpp>
#include <chatgate/core/types.hpp>
#include <chatgate/core/utils.hpp>

namespace chatgate {

const char* const IDEMPOTENCY_HEADER = "X-Idempotency-Key";

Json InboundReceipt::to_json() const {
    Json j = Json::object();
    j["accepted"] = true;
    j["duplicate"] = duplicate;
    j["key"] = key.empty() ? Json() : Json(key);
    j["eventId"] = event_id.empty() ? Json() : Json(event_id);
    return j;
}

InboundWebhookReceiver::InboundWebhookReceiver(EventBroker& broker, Scheduler& scheduler,
                                               const std::string& secret, int64_t dedup_window_ms)
    : broker_(broker)
    , scheduler_(scheduler)
    , secret_(secret)
    , guard_(dedup_window_ms) {}

InboundReceipt InboundWebhookReceiver::receive(const std::string& raw_body,
                                               const std::string& signature,
                                               const std::string& idempotency_key) {
    SignatureCheck check = check_signature(secret_, raw_body, signature);
    if (check != SignatureCheck::VALID && check != SignatureCheck::SKIPPED) {
        LOG_WARN("webhook.inbound.rejected reason=%s", signature_check_str(check));
        throw GatewayError(ErrorKind::UNAUTHORIZED,
                           check == SignatureCheck::MISSING ? "signature_missing" : "signature_invalid",
                           signature_check_str(check));
    }

    Json body;
    try {
        body = Json::parse(raw_body);
    } catch (const JsonParseError& e) {
        throw GatewayError(ErrorKind::VALIDATION, "invalid_json", e.what());
    }
    if (!body.is_object()) {
        throw GatewayError(ErrorKind::VALIDATION, "invalid_json", "body must be an object");
    }

    InboundReceipt receipt;
    receipt.key = trim(idempotency_key);
    if (receipt.key.empty()) {
        receipt.key = body.value("id", std::string(""));
    }

    if (!receipt.key.empty() && !guard_.first_seen(receipt.key, scheduler_.now_ms())) {
        receipt.duplicate = true;
        LOG_DEBUG("webhook.inbound.duplicate key=%s", receipt.key.c_str());
        return receipt;
    }

    std::string scope = body.value("sessionId", std::string("global"));
    EventDraft draft("webhook", scope.empty() ? std::string("global") : scope,
                     EventDirection::INBOUND, body);
    draft.deliver = false;
    receipt.event_id = broker_.append(draft).id;

    LOG_DEBUG("webhook.inbound.accepted key=%s event=%s", receipt.key.c_str(),
              receipt.event_id.c_str());
    return receipt;
}

} // namespace chatgate
