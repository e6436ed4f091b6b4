/*
 * chatgate - Process options
 *
 * Every tunable of the gateway in one place, read from Config with the
 * documented defaults. Components receive their slice of it.
 */
#ifndef CHATGATE_CORE_OPTIONS_HPP
#define CHATGATE_CORE_OPTIONS_HPP

#include "config.hpp"
#include <chatgate/session/registry.hpp>
#include <chatgate/broker/event_broker.hpp>
#include <chatgate/webhook/dispatcher.hpp>

#include <string>
#include <vector>
#include <cstdint>

namespace chatgate {

struct GatewayOptions {
    std::string log_level;

    // Storage
    std::string sessions_dir;
    std::string database;           // defaults to <sessions_dir>/sessions.db

    SessionRegistry::Options registry;
    EventBroker::Options broker;

    // Webhooks
    WebhookDispatcher::Options webhook;
    int64_t webhook_timeout_ms;
    int64_t webhook_dedup_window_ms;

    // Control plane
    int port;
    std::string bind;
    std::vector<std::string> api_keys;
    int64_t stream_keepalive_ms;

    // Bridge
    std::string bridge_url;
    int64_t bridge_poll_ms;
    int64_t bridge_timeout_ms;

    size_t workers;

    GatewayOptions();

    static GatewayOptions from_config(const Config& cfg);

    // Empty when usable, otherwise a description of the first problem
    std::string validate() const;
};

} // namespace chatgate

#endif // CHATGATE_CORE_OPTIONS_HPP
