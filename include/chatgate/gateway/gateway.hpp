/*
 * chatgate - HTTP / WebSocket control plane
 *
 * REST routes over the session registry and the event broker, plus the
 * /stream WebSocket that tails broker events. Uses Crow
 * (https://crowcpp.org); Crow types stay inside gateway.cpp.
 */
#ifndef CHATGATE_GATEWAY_GATEWAY_HPP
#define CHATGATE_GATEWAY_GATEWAY_HPP

#include <chatgate/session/registry.hpp>
#include <chatgate/broker/event_broker.hpp>
#include <chatgate/webhook/dispatcher.hpp>
#include <chatgate/webhook/inbound.hpp>

#include <string>
#include <vector>
#include <memory>

namespace chatgate {

class GatewayServer {
public:
    struct Options {
        int port;
        std::string bind;
        std::vector<std::string> api_keys;
        int64_t keepalive_ms;

        Options() : port(8080), bind("127.0.0.1"), keepalive_ms(15000) {}
    };

    // dispatcher may be null when outbound webhooks are disabled
    GatewayServer(SessionRegistry& registry, EventBroker& broker,
                  InboundWebhookReceiver& inbound, WebhookDispatcher* dispatcher,
                  const Options& options = Options());
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    // Serves on a background thread
    bool start();

    // Closes streams, stops Crow and joins the server thread
    void stop();

    bool is_running() const;
    size_t stream_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace chatgate

#endif // CHATGATE_GATEWAY_GATEWAY_HPP
