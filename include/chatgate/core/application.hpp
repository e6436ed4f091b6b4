/*
 * chatgate - Application
 *
 * Process singleton that reads the configuration, constructs every
 * long-lived component once, wires them together and runs the main loop.
 */
#ifndef CHATGATE_CORE_APPLICATION_HPP
#define CHATGATE_CORE_APPLICATION_HPP

#include "config.hpp"
#include "options.hpp"
#include "scheduler.hpp"
#include "thread_pool.hpp"
#include <chatgate/broker/event_broker.hpp>
#include <chatgate/session/store.hpp>
#include <chatgate/session/registry.hpp>
#include <chatgate/bridge/bridge_socket.hpp>
#include <chatgate/webhook/dispatcher.hpp>
#include <chatgate/webhook/inbound.hpp>
#include <chatgate/gateway/gateway.hpp>

#include <string>
#include <memory>
#include <atomic>

namespace chatgate {

struct AppInfo {
    static constexpr const char* VERSION = "0.3.0";
    static constexpr const char* NAME = "chatgate";
};

class Application {
public:
    static Application& instance();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    const Config& config() const { return config_; }
    const GatewayOptions& options() const { return options_; }

    bool is_running() const { return running_.load(); }
    void stop() { running_.store(false); }

    // False when the process should exit (help, version, bad config)
    bool init(int argc, char* argv[]);

    int run();
    void shutdown();

private:
    Application();

    bool parse_args(int argc, char* argv[], const char** config_file);
    void setup_logging();
    bool setup_storage();
    void setup_webhooks();
    bool setup_gateway();

    std::atomic<bool> running_;
    bool initialized_;

    Config config_;
    GatewayOptions options_;

    // Declaration order is construction order; destruction runs backwards
    std::unique_ptr<TimerScheduler> scheduler_;
    std::unique_ptr<ThreadPool> pool_;
    std::unique_ptr<EventBroker> broker_;
    std::unique_ptr<SessionStore> store_;
    std::unique_ptr<BridgeSocketFactory> sockets_;
    std::unique_ptr<SessionRegistry> registry_;
    std::shared_ptr<WebhookDispatcher> dispatcher_;
    std::unique_ptr<InboundWebhookReceiver> inbound_;
    std::unique_ptr<GatewayServer> server_;
};

} // namespace chatgate

#endif // CHATGATE_CORE_APPLICATION_HPP
