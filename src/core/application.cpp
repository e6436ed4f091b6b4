/*
 * chatgate - Application implementation
 */

#include <chatgate/core/application.hpp>
#include <chatgate/core/logger.hpp>
#include <chatgate/core/utils.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <curl/curl.h>

namespace chatgate {

namespace {

    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }

    void print_usage(const char* prog) {
        std::cout << "Usage: " << prog << " [options] [config.json]\n"
                  << "\n"
                  << "Options:\n"
                  << "  -h, --help       Show this help\n"
                  << "  -v, --version    Show version\n"
                  << "\n"
                  << "Every config key can be overridden from the environment,\n"
                  << "e.g. gateway.port -> CHATGATE_GATEWAY_PORT\n";
    }

    void print_version() {
        std::cout << AppInfo::NAME << " " << AppInfo::VERSION << std::endl;
    }

} // anonymous namespace

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , initialized_(false) {}

bool Application::parse_args(int argc, char* argv[], const char** config_file) {
    *config_file = "config.json";

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        *config_file = argv[i];
    }
    return true;
}

void Application::setup_logging() {
    if (!Logger::instance().set_level(options_.log_level)) {
        LOG_WARN("app.config.log_level unknown=%s using=info", options_.log_level.c_str());
    }
}

bool Application::setup_storage() {
    if (!mkdir_p(options_.sessions_dir)) {
        LOG_ERROR("app.storage.mkdir_failed dir=%s", options_.sessions_dir.c_str());
        return false;
    }

    store_.reset(new SessionStore());
    if (!store_->open(options_.database) || !store_->ensure_schema()) {
        LOG_ERROR("app.storage.open_failed db=%s error=%s", options_.database.c_str(),
                  store_->last_error().c_str());
        return false;
    }
    LOG_INFO("app.storage.ready db=%s", options_.database.c_str());
    return true;
}

void Application::setup_webhooks() {
    if (!options_.webhook.url.empty()) {
        std::shared_ptr<WebhookTransport> transport =
            std::make_shared<CurlWebhookTransport>(static_cast<long>(options_.webhook_timeout_ms));
        dispatcher_ = std::make_shared<WebhookDispatcher>(*broker_, *scheduler_, *pool_, transport,
                                                          options_.webhook);
        dispatcher_->start();
        LOG_INFO("app.webhook.enabled url=%s signed=%s max_attempts=%d", options_.webhook.url.c_str(),
                 options_.webhook.secret.empty() ? "no" : "yes", options_.broker.default_max_attempts);
    } else {
        LOG_INFO("app.webhook.disabled");
    }

    inbound_.reset(new InboundWebhookReceiver(*broker_, *scheduler_, options_.webhook.secret,
                                              options_.webhook_dedup_window_ms));
}

bool Application::setup_gateway() {
    GatewayServer::Options opts;
    opts.port = options_.port;
    opts.bind = options_.bind;
    opts.api_keys = options_.api_keys;
    opts.keepalive_ms = options_.stream_keepalive_ms;

    if (opts.api_keys.empty()) {
        LOG_WARN("app.gateway.open no api keys configured");
    }

    server_.reset(new GatewayServer(*registry_, *broker_, *inbound_, dispatcher_.get(), opts));
    return server_->start();
}

bool Application::init(int argc, char* argv[]) {
    // Before any thread starts
    curl_global_init(CURL_GLOBAL_ALL);

    const char* config_file = nullptr;
    if (!parse_args(argc, argv, &config_file)) {
        return false;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!config_.load_file(config_file)) {
        LOG_WARN("app.config.load_failed path=%s error=%s, using defaults", config_file,
                 config_.last_error().c_str());
    } else {
        LOG_INFO("app.config.loaded path=%s", config_file);
    }

    options_ = GatewayOptions::from_config(config_);
    setup_logging();

    std::string problem = options_.validate();
    if (!problem.empty()) {
        LOG_ERROR("app.config.invalid %s", problem.c_str());
        return false;
    }

    scheduler_.reset(new TimerScheduler());
    pool_.reset(new ThreadPool(options_.workers));
    broker_.reset(new EventBroker(*scheduler_, options_.broker));

    if (!setup_storage()) {
        return false;
    }

    sockets_.reset(new BridgeSocketFactory(options_.bridge_url,
                                           static_cast<long>(options_.bridge_timeout_ms)));
    registry_.reset(new SessionRegistry(*store_, *sockets_, *scheduler_, *pool_, *broker_,
                                        options_.registry));

    setup_webhooks();

    size_t started = registry_->load_and_start_all();
    LOG_INFO("app.sessions.started count=%zu bridge=%s", started, options_.bridge_url.c_str());

    if (!setup_gateway()) {
        LOG_ERROR("app.gateway.start_failed");
        return false;
    }

    initialized_ = true;
    return true;
}

int Application::run() {
    LOG_INFO("Entering main loop");

    int64_t last_poll = 0;
    while (running_.load()) {
        int64_t now = current_timestamp_ms();
        if (now - last_poll >= options_.bridge_poll_ms) {
            last_poll = now;
            registry_->poll();
        }
        sleep_ms(50);
    }

    LOG_INFO("Received shutdown signal");
    return 0;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    if (server_) server_->stop();
    if (dispatcher_) dispatcher_->stop();
    if (registry_) registry_->stop_all();
    if (scheduler_) scheduler_->stop();
    if (pool_) pool_->shutdown();

    server_.reset();
    inbound_.reset();
    dispatcher_.reset();
    registry_.reset();
    sockets_.reset();
    if (store_) store_->close();
    store_.reset();
    broker_.reset();
    pool_.reset();
    scheduler_.reset();

    curl_global_cleanup();
    initialized_ = false;

    LOG_INFO("Goodbye!");
}

} // namespace chatgate
