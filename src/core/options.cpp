#include <chatgate/core/options.hpp>
#include <chatgate/core/utils.hpp>

namespace chatgate {

GatewayOptions::GatewayOptions()
    : log_level("info")
    , sessions_dir("sessions")
    , webhook_timeout_ms(5000)
    , webhook_dedup_window_ms(10 * 60 * 1000)
    , port(8080)
    , bind("127.0.0.1")
    , stream_keepalive_ms(15000)
    , bridge_url("http://127.0.0.1:3001")
    , bridge_poll_ms(1000)
    , bridge_timeout_ms(10000)
    , workers(8) {
    database = join_path(sessions_dir, "sessions.db");
}

GatewayOptions GatewayOptions::from_config(const Config& cfg) {
    GatewayOptions o;

    o.log_level = cfg.get_string("log_level", o.log_level);
    o.sessions_dir = cfg.get_string("sessions_dir", o.sessions_dir);
    o.database = cfg.get_string("database", join_path(o.sessions_dir, "sessions.db"));

    o.registry.sessions_dir = o.sessions_dir;
    Session::Options& s = o.registry.session;
    s.rate_max_sends = static_cast<int>(cfg.get_int("rate.max_sends", s.rate_max_sends));
    s.rate_window_ms = cfg.get_int("rate.window_ms", s.rate_window_ms);
    s.send_timeout_ms = cfg.get_int("send.timeout_ms", s.send_timeout_ms);
    s.send_queue_limit = static_cast<size_t>(
        cfg.get_int("send.queue_limit", static_cast<int64_t>(s.send_queue_limit)));
    s.connection.reconnect_min_ms = cfg.get_int("reconnect.min_ms", s.connection.reconnect_min_ms);
    s.connection.reconnect_max_ms = cfg.get_int("reconnect.max_ms", s.connection.reconnect_max_ms);
    s.connection.qr_initial_ttl_ms = cfg.get_int("qr.initial_ttl_ms", s.connection.qr_initial_ttl_ms);
    s.connection.qr_subsequent_ttl_ms =
        cfg.get_int("qr.subsequent_ttl_ms", s.connection.qr_subsequent_ttl_ms);
    s.ledger.ttl_ms = cfg.get_int("status.ttl_ms", s.ledger.ttl_ms);
    s.ledger.sweep_interval_ms = cfg.get_int("status.sweep_interval_ms", s.ledger.sweep_interval_ms);

    o.broker.backlog = static_cast<size_t>(
        cfg.get_int("broker.backlog", static_cast<int64_t>(o.broker.backlog)));
    o.broker.subscriber_queue = static_cast<size_t>(
        cfg.get_int("broker.subscriber_queue", static_cast<int64_t>(o.broker.subscriber_queue)));
    o.broker.default_max_attempts =
        static_cast<int>(cfg.get_int("webhook.max_attempts", o.broker.default_max_attempts));

    o.webhook.url = cfg.get_string("webhook.url");
    o.webhook.secret = cfg.get_string("webhook.secret");
    o.webhook.api_key = cfg.get_string("webhook.api_key");
    o.webhook.retry_base_ms = cfg.get_int("webhook.retry_base_ms", o.webhook.retry_base_ms);
    o.webhook_timeout_ms = cfg.get_int("webhook.timeout_ms", o.webhook_timeout_ms);
    o.webhook_dedup_window_ms = cfg.get_int("webhook.dedup_window_ms", o.webhook_dedup_window_ms);
    o.broker.deliveries = !o.webhook.url.empty();

    o.port = static_cast<int>(cfg.get_int("gateway.port", o.port));
    o.bind = cfg.get_string("gateway.bind", o.bind);
    o.api_keys = cfg.get_string_list("gateway.api_keys");
    o.stream_keepalive_ms = cfg.get_int("stream.keepalive_ms", o.stream_keepalive_ms);

    o.bridge_url = cfg.get_string("bridge.url", o.bridge_url);
    o.bridge_poll_ms = cfg.get_int("bridge.poll_ms", o.bridge_poll_ms);
    o.bridge_timeout_ms = cfg.get_int("bridge.timeout_ms", o.bridge_timeout_ms);

    int64_t workers = cfg.get_int("workers", static_cast<int64_t>(o.workers));
    o.workers = workers > 0 ? static_cast<size_t>(workers) : 1;

    return o;
}

std::string GatewayOptions::validate() const {
    const Session::Options& s = registry.session;
    if (s.rate_max_sends <= 0 || s.rate_window_ms <= 0) return "rate.max_sends and rate.window_ms must be positive";
    if (s.connection.reconnect_min_ms <= 0 || s.connection.reconnect_max_ms < s.connection.reconnect_min_ms) {
        return "reconnect.min_ms must be positive and not above reconnect.max_ms";
    }
    if (s.ledger.ttl_ms <= 0 || s.ledger.sweep_interval_ms <= 0) return "status.ttl_ms and status.sweep_interval_ms must be positive";
    if (broker.backlog == 0) return "broker.backlog must be positive";
    if (broker.default_max_attempts <= 0) return "webhook.max_attempts must be positive";
    if (port <= 0 || port > 65535) return "gateway.port out of range";
    if (stream_keepalive_ms <= 0) return "stream.keepalive_ms must be positive";
    if (bridge_url.empty()) return "bridge.url is required";
    return "";
}

} // namespace chatgate
