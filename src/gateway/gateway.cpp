/*
 * Gateway server implementation (Crow backend, C++17)
 */

#include <chatgate/gateway/gateway.hpp>
#include <chatgate/gateway/requests.hpp>
#include <chatgate/webhook/signature.hpp>
#include <chatgate/core/logger.hpp>
#include <chatgate/core/utils.hpp>

#include <crow.h>

#include <atomic>
#include <mutex>
#include <thread>
#include <map>
#include <sstream>

namespace chatgate {

namespace {

crow::response json_response(int code, const Json& body) {
    crow::response res(code);
    res.set_header("Content-Type", "application/json");
    res.body = body.dump();
    return res;
}

Json ok_body() {
    Json j = Json::object();
    j["ok"] = true;
    return j;
}

Json events_array(const std::vector<BrokerEvent>& events) {
    Json arr = Json::array();
    for (size_t i = 0; i < events.size(); ++i) {
        arr.push_back(events[i].to_json());
    }
    return arr;
}

std::string recipient_of(const Json& body) {
    std::string to = body.value("to", std::string(""));
    return to.empty() ? body.value("number", std::string("")) : to;
}

std::string query(const crow::request& req, const char* key) {
    const char* v = req.url_params.get(key);
    return v ? std::string(v) : std::string();
}

} // anonymous namespace

// ============================================================================
// Stream client: one WebSocket connection tailing one subscription
// ============================================================================

struct StreamClient {
    crow::websocket::connection* conn;
    std::string conn_id;

    std::mutex mutex;               // guards conn use against onclose
    bool alive;
    std::shared_ptr<Subscription> subscription;
    std::thread pump;

    StreamClient(crow::websocket::connection* c, const std::string& id)
        : conn(c), conn_id(id), alive(true) {}

    bool send(const Json& frame) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!alive) return false;
        conn->send_text(frame.dump());
        return true;
    }
};

// ============================================================================
// GatewayServer::Impl
// ============================================================================

class GatewayServer::Impl {
public:
    Impl(SessionRegistry& registry, EventBroker& broker, InboundWebhookReceiver& inbound,
         WebhookDispatcher* dispatcher, const Options& options)
        : registry_(registry)
        , broker_(broker)
        , inbound_(inbound)
        , dispatcher_(dispatcher)
        , options_(options)
        , running_(false)
        , next_conn_(0) {}

    ~Impl() {
        stop();
    }

    bool start() {
        if (running_) return true;

        setup_routes();

        running_ = true;
        server_thread_ = std::thread([this]() {
            try {
                app_.bindaddr(options_.bind.empty() ? std::string("0.0.0.0") : options_.bind)
                    .port(static_cast<uint16_t>(options_.port))
                    .multithreaded()
                    .run();
            } catch (const std::exception& e) {
                LOG_ERROR("gateway.server.error error=%s", e.what());
            }
            running_ = false;
        });

        LOG_INFO("gateway.started bind=%s port=%d auth=%s", options_.bind.c_str(), options_.port,
                 options_.api_keys.empty() ? "disabled" : "enabled");
        return true;
    }

    void stop() {
        broker_.close_all("shutdown");

        std::map<crow::websocket::connection*, std::shared_ptr<StreamClient> > clients;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            clients.swap(clients_);
        }
        for (std::map<crow::websocket::connection*, std::shared_ptr<StreamClient> >::iterator it =
                 clients.begin(); it != clients.end(); ++it) {
            release(it->second);
        }

        if (server_thread_.joinable()) {
            app_.stop();
            server_thread_.join();
            LOG_INFO("gateway.stopped");
        }
        running_ = false;
    }

    bool is_running() const { return running_; }

    size_t stream_count() const {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        return clients_.size();
    }

private:
    // ============ Request plumbing ============

    bool authorized(const crow::request& req) const {
        return api_key_allowed(options_.api_keys, req.get_header_value("x-api-key"));
    }

    template <typename Handler>
    crow::response guarded(const crow::request& req, Handler handler) {
        if (!authorized(req)) {
            return json_response(401, error_body("unauthorized", "missing or invalid x-api-key"));
        }
        try {
            return handler();
        } catch (const GatewayError& e) {
            int code = error_kind_http_status(e.kind());
            if (code >= 500) {
                LOG_ERROR("gateway.request.failed path=%s code=%s detail=%s", req.url.c_str(),
                          e.code().c_str(), e.what());
            } else {
                LOG_DEBUG("gateway.request.rejected path=%s code=%s", req.url.c_str(),
                          e.code().c_str());
            }
            return json_response(code, error_body(e.code(), e.what()));
        } catch (const std::exception& e) {
            LOG_ERROR("gateway.request.error path=%s error=%s", req.url.c_str(), e.what());
            return json_response(500, error_body("internal_error", e.what()));
        }
    }

    // ============ Routes ============

    void setup_routes() {
        CROW_ROUTE(app_, "/health")
        ([this](const crow::request& req) {
            return guarded(req, [this]() { return json_response(200, health()); });
        });

        CROW_ROUTE(app_, "/instances")
            .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Post)
        ([this](const crow::request& req) {
            return guarded(req, [this, &req]() {
                if (req.method == crow::HTTPMethod::Post) {
                    Json body = parse_body(req.body);
                    std::shared_ptr<Session> session = registry_.create(
                        body.value("name", std::string("")), body.value("note", std::string("")));
                    return json_response(201, session->to_json());
                }
                std::vector<std::shared_ptr<Session> > sessions = registry_.list();
                Json arr = Json::array();
                for (size_t i = 0; i < sessions.size(); ++i) {
                    arr.push_back(sessions[i]->to_json());
                }
                Json out = Json::object();
                out["instances"] = arr;
                return json_response(200, out);
            });
        });

        CROW_ROUTE(app_, "/instances/<string>")
            .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Patch, crow::HTTPMethod::Delete)
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &req, &id]() {
                if (req.method == crow::HTTPMethod::Patch) {
                    registry_.patch(id, parse_patch_request(parse_body(req.body)));
                    return json_response(200, registry_.get(id)->to_json());
                }
                if (req.method == crow::HTTPMethod::Delete) {
                    RemoveOptions opts;
                    opts.remove_credentials = parse_flag(req.url_params.get("removeCredentials"), true);
                    opts.force_logout = parse_flag(req.url_params.get("forceLogout"), true);
                    registry_.remove(id, opts);
                    Json out = Json::object();
                    out["removed"] = true;
                    out["id"] = id;
                    return json_response(200, out);
                }
                return json_response(200, registry_.get(id)->to_json());
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/qr.png")
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &id]() {
                crow::response res(200);
                res.set_header("Content-Type", "image/png");
                res.set_header("Cache-Control", "no-store");
                res.body = registry_.qr_image(id);
                return res;
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/qr")
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &id]() {
                ConnectionSnapshot snap = registry_.get(id)->connection();
                if (snap.last_challenge.empty()) {
                    throw GatewayError(ErrorKind::NOT_FOUND, "qr_unavailable", "no pairing challenge pending");
                }
                Json out = Json::object();
                out["qr"] = snap.last_challenge;
                out["qrVersion"] = snap.qr_version;
                out["expiresAt"] = snap.qr_expires_at;
                out["state"] = connection_state_str(snap.state);
                return json_response(200, out);
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/pair").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &req, &id]() {
                Json body = parse_body(req.body);
                std::string phone = body.value("phoneNumber", std::string(""));
                if (phone.empty()) phone = body.value("phone", std::string(""));
                std::string code = registry_.request_pairing_code(id, phone);
                Json out = Json::object();
                out["code"] = code;
                out["phoneNumber"] = digits_only(phone);
                return json_response(200, out);
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/logout").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &id]() {
                registry_.logout(id);
                return json_response(200, ok_body());
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/session/wipe").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &id]() {
                registry_.reset_credentials(id);
                return json_response(200, ok_body());
            });
        });

        // ============ Sends ============

        CROW_ROUTE(app_, "/instances/<string>/send-text").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &req, &id]() {
                Json body = parse_body(req.body);
                SendReceipt r = registry_.get(id)->send_text(
                    recipient_of(body), body.value("text", std::string("")), parse_wait_ack(body));
                return json_response(200, r.to_json());
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/send-buttons").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &req, &id]() {
                Json body = parse_body(req.body);
                SendReceipt r = registry_.get(id)->send_buttons(
                    recipient_of(body), parse_buttons_message(body), parse_wait_ack(body));
                return json_response(200, r.to_json());
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/send-list").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &req, &id]() {
                Json body = parse_body(req.body);
                SendReceipt r = registry_.get(id)->send_list(
                    recipient_of(body), parse_list_message(body), parse_wait_ack(body));
                return json_response(200, r.to_json());
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/send-media").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &req, &id]() {
                Json body = parse_body(req.body);
                SendReceipt r = registry_.get(id)->send_media(
                    recipient_of(body), parse_media_message(body), parse_wait_ack(body));
                return json_response(200, r.to_json());
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/send-poll").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &req, &id]() {
                Json body = parse_body(req.body);
                SendReceipt r = registry_.get(id)->send_poll(
                    recipient_of(body), parse_poll_message(body), parse_wait_ack(body));
                return json_response(200, r.to_json());
            });
        });

        // ============ Status, metrics, events ============

        CROW_ROUTE(app_, "/instances/<string>/status")
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &req, &id]() {
                std::string message_id = query(req, "id");
                if (message_id.empty()) {
                    throw GatewayError(ErrorKind::VALIDATION, "id_required", "query parameter id is required");
                }
                int status = registry_.get(id)->status_of(message_id);
                Json out = Json::object();
                out["id"] = message_id;
                out["tracked"] = status >= 0;
                out["status"] = status >= 0 ? Json(status) : Json();
                return json_response(200, out);
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/metrics")
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &id]() {
                return json_response(200, registry_.get(id)->metrics_json());
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/events")
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &req, &id]() {
                registry_.get(id);
                EventFilter filter;
                filter.scope = id;
                filter.type = query(req, "type");
                filter.direction = query(req, "direction");
                Json out = Json::object();
                out["events"] = events_array(
                    broker_.recent(parse_limit(req.url_params.get("limit"), 50), filter));
                return json_response(200, out);
            });
        });

        CROW_ROUTE(app_, "/instances/<string>/events/ack").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req, std::string id) {
            return guarded(req, [this, &req, &id]() {
                registry_.get(id);
                return json_response(200,
                                     broker_.ack(parse_id_list(parse_body(req.body)), id).to_json());
            });
        });

        CROW_ROUTE(app_, "/broker/events")
        ([this](const crow::request& req) {
            return guarded(req, [this, &req]() {
                ListQuery q;
                q.after = query(req, "after");
                q.limit = parse_limit(req.url_params.get("limit"), 50);
                q.filter.scope = query(req, "sessionId");
                q.filter.type = query(req, "type");
                q.filter.direction = query(req, "direction");

                std::vector<BrokerEvent> events = broker_.list(q);
                Json out = Json::object();
                out["events"] = events_array(events);
                out["nextCursor"] = events.empty() ? Json() : Json(events.back().id);
                out["metrics"] = broker_.metrics().to_json();
                return json_response(200, out);
            });
        });

        CROW_ROUTE(app_, "/broker/events/ack").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) {
            return guarded(req, [this, &req]() {
                return json_response(200, broker_.ack(parse_id_list(parse_body(req.body))).to_json());
            });
        });

        // Authenticated by signature rather than api key
        CROW_ROUTE(app_, "/webhooks/inbound").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) {
            try {
                InboundReceipt receipt = inbound_.receive(req.body,
                                                          req.get_header_value(SIGNATURE_HEADER),
                                                          req.get_header_value(IDEMPOTENCY_HEADER));
                return json_response(receipt.duplicate ? 200 : 202, receipt.to_json());
            } catch (const GatewayError& e) {
                return json_response(error_kind_http_status(e.kind()), error_body(e.code(), e.what()));
            }
        });

        // ============ Stream ============

        CROW_WEBSOCKET_ROUTE(app_, "/stream")
            .onaccept([this](const crow::request& req, void**) {
                return authorized(req);
            })
            .onopen([this](crow::websocket::connection& conn) {
                on_stream_open(conn);
            })
            .onclose([this](crow::websocket::connection& conn, const std::string& reason) {
                on_stream_close(conn, reason);
            })
            .onmessage([this](crow::websocket::connection& conn, const std::string& data, bool) {
                on_stream_message(conn, data);
            });
    }

    Json health() const {
        Json out = Json::object();
        out["status"] = "ok";
        out["sessions"] = static_cast<int64_t>(registry_.size());
        out["streams"] = static_cast<int64_t>(stream_count());
        out["broker"] = broker_.metrics().to_json();
        out["webhook"] = dispatcher_ ? dispatcher_->metrics().to_json() : Json();
        return out;
    }

    // ============ Stream handling ============

    void on_stream_open(crow::websocket::connection& conn) {
        std::ostringstream oss;
        oss << "stream_" << ++next_conn_;
        std::shared_ptr<StreamClient> client = std::make_shared<StreamClient>(&conn, oss.str());

        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_[&conn] = client;
        LOG_DEBUG("stream.open conn=%s total=%zu", client->conn_id.c_str(), clients_.size());
    }

    void on_stream_close(crow::websocket::connection& conn, const std::string& reason) {
        std::shared_ptr<StreamClient> client;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            std::map<crow::websocket::connection*, std::shared_ptr<StreamClient> >::iterator it =
                clients_.find(&conn);
            if (it == clients_.end()) return;
            client = it->second;
            clients_.erase(it);
        }
        LOG_DEBUG("stream.close conn=%s reason=%s", client->conn_id.c_str(), reason.c_str());
        release(client);
    }

    void on_stream_message(crow::websocket::connection& conn, const std::string& data) {
        std::shared_ptr<StreamClient> client;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            std::map<crow::websocket::connection*, std::shared_ptr<StreamClient> >::iterator it =
                clients_.find(&conn);
            if (it == clients_.end()) return;
            client = it->second;
        }

        Json request;
        try {
            request = Json::parse(data);
        } catch (const JsonParseError& e) {
            client->send(stream_error("invalid_json", e.what()));
            return;
        }

        std::string type = request.value("type", std::string(""));
        if (type == "ping") {
            Json pong = Json::object();
            pong["type"] = "pong";
            client->send(pong);
            return;
        }
        if (type != "subscribe") {
            client->send(stream_error("unknown_type", "expected subscribe"));
            return;
        }

        std::lock_guard<std::mutex> lock(client->mutex);
        if (!client->alive) return;
        if (client->subscription) {
            client->conn->send_text(stream_error("already_subscribed", "one subscription per stream").dump());
            return;
        }

        EventFilter filter;
        filter.scope = request.value("sessionId", std::string(""));
        filter.type = request.value("event", std::string(""));
        std::string last_id = request.value("lastEventId", std::string(""));

        client->subscription = broker_.subscribe(last_id, filter);
        client->pump = std::thread(&Impl::pump, this, client, client->subscription);

        LOG_DEBUG("stream.subscribed conn=%s session=%s last=%s", client->conn_id.c_str(),
                  filter.scope.c_str(), last_id.c_str());
    }

    static Json stream_error(const std::string& code, const std::string& detail) {
        Json j = error_body(code, detail);
        j["type"] = "error";
        return j;
    }

    // Runs on its own thread per subscribed stream
    void pump(std::shared_ptr<StreamClient> client, std::shared_ptr<Subscription> sub) {
        for (;;) {
            BrokerEvent ev;
            Subscription::NextResult r = sub->next(options_.keepalive_ms, ev);

            if (r == Subscription::EVENT) {
                Json frame = ev.to_json();
                frame["type"] = "event";
                frame["event"] = ev.type;
                if (!client->send(frame)) break;
            } else if (r == Subscription::TIMEOUT) {
                Json frame = Json::object();
                frame["type"] = "keepalive";
                frame["ts"] = current_timestamp_ms();
                if (!client->send(frame)) break;
            } else {
                std::string reason = sub->close_reason();
                std::lock_guard<std::mutex> lock(client->mutex);
                if (client->alive) {
                    Json frame = Json::object();
                    frame["type"] = "closed";
                    frame["reason"] = reason;
                    client->conn->send_text(frame.dump());
                    client->conn->close(reason);
                    LOG_WARN("stream.closed conn=%s reason=%s", client->conn_id.c_str(), reason.c_str());
                }
                break;
            }
        }
    }

    void release(const std::shared_ptr<StreamClient>& client) {
        std::shared_ptr<Subscription> sub;
        {
            std::lock_guard<std::mutex> lock(client->mutex);
            client->alive = false;
            sub = client->subscription;
        }
        if (sub) {
            sub->close("client_closed");
            broker_.unsubscribe(sub);
        }
        if (client->pump.joinable() && client->pump.get_id() != std::this_thread::get_id()) {
            client->pump.join();
        }
    }

    SessionRegistry& registry_;
    EventBroker& broker_;
    InboundWebhookReceiver& inbound_;
    WebhookDispatcher* dispatcher_;
    Options options_;

    crow::SimpleApp app_;
    std::atomic<bool> running_;
    std::thread server_thread_;

    mutable std::mutex clients_mutex_;
    std::map<crow::websocket::connection*, std::shared_ptr<StreamClient> > clients_;
    std::atomic<uint64_t> next_conn_;
};

// ============================================================================
// GatewayServer
// ============================================================================

GatewayServer::GatewayServer(SessionRegistry& registry, EventBroker& broker,
                             InboundWebhookReceiver& inbound, WebhookDispatcher* dispatcher,
                             const Options& options)
    : impl_(new Impl(registry, broker, inbound, dispatcher, options)) {}

GatewayServer::~GatewayServer() {}

bool GatewayServer::start() {
    return impl_->start();
}

void GatewayServer::stop() {
    impl_->stop();
}

bool GatewayServer::is_running() const {
    return impl_->is_running();
}

size_t GatewayServer::stream_count() const {
    return impl_->stream_count();
}

} // namespace chatgate
