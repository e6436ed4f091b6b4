/*
 * chatgate - Session registry
 *
 * Owns every Session of the process, keyed by id, and keeps the durable
 * index in step with it. Caller-facing operations throw GatewayError.
 */
#ifndef CHATGATE_SESSION_REGISTRY_HPP
#define CHATGATE_SESSION_REGISTRY_HPP

#include <chatgate/session/session.hpp>
#include <chatgate/session/store.hpp>
#include <chatgate/session/socket.hpp>

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <memory>

namespace chatgate {

struct RemoveOptions {
    bool remove_credentials;
    bool force_logout;

    RemoveOptions() : remove_credentials(true), force_logout(true) {}
};

struct PatchRequest {
    bool has_name;
    std::string name;
    bool has_note;
    std::string note;
    std::string author;

    PatchRequest() : has_name(false), has_note(false) {}
};

class SessionRegistry {
public:
    struct Options {
        std::string sessions_dir;
        Session::Options session;

        Options() : sessions_dir("sessions") {}
    };

    SessionRegistry(SessionStore& store, SocketFactory& factory, Scheduler& scheduler,
                    ThreadPool& pool, EventBroker& broker, const Options& options = Options());
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // id is the slug of name, or a generated UUID when name is blank
    std::shared_ptr<Session> create(const std::string& name, const std::string& note = "");

    // Re-opens a registered session from its stored credentials
    void start(const std::string& id);

    void remove(const std::string& id, const RemoveOptions& options = RemoveOptions());

    SessionMetadata patch(const std::string& id, const PatchRequest& request);

    // Restores the durable index and starts every session. A session that
    // fails to start is logged and skipped. Returns how many started.
    size_t load_and_start_all();

    std::vector<std::shared_ptr<Session> > list() const;

    // Throws instance_not_found
    std::shared_ptr<Session> get(const std::string& id) const;
    std::shared_ptr<Session> find(const std::string& id) const;

    // Logs out, wipes and recreates the credential directory, restarts
    void reset_credentials(const std::string& id);
    void logout(const std::string& id);

    std::string request_pairing_code(const std::string& id, const std::string& phone);
    std::string qr_image(const std::string& id);

    // Queues a socket poll for every session; a stalled bridge only holds
    // up its own session
    void poll();

    void stop_all();
    size_t size() const;

    static std::string make_id(const std::string& name);

private:
    std::shared_ptr<Session> build(const SessionMetadata& metadata);
    std::string credentials_dir(const std::string& id) const;
    void announce(const std::string& type, const std::string& id);

    SessionStore& store_;
    SocketFactory& factory_;
    Scheduler& scheduler_;
    ThreadPool& pool_;
    EventBroker& broker_;
    Options options_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session> > sessions_;
};

} // namespace chatgate

#endif // CHATGATE_SESSION_REGISTRY_HPP
