#include <chatgate/session/registry.hpp>
#include <chatgate/core/logger.hpp>
#include <chatgate/core/utils.hpp>

namespace chatgate {

SessionRegistry::SessionRegistry(SessionStore& store, SocketFactory& factory, Scheduler& scheduler,
                                 ThreadPool& pool, EventBroker& broker, const Options& options)
    : store_(store)
    , factory_(factory)
    , scheduler_(scheduler)
    , pool_(pool)
    , broker_(broker)
    , options_(options) {}

SessionRegistry::~SessionRegistry() {
    stop_all();
}

std::string SessionRegistry::make_id(const std::string& name) {
    std::string slug = slugify(trim(name));
    return slug.empty() ? generate_uuid() : slug;
}

std::string SessionRegistry::credentials_dir(const std::string& id) const {
    return join_path(options_.sessions_dir, id);
}

std::shared_ptr<Session> SessionRegistry::build(const SessionMetadata& metadata) {
    std::shared_ptr<Session> session = std::make_shared<Session>(
        metadata, credentials_dir(metadata.id), factory_, scheduler_, pool_, broker_,
        options_.session);
    session->init();
    return session;
}

void SessionRegistry::announce(const std::string& type, const std::string& id) {
    Json payload = Json::object();
    payload["sessionId"] = id;
    broker_.append(EventDraft(type, id, EventDirection::SYSTEM, payload));
}

// ============ Lifecycle ============

std::shared_ptr<Session> SessionRegistry::create(const std::string& name, const std::string& note) {
    std::string id = make_id(name);
    std::string display = truncate_safe(trim(name), NAME_MAX_LENGTH);
    if (display.empty()) display = id;

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.count(id)) {
            throw GatewayError(ErrorKind::CONFLICT, "instance_exists",
                               "session " + id + " already exists");
        }

        std::string dir = credentials_dir(id);
        if (!mkdir_p(dir)) {
            LOG_ERROR("registry.create.mkdir_failed id=%s dir=%s", id.c_str(), dir.c_str());
            throw GatewayError(ErrorKind::INTERNAL, "credentials_dir_failed",
                               "cannot create " + dir);
        }

        SessionMetadata metadata;
        metadata.id = id;
        metadata.name = display;
        metadata.note = truncate_safe(trim(note), NOTE_MAX_LENGTH);
        metadata.created_at = scheduler_.now_ms();
        metadata.updated_at = metadata.created_at;

        if (!store_.save(metadata)) {
            LOG_ERROR("registry.persist.failed op=create id=%s error=%s", id.c_str(),
                      store_.last_error().c_str());
            throw GatewayError(ErrorKind::INTERNAL, "persist_failed", store_.last_error());
        }

        session = build(metadata);
        sessions_[id] = session;
    }

    LOG_INFO("registry.created id=%s", id.c_str());
    announce("session.created", id);
    session->start();
    return session;
}

void SessionRegistry::start(const std::string& id) {
    std::shared_ptr<Session> session = get(id);
    if (!mkdir_p(session->credentials_dir())) {
        throw GatewayError(ErrorKind::INTERNAL, "credentials_dir_failed",
                           "cannot create " + session->credentials_dir());
    }
    session->start();
}

void SessionRegistry::remove(const std::string& id, const RemoveOptions& options) {
    std::shared_ptr<Session> session = get(id);

    // The index goes first; a session it still lists keeps running
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!store_.remove(id)) {
            LOG_ERROR("registry.persist.failed op=remove id=%s error=%s", id.c_str(),
                      store_.last_error().c_str());
            throw GatewayError(ErrorKind::INTERNAL, "persist_failed", store_.last_error());
        }
        sessions_.erase(id);
    }

    session->stop(options.force_logout);

    if (options.remove_credentials && !remove_tree(session->credentials_dir())) {
        LOG_WARN("registry.remove.credentials_left id=%s dir=%s", id.c_str(),
                 session->credentials_dir().c_str());
    }

    LOG_INFO("registry.removed id=%s credentials=%s logout=%s", id.c_str(),
             options.remove_credentials ? "erased" : "kept",
             options.force_logout ? "yes" : "no");
    announce("session.removed", id);
}

SessionMetadata SessionRegistry::patch(const std::string& id, const PatchRequest& request) {
    if (!request.has_name && !request.has_note) {
        throw GatewayError(ErrorKind::VALIDATION, "no_updates", "name or note is required");
    }

    std::string name;
    if (request.has_name) {
        name = truncate_safe(trim(request.name), NAME_MAX_LENGTH);
        if (name.empty()) {
            throw GatewayError(ErrorKind::VALIDATION, "name_empty", "name cannot be empty");
        }
    }
    std::string note;
    if (request.has_note) {
        note = truncate_safe(trim(request.note), NOTE_MAX_LENGTH);
    }

    std::shared_ptr<Session> session = get(id);
    std::string author = trim(request.author).empty() ? std::string("api") : trim(request.author);

    std::lock_guard<std::mutex> lock(mutex_);
    SessionMetadata before = session->metadata();
    SessionMetadata after = session->update_metadata(request.has_name ? &name : nullptr,
                                                     request.has_note ? &note : nullptr,
                                                     author, scheduler_.now_ms());
    if (!store_.save(after)) {
        session->replace_metadata(before);
        LOG_ERROR("registry.persist.failed op=patch id=%s error=%s", id.c_str(),
                  store_.last_error().c_str());
        throw GatewayError(ErrorKind::INTERNAL, "persist_failed", store_.last_error());
    }

    LOG_INFO("registry.patched id=%s name=%s note=%s", id.c_str(),
             request.has_name ? "yes" : "no", request.has_note ? "yes" : "no");
    return after;
}

size_t SessionRegistry::load_and_start_all() {
    std::vector<SessionMetadata> records = store_.load_all();
    if (records.empty() && !store_.last_error().empty()) {
        LOG_WARN("registry.load.empty error=%s", store_.last_error().c_str());
    }

    size_t started = 0;
    for (size_t i = 0; i < records.size(); ++i) {
        const SessionMetadata& metadata = records[i];
        std::shared_ptr<Session> session;
        try {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (sessions_.count(metadata.id)) continue;
                if (!mkdir_p(credentials_dir(metadata.id))) {
                    throw GatewayError(ErrorKind::INTERNAL, "credentials_dir_failed",
                                       "cannot create " + credentials_dir(metadata.id));
                }
                session = build(metadata);
                sessions_[metadata.id] = session;
            }
            session->start();
            ++started;
        } catch (const std::exception& e) {
            LOG_ERROR("registry.load.start_failed id=%s error=%s", metadata.id.c_str(), e.what());
            if (session) {
                session->stop();
                std::lock_guard<std::mutex> lock(mutex_);
                sessions_.erase(metadata.id);
            }
        }
    }

    LOG_INFO("registry.loaded sessions=%zu started=%zu", records.size(), started);
    return started;
}

// ============ Lookups ============

std::vector<std::shared_ptr<Session> > SessionRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session> > out;
    for (std::map<std::string, std::shared_ptr<Session> >::const_iterator it = sessions_.begin();
         it != sessions_.end(); ++it) {
        out.push_back(it->second);
    }
    return out;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::shared_ptr<Session> >::const_iterator it = sessions_.find(id);
    return it != sessions_.end() ? it->second : std::shared_ptr<Session>();
}

std::shared_ptr<Session> SessionRegistry::get(const std::string& id) const {
    std::shared_ptr<Session> session = find(id);
    if (!session) {
        throw GatewayError(ErrorKind::NOT_FOUND, "instance_not_found", "no session " + id);
    }
    return session;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

// ============ Credentials and pairing ============

void SessionRegistry::reset_credentials(const std::string& id) {
    std::shared_ptr<Session> session = get(id);
    session->stop(true);

    const std::string& dir = session->credentials_dir();
    if (!remove_tree(dir) || !mkdir_p(dir)) {
        LOG_ERROR("registry.reset.failed id=%s dir=%s", id.c_str(), dir.c_str());
        throw GatewayError(ErrorKind::INTERNAL, "session_wipe_failed", "cannot reset " + dir);
    }

    LOG_WARN("registry.reset id=%s", id.c_str());
    announce("session.reset", id);
    session->start();
}

void SessionRegistry::logout(const std::string& id) {
    std::shared_ptr<Session> session = get(id);
    session->stop(true);
    LOG_INFO("registry.logout id=%s", id.c_str());
}

std::string SessionRegistry::request_pairing_code(const std::string& id, const std::string& phone) {
    std::shared_ptr<Session> session = get(id);
    std::string code = session->request_pairing_code(phone);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!store_.save(session->metadata())) {
        LOG_ERROR("registry.persist.failed op=pair id=%s error=%s", id.c_str(),
                  store_.last_error().c_str());
    }
    return code;
}

std::string SessionRegistry::qr_image(const std::string& id) {
    return get(id)->qr_image();
}

void SessionRegistry::poll() {
    std::vector<std::shared_ptr<Session> > sessions = list();
    for (size_t i = 0; i < sessions.size(); ++i) {
        try {
            sessions[i]->poll();
        } catch (const std::exception& e) {
            LOG_WARN("registry.poll.failed id=%s error=%s", sessions[i]->id().c_str(), e.what());
        }
    }
}

void SessionRegistry::stop_all() {
    std::vector<std::shared_ptr<Session> > sessions = list();
    for (size_t i = 0; i < sessions.size(); ++i) {
        sessions[i]->stop(false);
    }
    if (!sessions.empty()) {
        LOG_INFO("registry.stopped sessions=%zu", sessions.size());
    }
}

} // namespace chatgate
