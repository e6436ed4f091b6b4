#ifndef CHATGATE_TESTS_FAKE_SOCKET_HPP
#define CHATGATE_TESTS_FAKE_SOCKET_HPP

#include <chatgate/session/socket.hpp>

#include <string>
#include <vector>
#include <mutex>
#include <memory>
#include <chrono>
#include <thread>
#include <set>
#include <stdexcept>

namespace chatgate {
namespace testing {

// State of one fake connection, shared between the socket (owned by the
// supervisor) and the test that scripts it.
class FakeLink {
public:
    FakeLink(const std::string& session_id, const std::string& credentials_dir,
             std::shared_ptr<SocketListener> listener)
        : session_id_(session_id), credentials_dir_(credentials_dir), listener_(listener)
        , open_ok_(true), send_ok_(true), logout_calls_(0), opened_(false), closed_(false)
        , next_id_(1), poll_calls_(0), open_delay_ms_(0), send_delay_ms_(0), poll_delay_ms_(0) {}

    // ============ Scripting ============

    void emit_open(const std::string& phone = "") {
        ConnectionUpdate u;
        u.state = ConnectionState::OPEN;
        u.phone_number = phone;
        listener_->on_connection(u);
    }

    void emit_close(int status_code, const std::string& reason, bool logged_out = false) {
        ConnectionUpdate u;
        u.state = ConnectionState::CLOSE;
        u.status_code = status_code;
        u.reason = reason;
        u.logged_out = logged_out;
        listener_->on_connection(u);
    }

    void emit_qr(const std::string& challenge) { listener_->on_qr(challenge); }

    void emit_status(const std::string& message_id, int status) {
        listener_->on_status(StatusUpdate(message_id, status));
    }

    void emit_message(const InboundMessage& m) { listener_->on_message(m); }

    void set_open_ok(bool ok) { std::lock_guard<std::mutex> l(mutex_); open_ok_ = ok; }
    void set_send_ok(bool ok) { std::lock_guard<std::mutex> l(mutex_); send_ok_ = ok; }

    // Real-time stalls, for a bridge that hangs
    void set_open_delay_ms(int ms) { std::lock_guard<std::mutex> l(mutex_); open_delay_ms_ = ms; }
    void set_send_delay_ms(int ms) { std::lock_guard<std::mutex> l(mutex_); send_delay_ms_ = ms; }
    void set_poll_delay_ms(int ms) { std::lock_guard<std::mutex> l(mutex_); poll_delay_ms_ = ms; }

    // ============ Socket side ============

    bool open() {
        stall(open_delay_ms_);
        std::lock_guard<std::mutex> l(mutex_);
        opened_ = true;
        return open_ok_;
    }

    SendResult send(const Json& message) {
        stall(send_delay_ms_);
        std::lock_guard<std::mutex> l(mutex_);
        if (!send_ok_) return SendResult::fail("fake send failure");
        sent_.push_back(message);
        return SendResult::ok(session_id_ + "-msg-" + std::to_string(next_id_++));
    }

    bool logout() {
        std::lock_guard<std::mutex> l(mutex_);
        ++logout_calls_;
        return true;
    }

    void poll() {
        stall(poll_delay_ms_);
        std::lock_guard<std::mutex> l(mutex_);
        ++poll_calls_;
    }

    void close() {
        std::lock_guard<std::mutex> l(mutex_);
        closed_ = true;
    }

    // ============ Inspection ============

    bool opened() const { std::lock_guard<std::mutex> l(mutex_); return opened_; }
    bool closed() const { std::lock_guard<std::mutex> l(mutex_); return closed_; }
    int logout_calls() const { std::lock_guard<std::mutex> l(mutex_); return logout_calls_; }
    int poll_calls() const { std::lock_guard<std::mutex> l(mutex_); return poll_calls_; }
    std::vector<Json> sent() const { std::lock_guard<std::mutex> l(mutex_); return sent_; }
    const std::string& session_id() const { return session_id_; }
    const std::string& credentials_dir() const { return credentials_dir_; }

private:
    void stall(const int& delay_ms) {
        int ms;
        {
            std::lock_guard<std::mutex> l(mutex_);
            ms = delay_ms;
        }
        if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }

    std::string session_id_;
    std::string credentials_dir_;
    std::shared_ptr<SocketListener> listener_;

    mutable std::mutex mutex_;
    bool open_ok_;
    bool send_ok_;
    int logout_calls_;
    bool opened_;
    bool closed_;
    int next_id_;
    int poll_calls_;
    int open_delay_ms_;
    int send_delay_ms_;
    int poll_delay_ms_;
    std::vector<Json> sent_;
};

class FakeSocket : public SessionSocket {
public:
    explicit FakeSocket(std::shared_ptr<FakeLink> link) : link_(link) {}

    bool open() { return link_->open(); }
    SendResult send(const Json& message) { return link_->send(message); }
    bool logout() { return link_->logout(); }

    bool request_pairing_code(const std::string& phone, std::string& code, std::string& error) {
        if (phone.empty()) {
            error = "no phone";
            return false;
        }
        code = "ABCD-" + phone.substr(phone.size() > 4 ? phone.size() - 4 : 0);
        return true;
    }

    bool qr_image(std::string& png, std::string& error) {
        (void)error;
        png = "\x89PNG-fake";
        return true;
    }

    void poll() { link_->poll(); }
    void close() { link_->close(); }

private:
    std::shared_ptr<FakeLink> link_;
};

// Keeps every link it hands out; the newest one is the live connection
class FakeSocketFactory : public SocketFactory {
public:
    FakeSocketFactory() : open_ok_(true), open_delay_ms_(0) {}

    std::unique_ptr<SessionSocket> create(const std::string& session_id,
                                          const std::string& credentials_dir,
                                          std::shared_ptr<SocketListener> listener) {
        {
            std::lock_guard<std::mutex> l(mutex_);
            if (refused_.count(session_id)) {
                throw std::runtime_error("no socket for " + session_id);
            }
        }
        std::shared_ptr<FakeLink> link = std::make_shared<FakeLink>(session_id, credentials_dir, listener);
        std::lock_guard<std::mutex> l(mutex_);
        link->set_open_ok(open_ok_);
        link->set_open_delay_ms(open_delay_ms_);
        links_.push_back(link);
        return std::unique_ptr<SessionSocket>(new FakeSocket(link));
    }

    void set_open_ok(bool ok) { std::lock_guard<std::mutex> l(mutex_); open_ok_ = ok; }

    // Links created from now on stall this long in open()
    void set_open_delay_ms(int ms) { std::lock_guard<std::mutex> l(mutex_); open_delay_ms_ = ms; }

    // create() throws for this session from now on
    void refuse(const std::string& session_id) {
        std::lock_guard<std::mutex> l(mutex_);
        refused_.insert(session_id);
    }

    size_t created() const {
        std::lock_guard<std::mutex> l(mutex_);
        return links_.size();
    }

    std::shared_ptr<FakeLink> link(size_t i) const {
        std::lock_guard<std::mutex> l(mutex_);
        return i < links_.size() ? links_[i] : std::shared_ptr<FakeLink>();
    }

    // Newest link for a session
    std::shared_ptr<FakeLink> last(const std::string& session_id = "") const {
        std::lock_guard<std::mutex> l(mutex_);
        for (size_t i = links_.size(); i > 0; --i) {
            if (session_id.empty() || links_[i - 1]->session_id() == session_id) return links_[i - 1];
        }
        return std::shared_ptr<FakeLink>();
    }

private:
    mutable std::mutex mutex_;
    bool open_ok_;
    int open_delay_ms_;
    std::set<std::string> refused_;
    std::vector<std::shared_ptr<FakeLink> > links_;
};

} // namespace testing
} // namespace chatgate

#endif // CHATGATE_TESTS_FAKE_SOCKET_HPP
