#ifndef CHATGATE_TESTS_FAKE_TRANSPORT_HPP
#define CHATGATE_TESTS_FAKE_TRANSPORT_HPP

#include <chatgate/webhook/dispatcher.hpp>

#include <deque>
#include <vector>
#include <mutex>

namespace chatgate {
namespace testing {

struct RecordedPost {
    std::string url;
    std::string body;
    HttpHeaders headers;
};

// Answers posts from a script of status codes; 200 once the script runs out
class FakeTransport : public WebhookTransport {
public:
    HttpResponse post(const std::string& url, const std::string& body, const HttpHeaders& headers) {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordedPost p;
        p.url = url;
        p.body = body;
        p.headers = headers;
        posts_.push_back(p);

        HttpResponse resp;
        resp.status_code = 200;
        if (!script_.empty()) {
            resp.status_code = script_.front();
            script_.pop_front();
        }
        if (resp.status_code == 0) {
            resp.error = "connection refused";
        } else if (!resp.ok()) {
            resp.body = "{\"error\":\"unavailable\"}";
        }
        return resp;
    }

    void respond(long status) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(status);
    }

    std::vector<RecordedPost> posts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return posts_;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return posts_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<long> script_;
    std::vector<RecordedPost> posts_;
};

} // namespace testing
} // namespace chatgate

#endif // CHATGATE_TESTS_FAKE_TRANSPORT_HPP
