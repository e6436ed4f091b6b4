#ifndef CHATGATE_CORE_HTTP_CLIENT_HPP
#define CHATGATE_CORE_HTTP_CLIENT_HPP

#include "json.hpp"
#include <string>
#include <map>
#include <curl/curl.h>

namespace chatgate {

typedef std::map<std::string, std::string> HttpHeaders;

struct HttpResponse {
    long status_code;          // 0 when no response was received
    std::string body;
    HttpHeaders headers;
    std::string error;

    HttpResponse() : status_code(0) {}

    bool ok() const { return status_code >= 200 && status_code < 300; }

    // Null when the body is not JSON
    Json json() const;
};

// Blocking HTTP client over one libcurl easy handle.
// One instance per thread; the handle is reset before every request.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void set_timeout(long ms);

    HttpResponse get(const std::string& url, const HttpHeaders& headers = HttpHeaders());

    HttpResponse post_json(const std::string& url, const Json& body,
                           const HttpHeaders& extra_headers = HttpHeaders());

    // Sends body byte-for-byte (signed payloads depend on it)
    HttpResponse post_raw(const std::string& url, const std::string& body,
                          const std::string& content_type,
                          const HttpHeaders& extra_headers = HttpHeaders());

    static std::string url_encode(const std::string& s);

private:
    CURL* curl_;
    long timeout_ms_;

    HttpResponse perform_request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const HttpHeaders& headers);

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace chatgate

#endif // CHATGATE_CORE_HTTP_CLIENT_HPP
