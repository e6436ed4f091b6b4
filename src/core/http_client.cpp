#include <chatgate/core/http_client.hpp>
#include <chatgate/core/utils.hpp>
#include <cstdio>
#include <sstream>

namespace chatgate {

Json HttpResponse::json() const {
    if (body.empty()) return Json();
    try {
        return Json::parse(body);
    } catch (const JsonParseError&) {
        return Json();
    }
}

HttpClient::HttpClient() : curl_(curl_easy_init()), timeout_ms_(10000) {}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

void HttpClient::set_timeout(long ms) {
    timeout_ms_ = ms;
}

HttpResponse HttpClient::get(const std::string& url, const HttpHeaders& headers) {
    return perform_request("GET", url, "", headers);
}

HttpResponse HttpClient::post_json(const std::string& url, const Json& body,
                                   const HttpHeaders& extra_headers) {
    return post_raw(url, body.dump(), "application/json", extra_headers);
}

HttpResponse HttpClient::post_raw(const std::string& url, const std::string& body,
                                  const std::string& content_type,
                                  const HttpHeaders& extra_headers) {
    HttpHeaders headers = extra_headers;
    headers["Content-Type"] = content_type;
    return perform_request("POST", url, body, headers);
}

std::string HttpClient::url_encode(const std::string& s) {
    std::string result;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            result += c;
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", static_cast<unsigned char>(c));
            result += buf;
        }
    }
    return result;
}

size_t HttpClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

size_t HttpClient::header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    HttpHeaders* headers = static_cast<HttpHeaders*>(userdata);

    std::string line = rtrim(std::string(buffer, total));
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        (*headers)[to_lower(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return total;
}

HttpResponse HttpClient::perform_request(const std::string& method,
                                         const std::string& url,
                                         const std::string& body,
                                         const HttpHeaders& headers) {
    HttpResponse resp;

    if (!curl_) {
        resp.error = "curl handle unavailable";
        return resp;
    }

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_ / 2);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else if (method != "GET") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
        if (!body.empty()) {
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.data());
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        }
    }

    struct curl_slist* header_list = nullptr;
    for (HttpHeaders::const_iterator it = headers.begin(); it != headers.end(); ++it) {
        std::string header = it->first + ": " + it->second;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    // No "Expect: 100-continue" round trip for webhook bodies
    header_list = curl_slist_append(header_list, "Expect:");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    std::string response_body;
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);

    HttpHeaders response_headers;
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);

    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        resp.error = curl_easy_strerror(res);
        return resp;
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status_code);
    resp.body = response_body;
    resp.headers = response_headers;

    if (!resp.ok()) {
        std::ostringstream oss;
        oss << "HTTP " << resp.status_code;
        if (!resp.body.empty()) {
            oss << ": " << truncate_safe(resp.body, 256);
        }
        resp.error = oss.str();
    }
    return resp;
}

} // namespace chatgate
