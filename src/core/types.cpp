#include <chatgate/core/types.hpp>
#include <chatgate/core/utils.hpp>
#include <cstdlib>
#include <cctype>

namespace chatgate {

const char* error_kind_str(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:   return "validation";
        case ErrorKind::UNAUTHORIZED: return "unauthorized";
        case ErrorKind::NOT_FOUND:    return "not_found";
        case ErrorKind::CONFLICT:     return "conflict";
        case ErrorKind::RATE_LIMITED: return "rate_limited";
        case ErrorKind::UNAVAILABLE:  return "unavailable";
        case ErrorKind::INTERNAL:     return "internal";
    }
    return "internal";
}

int error_kind_http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:   return 400;
        case ErrorKind::UNAUTHORIZED: return 401;
        case ErrorKind::NOT_FOUND:    return 404;
        case ErrorKind::CONFLICT:     return 409;
        case ErrorKind::RATE_LIMITED: return 429;
        case ErrorKind::UNAVAILABLE:  return 503;
        case ErrorKind::INTERNAL:     return 500;
    }
    return 500;
}

const char* connection_state_str(ConnectionState s) {
    switch (s) {
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::OPEN:       return "open";
        case ConnectionState::CLOSE:      return "close";
        case ConnectionState::QR_TIMEOUT: return "qr_timeout";
    }
    return "close";
}

namespace message_status {

int parse(const std::string& text) {
    std::string t = to_upper(trim(text));
    if (t.empty()) return -1;

    bool numeric = true;
    for (size_t i = 0; i < t.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(t[i]))) {
            numeric = false;
            break;
        }
    }
    if (numeric) {
        int v = std::atoi(t.c_str());
        return v <= PLAYED ? v : -1;
    }

    if (t == "ERROR" || t == "FAILED") return FAILED;
    if (t == "PENDING" || t == "QUEUED" || t == "SENT") return PENDING;
    if (t == "SERVER_ACK" || t == "ACK") return SERVER_ACK;
    if (t == "DELIVERY_ACK" || t == "DELIVERED") return DELIVERED;
    if (t == "READ") return READ;
    if (t == "PLAYED") return PLAYED;
    return -1;
}

} // namespace message_status

} // namespace chatgate
