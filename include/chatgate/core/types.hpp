#ifndef CHATGATE_CORE_TYPES_HPP
#define CHATGATE_CORE_TYPES_HPP

#include <string>
#include <stdexcept>
#include <cstdint>

namespace chatgate {

// ============ Errors ============

enum class ErrorKind {
    VALIDATION,     // 400: bad recipient, empty text, malformed options
    UNAUTHORIZED,   // 401: missing api key, bad webhook signature
    NOT_FOUND,      // 404: unknown session or message
    CONFLICT,       // 409: session id already taken
    RATE_LIMITED,   // 429: send window exhausted
    UNAVAILABLE,    // 503: socket not open, send queue full
    INTERNAL        // 500: persistence or unexpected failures
};

const char* error_kind_str(ErrorKind kind);
int error_kind_http_status(ErrorKind kind);

// Thrown by caller-facing operations. `code` is the stable machine string
// clients match on ("instance_exists", "rate_limit_exceeded", ...).
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& code, const std::string& detail = "")
        : std::runtime_error(detail.empty() ? code : detail)
        , kind_(kind)
        , code_(code) {}

    ErrorKind kind() const { return kind_; }
    const std::string& code() const { return code_; }

private:
    ErrorKind kind_;
    std::string code_;
};

// ============ Socket results ============

struct SendResult {
    bool success;
    std::string message_id;
    std::string error;

    SendResult() : success(false) {}

    static SendResult ok(const std::string& msg_id) {
        SendResult r;
        r.success = true;
        r.message_id = msg_id;
        return r;
    }

    static SendResult fail(const std::string& err) {
        SendResult r;
        r.error = err;
        return r;
    }
};

// ============ Connection state ============

enum class ConnectionState {
    CONNECTING,
    OPEN,
    CLOSE,
    QR_TIMEOUT
};

const char* connection_state_str(ConnectionState s);

// ============ Delivery status ladder ============

// Bit-exact codes consumed by clients
namespace message_status {
    const int FAILED = 0;
    const int PENDING = 1;
    const int SERVER_ACK = 2;
    const int DELIVERED = 3;
    const int READ = 4;
    const int PLAYED = 5;

    inline bool is_terminal(int status) { return status == FAILED || status >= DELIVERED; }

    // Accepts "3", "DELIVERY_ACK", "read", ...; returns -1 when unknown
    int parse(const std::string& text);
}

} // namespace chatgate

#endif // CHATGATE_CORE_TYPES_HPP
