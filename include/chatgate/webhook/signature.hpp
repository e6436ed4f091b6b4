#ifndef CHATGATE_WEBHOOK_SIGNATURE_HPP
#define CHATGATE_WEBHOOK_SIGNATURE_HPP

#include <string>

namespace chatgate {

// Header carrying the body signature on outbound and inbound webhooks
extern const char* const SIGNATURE_HEADER;

// "sha256=" followed by the lowercase hex HMAC-SHA256 of body under secret
std::string sign_body(const std::string& secret, const std::string& body);

enum class SignatureCheck {
    VALID,
    SKIPPED,        // no secret configured
    MISSING,
    MALFORMED,
    MISMATCH
};

const char* signature_check_str(SignatureCheck check);

// Verifies header against body. The comparison is constant-time.
SignatureCheck check_signature(const std::string& secret, const std::string& body,
                               const std::string& header);

// VALID or SKIPPED
bool verify_signature(const std::string& secret, const std::string& body,
                      const std::string& header);

} // namespace chatgate

#endif // CHATGATE_WEBHOOK_SIGNATURE_HPP
