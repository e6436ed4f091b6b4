#include <chatgate/webhook/signature.hpp>
#include <chatgate/core/utils.hpp>

#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <cctype>

namespace chatgate {

const char* const SIGNATURE_HEADER = "X-Signature-256";

namespace {

const char SCHEME_PREFIX[] = "sha256=";

bool is_hex_digest(const std::string& s) {
    if (s.size() != 64) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

} // namespace

std::string sign_body(const std::string& secret, const std::string& body) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_sha256(),
         secret.data(), static_cast<int>(secret.size()),
         reinterpret_cast<const unsigned char*>(body.data()), body.size(),
         digest, &digest_len);

    return std::string(SCHEME_PREFIX) + hex_encode(digest, digest_len);
}

const char* signature_check_str(SignatureCheck check) {
    switch (check) {
        case SignatureCheck::VALID:     return "valid";
        case SignatureCheck::SKIPPED:   return "skipped";
        case SignatureCheck::MISSING:   return "missing";
        case SignatureCheck::MALFORMED: return "malformed";
        case SignatureCheck::MISMATCH:  return "mismatch";
    }
    return "mismatch";
}

SignatureCheck check_signature(const std::string& secret, const std::string& body,
                               const std::string& header) {
    if (secret.empty()) return SignatureCheck::SKIPPED;

    std::string provided = trim(header);
    if (provided.empty()) return SignatureCheck::MISSING;

    if (!starts_with(to_lower(provided), SCHEME_PREFIX)) return SignatureCheck::MALFORMED;
    std::string digest = to_lower(provided.substr(sizeof(SCHEME_PREFIX) - 1));
    if (!is_hex_digest(digest)) return SignatureCheck::MALFORMED;

    std::string expected = sign_body(secret, body);
    if (!constant_time_equals(expected, std::string(SCHEME_PREFIX) + digest)) {
        return SignatureCheck::MISMATCH;
    }
    return SignatureCheck::VALID;
}

bool verify_signature(const std::string& secret, const std::string& body,
                      const std::string& header) {
    SignatureCheck check = check_signature(secret, body, header);
    return check == SignatureCheck::VALID || check == SignatureCheck::SKIPPED;
}

} // namespace chatgate
