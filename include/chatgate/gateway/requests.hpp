/*
 * chatgate - Control plane request decoding
 *
 * Turns HTTP bodies and query strings into the typed requests the session
 * layer understands. Field-level validation stays in Session; these
 * helpers only reject what cannot be decoded.
 */
#ifndef CHATGATE_GATEWAY_REQUESTS_HPP
#define CHATGATE_GATEWAY_REQUESTS_HPP

#include <chatgate/session/registry.hpp>
#include <chatgate/broker/event_broker.hpp>

#include <string>
#include <vector>

namespace chatgate {

const int64_t WAIT_ACK_MAX_MS = 120000;

// Empty body -> {}. Throws invalid_json for malformed or non-object bodies.
Json parse_body(const std::string& body);

// waitAckMs clamped to [0, WAIT_ACK_MAX_MS]
int64_t parse_wait_ack(const Json& body);

ButtonsMessage parse_buttons_message(const Json& body);
ListMessage parse_list_message(const Json& body);
MediaMessage parse_media_message(const Json& body);
PollMessage parse_poll_message(const Json& body);

PatchRequest parse_patch_request(const Json& body);

// "false", "0", "no" and "off" are false; absent keeps def
bool parse_flag(const char* value, bool def);

// {"ids": [...]} -> ids; throws ids_required when empty
std::vector<std::string> parse_id_list(const Json& body);

// Clamped the same way EventBroker::list clamps
int parse_limit(const char* value, int def);

Json error_body(const std::string& code, const std::string& detail);

// Empty key list leaves the control plane open
bool api_key_allowed(const std::vector<std::string>& keys, const std::string& presented);

} // namespace chatgate

#endif // CHATGATE_GATEWAY_REQUESTS_HPP
