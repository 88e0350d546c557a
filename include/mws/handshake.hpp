#ifndef MWS_HANDSHAKE_HPP_
#define MWS_HANDSHAKE_HPP_

#include "vocabulary.hpp"

#include <string>
#include <string_view>

namespace mws {
namespace ws {

constexpr std::string_view kAcceptGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

// Sent in place of the upgrade response when the request carries no key
constexpr std::string_view kRejectResponse = "HTTP/1.1 400 Bad Request\r\n\r\n";

// Find the Sec-WebSocket-Key header line (name matched case-insensitively)
// and return its trimmed value. Empty optional if absent or blank.
optional<std::string> find_client_key(std::string_view request);

// base64(sha1(client_key + kAcceptGuid))
std::string generate_accept_key(std::string_view client_key);

std::string build_upgrade_response(std::string_view accept_key);

/**
 * @brief Run the opening handshake over a raw HTTP upgrade request.
 *
 * Nothing but the key header is inspected. Returns the 101 response bytes to
 * write back, or error(kHandshakeFailed) when the key is missing, in which
 * case the caller answers with kRejectResponse.
 */
expected<std::string, ErrorCode> process_handshake(std::string_view request);

}  // namespace ws
}  // namespace mws

#endif  // MWS_HANDSHAKE_HPP_
