#include "mws/handshake.hpp"

#include "mws/crypto.hpp"

#include <cctype>

namespace mws {
namespace ws {

namespace {

constexpr std::string_view kKeyHeader = "Sec-WebSocket-Key";

bool iequals_prefix(std::string_view line, std::string_view prefix) {
  if (line.size() < prefix.size())
    return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(line[i])) != std::tolower(static_cast<unsigned char>(prefix[i])))
      return false;
  }
  return true;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
    s.remove_suffix(1);
  return s;
}

}  // namespace

optional<std::string> find_client_key(std::string_view request) {
  size_t pos = 0;
  while (pos < request.size()) {
    size_t eol = request.find('\n', pos);
    std::string_view line = request.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
    pos = (eol == std::string_view::npos) ? request.size() : eol + 1;

    if (!iequals_prefix(line, kKeyHeader))
      continue;

    // Header name must be followed by optional whitespace and a colon
    std::string_view rest = trim(line.substr(kKeyHeader.size()));
    if (rest.empty() || rest.front() != ':')
      continue;

    std::string_view value = trim(rest.substr(1));
    if (value.empty())
      return optional<std::string>();
    return optional<std::string>(std::string(value));
  }
  return optional<std::string>();
}

std::string generate_accept_key(std::string_view client_key) {
  std::string key(client_key);
  key.append(kAcceptGuid);

  auto hash = SHA1::compute(key);
  return Base64::encode(hash.data(), hash.size());
}

std::string build_upgrade_response(std::string_view accept_key) {
  std::string response;
  response.reserve(160);
  response.append(
      "HTTP/1.1 101 Switching Protocols\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Accept: ");
  response.append(accept_key);
  response.append("\r\n\r\n");
  return response;
}

expected<std::string, ErrorCode> process_handshake(std::string_view request) {
  optional<std::string> key = find_client_key(request);
  if (!key.has_value())
    return expected<std::string, ErrorCode>::error(ErrorCode::kHandshakeFailed);

  return expected<std::string, ErrorCode>::success(build_upgrade_response(generate_accept_key(key.value())));
}

}  // namespace ws
}  // namespace mws
