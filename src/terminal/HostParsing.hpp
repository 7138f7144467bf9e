#ifndef __OT_HOST_PARSING__
#define __OT_HOST_PARSING__

#include "Headers.hpp"

namespace ot {

// Parsed components of a [user@]host[:port] string
struct ParsedHostString {
  string user;
  string host;
  string portSuffix;  // includes colon, e.g. ":22"
};

// Parse a host string in [user@]host[:port] format
// Handles IPv6 addresses in bracket notation: [::1], [::1]:22, user@[::1]:22
inline ParsedHostString parseHostString(const string& hostString) {
  ParsedHostString result;
  string remaining = hostString;

  size_t atIndex = remaining.rfind("@");
  if (atIndex != string::npos) {
    result.user = remaining.substr(0, atIndex);
    remaining = remaining.substr(atIndex + 1);
  }

  if (!remaining.empty() && remaining[0] == '[') {
    size_t closeBracket = remaining.find(']');
    if (closeBracket != string::npos) {
      result.host = remaining.substr(0, closeBracket + 1);
      if (closeBracket + 1 < remaining.length() &&
          remaining[closeBracket + 1] == ':') {
        result.portSuffix = remaining.substr(closeBracket + 1);
      }
    } else {
      // Malformed: opening bracket without closing, treat as-is
      result.host = remaining;
    }
  } else if (std::count(remaining.begin(), remaining.end(), ':') > 1) {
    // Bare IPv6 address, a port needs brackets
    result.host = remaining;
  } else {
    size_t colonIndex = remaining.find(":");
    if (colonIndex != string::npos) {
      result.portSuffix = remaining.substr(colonIndex);
      remaining = remaining.substr(0, colonIndex);
    }
    result.host = remaining;
  }

  return result;
}

/**
 * @brief Builds the endpoint to dial from a `[user@]host[:port]` argument.
 *
 * The user and port embedded in `hostString` win over the defaults.
 * Brackets around an IPv6 address are removed.
 * @throws std::runtime_error if the host is empty or the port is invalid.
 */
inline TransportEndpoint parseTransportEndpoint(const string& hostString,
                                                const string& defaultUser,
                                                int defaultPort) {
  ParsedHostString parsed = parseHostString(hostString);
  TransportEndpoint endpoint;

  string host = parsed.host;
  if (host.length() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.length() - 2);
  }
  if (host.empty()) {
    throw std::runtime_error("Missing host in " + hostString);
  }
  endpoint.set_name(host);

  int port = defaultPort;
  if (parsed.portSuffix.length() > 1) {
    string portString = parsed.portSuffix.substr(1);
    if (portString.find_first_not_of("0123456789") != string::npos) {
      throw std::runtime_error("Invalid port: " + portString);
    }
    port = stoi(portString);
  }
  if (port <= 0 || port > 65535) {
    throw std::runtime_error("Invalid port: " + to_string(port));
  }
  endpoint.set_port(port);

  endpoint.set_principal(parsed.user.empty() ? defaultUser : parsed.user);
  return endpoint;
}

}  // namespace ot

#endif  // __OT_HOST_PARSING__
