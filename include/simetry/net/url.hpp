#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <optional>
#include <string>
#include <utility>

namespace simetry::url {

struct HttpUrl {
  std::string host;
  std::string port;
  std::string target;
};

struct UdpEndpoint {
  std::string host;
  std::string port;
};

namespace detail {

// Splits "host[:port]" keeping default_port when no port is given.
inline std::optional<std::pair<std::string, std::string>>
SplitHostPort(const std::string &hostport, const std::string &default_port) {
  std::string host = hostport;
  std::string port = default_port;
  auto colon = hostport.rfind(':');
  if (colon != std::string::npos) {
    host = hostport.substr(0, colon);
    port = hostport.substr(colon + 1);
  }
  if (host.empty() || port.empty() ||
      port.find_first_not_of("0123456789") != std::string::npos ||
      port.size() > 5 || std::stoul(port) > 65535) {
    return std::nullopt;
  }
  return std::make_pair(host, port);
}

} // namespace detail

// http://host[:port][/path]
inline std::optional<HttpUrl> ParseHttpUrl(const std::string &url) {
  if (!boost::algorithm::istarts_with(url, "http://")) {
    return std::nullopt;
  }
  std::string rest = url.substr(7);
  auto slash = rest.find('/');
  std::string hostport =
      slash == std::string::npos ? rest : rest.substr(0, slash);
  std::string target = slash == std::string::npos ? "/" : rest.substr(slash);
  auto hp = detail::SplitHostPort(hostport, "80");
  if (!hp) {
    return std::nullopt;
  }
  return HttpUrl{.host = hp->first, .port = hp->second, .target = target};
}

// host:port, optionally prefixed with udp://
inline std::optional<UdpEndpoint> ParseUdpEndpoint(const std::string &url) {
  std::string rest = url;
  if (boost::algorithm::istarts_with(rest, "udp://")) {
    rest = rest.substr(6);
  }
  if (rest.find(':') == std::string::npos) {
    return std::nullopt;
  }
  auto hp = detail::SplitHostPort(rest, "");
  if (!hp) {
    return std::nullopt;
  }
  return UdpEndpoint{.host = hp->first, .port = hp->second};
}

} // namespace simetry::url
