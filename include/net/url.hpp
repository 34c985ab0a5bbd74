#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <optional>
#include <string>

namespace URL {

struct UrlParts {
  std::string scheme;
  std::string host;
  std::string port;
  std::string target;
};

// Accepts http://host[:port][/path] and https://host[:port][/path]. The
// target never ends with '/' unless it is the root, so command paths can be
// appended directly.
inline std::optional<UrlParts> ParseHttpUrl(const std::string &url) {
  std::string scheme;
  std::string rest;
  if (boost::algorithm::istarts_with(url, "http://")) {
    scheme = "http";
    rest = url.substr(7);
  } else if (boost::algorithm::istarts_with(url, "https://")) {
    scheme = "https";
    rest = url.substr(8);
  } else {
    return std::nullopt;
  }
  auto slash = rest.find('/');
  std::string hostport =
      slash == std::string::npos ? rest : rest.substr(0, slash);
  std::string target = slash == std::string::npos ? "" : rest.substr(slash);
  while (!target.empty() && target.back() == '/') {
    target.pop_back();
  }
  std::string host = hostport;
  std::string port = scheme == "https" ? "443" : "80";
  auto colon = hostport.find(':');
  if (colon != std::string::npos) {
    host = hostport.substr(0, colon);
    port = hostport.substr(colon + 1);
  }
  if (host.empty() || port.empty()) {
    return std::nullopt;
  }
  return UrlParts{
      .scheme = scheme, .host = host, .port = port, .target = target};
}

} // namespace URL
