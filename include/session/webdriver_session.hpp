#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <chrono>
#include <expected>
#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "logging/log.hpp"
#include "net/http_ops.hpp"
#include "net/url.hpp"
#include "session/remote_session.hpp"

namespace session {

namespace net = boost::asio;
namespace ssl = net::ssl;
namespace beast = boost::beast;
namespace http = beast::http;
namespace pt = boost::property_tree;
using tcp = net::ip::tcp;

// W3C WebDriver wire format helpers
namespace webdriver {

inline constexpr const char *kElementKey =
    "element-6066-11e4-a52e-4f735466cecf";

// Flat JSON object of string members.
inline std::string
JsonObject(std::initializer_list<std::pair<std::string, std::string>> members) {
  if (members.size() == 0) {
    return "{}";
  }
  pt::ptree tree;
  for (const auto &[key, value] : members) {
    tree.put_child(pt::ptree::path_type(key, '\0'), pt::ptree(value));
  }
  std::ostringstream oss;
  pt::write_json(oss, tree, false);
  return oss.str();
}

// XPath 1.0 string literal for `s`. XPath has no escapes, so a string holding
// both quote kinds is spliced together with concat().
inline std::string XPathLiteral(const std::string &s) {
  if (s.find('"') == std::string::npos) {
    return "\"" + s + "\"";
  }
  if (s.find('\'') == std::string::npos) {
    return "'" + s + "'";
  }
  std::string out = "concat(";
  std::string::size_type start = 0;
  for (;;) {
    const auto quote = s.find('"', start);
    if (quote != start) {
      out += "\"" + s.substr(start, quote - start) + "\",";
    }
    if (quote == std::string::npos) {
      break;
    }
    out += "'\"',";
    start = quote + 1;
    if (start == s.size()) {
      break;
    }
  }
  out.back() = ')';
  return out;
}

inline std::string OptionByValue(const std::string &value) {
  return ".//option[@value=" + XPathLiteral(value) + "]";
}

inline std::string OptionByText(const std::string &text) {
  return ".//option[normalize-space(.)=" + XPathLiteral(text) + "]";
}

inline std::string NewSessionBody(const std::string &browser,
                                  const std::vector<std::string> &args) {
  pt::ptree argList;
  for (const auto &a : args) {
    argList.push_back({"", pt::ptree(a)});
  }
  pt::ptree options;
  options.add_child("args", argList);
  pt::ptree alwaysMatch;
  alwaysMatch.put("browserName", browser);
  alwaysMatch.add_child(pt::ptree::path_type("goog:chromeOptions", '\0'),
                        options);
  pt::ptree caps;
  caps.add_child("alwaysMatch", alwaysMatch);
  pt::ptree root;
  root.add_child("capabilities", caps);
  std::ostringstream oss;
  pt::write_json(oss, root, false);
  return oss.str();
}

struct Reply {
  unsigned status = 0;
  pt::ptree value;

  // W3C error code ("no such element", ...) when the command failed.
  std::optional<std::string> Error() const {
    if (status < 400) {
      return std::nullopt;
    }
    return value.get<std::string>("error", "http status " +
                                               std::to_string(status));
  }

  std::string Message() const { return value.get<std::string>("message", ""); }
};

inline Reply ParseReply(unsigned status, const std::string &body) {
  Reply reply;
  reply.status = status;
  if (body.empty()) {
    return reply;
  }
  pt::ptree root;
  std::istringstream iss(body);
  try {
    pt::read_json(iss, root);
  } catch (const pt::json_parser_error &e) {
    throw SessionError(std::string("malformed webdriver reply: ") + e.what());
  }
  if (auto v = root.get_child_optional("value")) {
    reply.value = *v;
  }
  return reply;
}

inline ElementHandle ElementFrom(const Reply &reply) {
  auto id = reply.value.get_optional<std::string>(
      pt::ptree::path_type(kElementKey, '\0'));
  if (!id || id->empty()) {
    throw SessionError("webdriver reply carries no element reference");
  }
  return ElementHandle{*id};
}

} // namespace webdriver

// WebDriverSession
// Blocking client for one browser session behind a WebDriver endpoint
// (chromedriver, a Selenium grid). One short-lived connection per command;
// https endpoints use TLS with SNI and peer verification.
class WebDriverSession : public IRemoteSession {
public:
  static constexpr const char *kComponent = "webdriver";

  WebDriverSession(URL::UrlParts endpoint, std::string sessionId,
                   std::chrono::milliseconds timeout)
      : endpoint_(std::move(endpoint)), session_id_(std::move(sessionId)),
        timeout_(timeout) {}

  // POST /session
  static std::unique_ptr<WebDriverSession>
  Create(const URL::UrlParts &endpoint, const std::vector<std::string> &args,
         std::chrono::milliseconds timeout) {
    auto reply = Send(endpoint, timeout, http::verb::post,
                      endpoint.target + "/session",
                      webdriver::NewSessionBody("chrome", args));
    if (auto err = reply.Error()) {
      throw SessionError("new session: " + *err + " " + reply.Message());
    }
    auto id = reply.value.get<std::string>("sessionId", "");
    if (id.empty()) {
      throw SessionError("new session: no session id in reply");
    }
    RESYNC_LOG_INFO(kComponent, "session " << id << " created");
    return std::make_unique<WebDriverSession>(endpoint, std::move(id), timeout);
  }

  const std::string &SessionId() const { return session_id_; }

  void Navigate(const std::string &url) override {
    Expect("navigate", Command(http::verb::post, "/url",
                               webdriver::JsonObject({{"url", url}})));
  }

  std::optional<ElementHandle>
  FindElement(const std::string &selector) override {
    auto reply = Command(http::verb::post, "/element",
                         webdriver::JsonObject({{"using", "css selector"},
                                                {"value", selector}}));
    if (auto err = reply.Error()) {
      if (*err == "no such element") {
        return std::nullopt;
      }
      throw SessionError("find " + selector + ": " + *err + " " +
                         reply.Message());
    }
    return webdriver::ElementFrom(reply);
  }

  void SendKeys(const ElementHandle &element,
                const std::string &text) override {
    Expect("send keys",
           Command(http::verb::post, "/element/" + element.id + "/value",
                   webdriver::JsonObject({{"text", text}})));
  }

  void Click(const ElementHandle &element) override {
    Expect("click", Command(http::verb::post,
                            "/element/" + element.id + "/click", "{}"));
  }

  void SelectOption(const ElementHandle &element,
                    const std::string &value) override {
    ClickOption(element, webdriver::OptionByValue(value), value);
  }

  void SelectOptionByText(const ElementHandle &element,
                          const std::string &text) override {
    ClickOption(element, webdriver::OptionByText(text), text);
  }

  void Dispose() override {
    Expect("delete session", Command(http::verb::delete_, "", ""));
    RESYNC_LOG_INFO(kComponent, "session " << session_id_ << " deleted");
  }

private:
  // Finds the option below `element` by XPath and clicks it.
  void ClickOption(const ElementHandle &element, const std::string &xpath,
                   const std::string &what) {
    auto reply = Command(http::verb::post, "/element/" + element.id + "/element",
                         webdriver::JsonObject({{"using", "xpath"},
                                                {"value", xpath}}));
    if (auto err = reply.Error()) {
      if (*err == "no such element") {
        throw ElementNotFound(xpath);
      }
      throw SessionError("select " + what + ": " + *err);
    }
    Click(webdriver::ElementFrom(reply));
  }

  webdriver::Reply Command(http::verb verb, const std::string &path,
                           const std::string &body) {
    return Send(endpoint_, timeout_, verb,
                endpoint_.target + "/session/" + session_id_ + path, body);
  }

  static void Expect(const char *what, const webdriver::Reply &reply) {
    if (auto err = reply.Error()) {
      throw SessionError(std::string(what) + ": " + *err + " " +
                         reply.Message());
    }
  }

  static webdriver::Reply Send(const URL::UrlParts &endpoint,
                               std::chrono::milliseconds timeout,
                               http::verb verb, const std::string &target,
                               const std::string &body) {
    http::request<http::string_body> req{verb, target.empty() ? "/" : target,
                                         11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, "resync/0.1");
    if (verb != http::verb::get && verb != http::verb::delete_) {
      req.set(http::field::content_type, "application/json; charset=utf-8");
      req.body() = body;
    }
    req.prepare_payload();

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    auto results = httpops::Resolve(resolver, endpoint.host, endpoint.port);
    if (!results) {
      throw SessionError("resolve " + endpoint.host + ": " +
                         results.error().message());
    }

    std::expected<httpops::Response, beast::error_code> res;
    if (endpoint.scheme == "https") {
      ssl::context ssl_ctx(ssl::context::tls_client);
      ssl_ctx.set_default_verify_paths();
      ssl_ctx.set_verify_mode(ssl::verify_peer);
      beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx);
      beast::get_lowest_layer(stream).expires_after(timeout);
      if (auto st = httpops::Connect(beast::get_lowest_layer(stream), *results);
          !st) {
        throw SessionError("connect: " + st.error().message());
      }
      if (auto st = httpops::SetSni(stream, endpoint.host); !st) {
        throw SessionError("sni: " + st.error().message());
      }
      if (auto st = httpops::TlsHandshake(stream); !st) {
        throw SessionError("tls handshake: " + st.error().message());
      }
      res = httpops::Exchange(stream, req);
    } else {
      beast::tcp_stream stream(ioc);
      stream.expires_after(timeout);
      if (auto st = httpops::Connect(stream, *results); !st) {
        throw SessionError("connect: " + st.error().message());
      }
      res = httpops::Exchange(stream, req);
    }
    if (!res) {
      const auto method = http::to_string(verb);
      throw SessionError(std::string(method.data(), method.size()) + " " +
                         target + ": " + res.error().message());
    }
    return webdriver::ParseReply(res->status, res->body);
  }

  URL::UrlParts endpoint_;
  std::string session_id_;
  std::chrono::milliseconds timeout_;
};

class WebDriverSessionFactory : public ISessionFactory {
public:
  WebDriverSessionFactory(URL::UrlParts endpoint, bool headless,
                          std::chrono::milliseconds timeout =
                              std::chrono::seconds(60))
      : endpoint_(std::move(endpoint)), headless_(headless),
        timeout_(timeout) {}

  std::unique_ptr<IRemoteSession> Create() override {
    std::vector<std::string> args{"--disable-logging", "--disable-extensions",
                                  "--no-sandbox", "--disable-gpu",
                                  "--disable-dev-shm-usage", "--log-level=3"};
    if (headless_) {
      args.emplace_back("--headless");
    }
    return WebDriverSession::Create(endpoint_, args, timeout_);
  }

private:
  URL::UrlParts endpoint_;
  bool headless_;
  std::chrono::milliseconds timeout_;
};

} // namespace session
