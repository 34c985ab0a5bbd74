#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <expected>
#include <openssl/err.h>
#include <string>

// namespace httpops: blocking HTTP/1.1 request/response steps over a plain
// or TLS stream. Each step reports its error as a value.
namespace httpops {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

using Status = std::expected<void, beast::error_code>;

inline Status MakeStatus(const beast::error_code &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

inline std::expected<tcp::resolver::results_type, beast::error_code>
Resolve(tcp::resolver &resolver, const std::string &host,
        const std::string &port) {
  beast::error_code ec;
  auto r = resolver.resolve(host, port, ec);
  if (ec)
    return std::unexpected(ec);
  return r;
}

inline Status Connect(beast::tcp_stream &stream,
                      const tcp::resolver::results_type &endpoints) {
  beast::error_code ec;
  stream.connect(endpoints, ec);
  return MakeStatus(ec);
}

template <typename SslLayer>
inline Status SetSni(SslLayer &ssl, const std::string &host) {
  if (!SSL_set_tlsext_host_name(ssl.native_handle(), host.c_str())) {
    beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()),
                             net::error::get_ssl_category());
    return std::unexpected(ssl_ec);
  }
  return {};
}

inline Status TlsHandshake(beast::ssl_stream<beast::tcp_stream> &ssl) {
  beast::error_code ec;
  ssl.handshake(net::ssl::stream_base::client, ec);
  return MakeStatus(ec);
}

struct Response {
  unsigned status = 0;
  std::string body;
};

template <typename Stream>
inline std::expected<Response, beast::error_code>
Exchange(Stream &stream, http::request<http::string_body> &req) {
  beast::error_code ec;
  http::write(stream, req, ec);
  if (ec) {
    return std::unexpected(ec);
  }
  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res, ec);
  if (ec) {
    return std::unexpected(ec);
  }
  return Response{.status = res.result_int(), .body = std::move(res.body())};
}

} // namespace httpops
