#pragma once

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <string>

// namespace netops: thin expected-returning wrappers over the Asio/Beast
// operations used by the sim backends. All async variants suspend the calling
// coroutine; none of them throw on I/O errors.
namespace simetry::netops {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;
using udp = net::ip::udp;

using Status = std::expected<void, beast::error_code>;
using HttpResponse = http::response<http::string_body>;

inline Status MakeStatus(const beast::error_code &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

inline std::expected<tcp::resolver::results_type, beast::error_code>
AsyncResolve(tcp::resolver &resolver, const std::string &host,
             const std::string &port, net::yield_context yield) {
  beast::error_code ec;
  auto r = resolver.async_resolve(host, port, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  return r;
}

inline Status AsyncConnect(beast::tcp_stream &stream,
                           const tcp::resolver::results_type &endpoints,
                           std::chrono::steady_clock::duration timeout,
                           net::yield_context yield) {
  beast::error_code ec;
  stream.expires_after(timeout);
  stream.async_connect(endpoints, yield[ec]);
  return MakeStatus(ec);
}

inline void SetTcpNoDelay(beast::tcp_stream &stream) {
  beast::error_code ec;
  stream.socket().set_option(tcp::no_delay(true), ec);
  (void)ec;
}

// GET target over an established keep-alive connection. Non-2xx answers are
// reported as errc::protocol_error.
inline std::expected<HttpResponse, beast::error_code>
AsyncHttpGet(beast::tcp_stream &stream, beast::flat_buffer &buffer,
             const std::string &host, const std::string &target,
             std::chrono::steady_clock::duration timeout,
             net::yield_context yield) {
  http::request<http::empty_body> req{http::verb::get, target, 11};
  req.set(http::field::host, host);
  req.set(http::field::user_agent, "simetry/0.1");
  req.set(http::field::accept, "application/json");
  req.keep_alive(true);

  beast::error_code ec;
  stream.expires_after(timeout);
  http::async_write(stream, req, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  HttpResponse res;
  http::async_read(stream, buffer, res, yield[ec]);
  stream.expires_never();
  if (ec) {
    return std::unexpected(ec);
  }
  if (res.result_int() < 200 || res.result_int() >= 300) {
    return std::unexpected(
        boost::system::errc::make_error_code(boost::system::errc::protocol_error));
  }
  return res;
}

inline std::expected<udp::endpoint, beast::error_code>
AsyncResolveUdp(udp::resolver &resolver, const std::string &host,
                const std::string &port, net::yield_context yield) {
  beast::error_code ec;
  auto r = resolver.async_resolve(host, port, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  if (r.empty()) {
    return std::unexpected(net::error::make_error_code(net::error::host_not_found));
  }
  return r.begin()->endpoint();
}

// Opens and binds a datagram socket for listening on endpoint.
inline Status BindUdp(udp::socket &socket, const udp::endpoint &endpoint) {
  beast::error_code ec;
  socket.open(endpoint.protocol(), ec);
  if (ec) {
    return std::unexpected(ec);
  }
  socket.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec) {
    socket.bind(endpoint, ec);
  }
  if (ec) {
    beast::error_code ignored;
    socket.close(ignored);
    return std::unexpected(ec);
  }
  return {};
}

inline std::expected<std::size_t, beast::error_code>
AsyncReceive(udp::socket &socket, net::mutable_buffer buffer,
             net::yield_context yield) {
  beast::error_code ec;
  std::size_t n = socket.async_receive(buffer, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  return n;
}

// AsyncReceive bounded by timeout; expiry is reported as error::timed_out.
inline std::expected<std::size_t, beast::error_code>
AsyncReceiveFor(udp::socket &socket, net::mutable_buffer buffer,
                std::chrono::steady_clock::duration timeout,
                net::yield_context yield) {
  struct State {
    bool expired = false;
    bool done = false;
  };
  auto state = std::make_shared<State>();
  net::steady_timer timer(socket.get_executor());
  timer.expires_after(timeout);
  timer.async_wait([&socket, state](const beast::error_code &ec) {
    if (!ec && !state->done) {
      state->expired = true;
      beast::error_code ignored;
      socket.cancel(ignored);
    }
  });
  auto n = AsyncReceive(socket, buffer, yield);
  state->done = true;
  timer.cancel();
  if (!n && state->expired) {
    return std::unexpected(net::error::make_error_code(net::error::timed_out));
  }
  return n;
}

} // namespace simetry::netops
