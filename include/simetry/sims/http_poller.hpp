#pragma once

#include "simetry/core/connector.hpp"
#include "simetry/core/simetry.hpp"
#include "simetry/logging/log.hpp"
#include "simetry/net/net_ops.hpp"
#include "simetry/net/url.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <algorithm>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace simetry::sims {

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

inline constexpr std::chrono::milliseconds kHttpPollInterval{16};
inline constexpr std::chrono::seconds kHttpRequestTimeout{2};
inline constexpr int kHttpMaxConsecutiveFailures = 3;

// HttpPoller: one keep-alive HTTP connection GETting a fixed URL.
// The connection is (re)established lazily by Get; any error closes it so the
// next Get starts over. Interrupt aborts a suspended Get for good.
class HttpPoller {
public:
  HttpPoller(net::io_context &ioc, url::HttpUrl url)
      : ioc_(ioc), url_(std::move(url)), resolver_(ioc) {}

  std::expected<std::string, beast::error_code> Get(net::yield_context yield) {
    if (interrupted_) {
      return std::unexpected(net::error::make_error_code(net::error::operation_aborted));
    }
    if (!stream_) {
      if (auto st = Open(yield); !st) {
        Close();
        return std::unexpected(st.error());
      }
    }
    auto res = netops::AsyncHttpGet(*stream_, buffer_, url_.host, url_.target,
                                    kHttpRequestTimeout, yield);
    if (!res) {
      Close();
      return std::unexpected(res.error());
    }
    if (!res->keep_alive()) {
      Close();
    }
    return std::move(res->body());
  }

  void Close() {
    if (stream_) {
      beast::error_code ec;
      stream_->socket().shutdown(tcp::socket::shutdown_both, ec);
      stream_->close();
      stream_.reset();
    }
    buffer_.clear();
  }

  // Cancels pending operations without destroying the stream; the resumed
  // Get releases it.
  void Interrupt() {
    interrupted_ = true;
    resolver_.cancel();
    if (stream_) {
      stream_->close();
    }
  }

  ~HttpPoller() { Close(); }

private:
  netops::Status Open(net::yield_context yield) {
    auto endpoints = netops::AsyncResolve(resolver_, url_.host, url_.port, yield);
    if (!endpoints) {
      return std::unexpected(endpoints.error());
    }
    if (interrupted_) {
      return std::unexpected(net::error::make_error_code(net::error::operation_aborted));
    }
    stream_.emplace(ioc_);
    if (auto st = netops::AsyncConnect(*stream_, *endpoints,
                                       kHttpRequestTimeout, yield);
        !st) {
      return st;
    }
    netops::SetTcpNoDelay(*stream_);
    return {};
  }

  net::io_context &ioc_;
  url::HttpUrl url_;
  tcp::resolver resolver_;
  std::optional<beast::tcp_stream> stream_;
  beast::flat_buffer buffer_;
  bool interrupted_ = false;
};

// Result of decoding one polled document: a moment, nullptr when the document
// says the sim is gone, or an error for a malformed body.
using DecodeResult = std::expected<std::unique_ptr<Moment>, std::string>;

// HttpPollingClient
// Threading model:
// - Lives on the io_context of the race that produced it
// - ReadMoment waits for the next poll slot (kHttpPollInterval) and GETs the
//   document; up to kHttpMaxConsecutiveFailures transient failures are retried
//   with a fresh connection before the session ends
class HttpPollingClient : public Simetry {
public:
  std::string_view Name() const override { return name_; }

protected:
  HttpPollingClient(net::io_context &ioc, std::unique_ptr<HttpPoller> poller,
                    std::string name, std::string log_tag)
      : poller_(std::move(poller)), name_(std::move(name)),
        log_tag_(std::move(log_tag)), timer_(ioc),
        next_poll_(std::chrono::steady_clock::now()) {}

  virtual DecodeResult Decode(const std::string &body) const = 0;

  std::unique_ptr<Moment> ReadMoment(net::yield_context yield) override {
    timer_.expires_at(next_poll_);
    beast::error_code ec;
    timer_.async_wait(yield[ec]);
    next_poll_ =
        std::max(std::chrono::steady_clock::now(), next_poll_ + kHttpPollInterval);

    for (int failures = 0;;) {
      auto body = poller_->Get(yield);
      if (body) {
        auto moment = Decode(*body);
        if (moment) {
          if (!*moment) {
            logging::Info(log_tag_, name_, " reported disconnect");
          }
          return std::move(*moment);
        }
        logging::Warn(log_tag_, "bad document: ", moment.error());
        poller_->Close();
      } else {
        logging::Warn(log_tag_, "poll failed: ", body.error().message());
      }
      if (++failures >= kHttpMaxConsecutiveFailures) {
        logging::Info(log_tag_, "connection to ", name_, " lost");
        poller_->Close();
        return nullptr;
      }
    }
  }

private:
  std::unique_ptr<HttpPoller> poller_;
  std::string name_;
  std::string log_tag_;
  net::steady_timer timer_;
  std::chrono::steady_clock::time_point next_poll_;
};

// HttpConnector: a connection attempt is one successful GET that decodes to
// a connected document. Abort closes the in-flight connection.
class HttpConnector : public RetryingConnector {
public:
  std::string_view Name() const override { return tag_; }

protected:
  HttpConnector(net::io_context &ioc, std::string tag, const std::string &uri,
                retry::Delay retry_delay)
      : RetryingConnector(ioc, retry_delay), tag_(std::move(tag)),
        url_(ParseOrThrow(uri)) {}

  // Builds the session from the first document, or fails the attempt.
  virtual ConnectResult MakeClient(std::unique_ptr<HttpPoller> poller,
                                   const std::string &body) = 0;

  ConnectResult TryConnect(net::yield_context yield) override {
    inflight_ = std::make_unique<HttpPoller>(ioc_, url_);
    auto body = inflight_->Get(yield);
    auto poller = std::move(inflight_);
    if (!body) {
      return std::unexpected(body.error());
    }
    return MakeClient(std::move(poller), *body);
  }

  void Abort() override {
    if (inflight_) {
      inflight_->Interrupt();
    }
  }

private:
  static url::HttpUrl ParseOrThrow(const std::string &uri) {
    auto u = url::ParseHttpUrl(uri);
    if (!u) {
      throw std::invalid_argument("invalid URL (expected http://host[:port]/path): " +
                                  uri);
    }
    return *u;
  }

  std::string tag_;
  url::HttpUrl url_;
  std::unique_ptr<HttpPoller> inflight_;
};

} // namespace simetry::sims
