#pragma once

#include "simetry/core/simetry.hpp"
#include "simetry/logging/log.hpp"
#include "simetry/net/retry.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <string_view>

namespace simetry {

namespace net = boost::asio;

// Connector: one backend's attempt to reach its sim.
// Connect keeps trying until the sim is reachable and returns the connected
// session; it returns nullptr only after Cancel. Cancel may be called from any
// handler on the same io_context while Connect is suspended and must release
// whatever transport the attempt has opened so far.
class Connector {
public:
  virtual ~Connector() = default;
  virtual std::string_view Name() const = 0;
  virtual std::unique_ptr<Simetry> Connect(net::yield_context yield) = 0;
  virtual void Cancel() = 0;
};

using ConnectResult =
    std::expected<std::unique_ptr<Simetry>, boost::system::error_code>;

// RetryingConnector
// Threading model:
// - Connect runs as a coroutine on the io_context passed at construction
// - Each TryConnect is one attempt; failures are followed by a wait of
//   retry_delay on a cancellable timer, so an absent sim costs one attempt per
//   interval
// - A session produced after Cancel is dropped, closing its transport
class RetryingConnector : public Connector {
public:
  std::unique_ptr<Simetry> Connect(net::yield_context yield) final {
    for (;;) {
      if (cancelled_) {
        return nullptr;
      }
      ++attempts_;
      ConnectResult result = TryConnect(yield);
      if (cancelled_) {
        return nullptr;
      }
      if (result && *result) {
        logging::Info(Name(), "connected after ", attempts_, " attempt(s)");
        return std::move(*result);
      }
      if (!result && result.error() != last_error_) {
        // Logged once per distinct reason; an absent sim fails the same way
        // on every attempt.
        logging::Info(Name(), "not available: ", result.error().message());
        last_error_ = result.error();
      }
      retry::WaitAsync(timer_, yield, retry_delay_);
    }
  }

  void Cancel() final {
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    timer_.cancel();
    Abort();
  }

  std::size_t Attempts() const { return attempts_; }

protected:
  RetryingConnector(net::io_context &ioc, retry::Delay retry_delay)
      : ioc_(ioc), timer_(ioc), retry_delay_(retry_delay) {}

  // One connection attempt. A success must carry a non-null session.
  virtual ConnectResult TryConnect(net::yield_context yield) = 0;

  // Close the transport of an attempt in flight, if any.
  virtual void Abort() {}

  bool Cancelled() const { return cancelled_; }

  net::io_context &ioc_;

private:
  net::steady_timer timer_;
  retry::Delay retry_delay_;
  bool cancelled_ = false;
  std::size_t attempts_ = 0;
  boost::system::error_code last_error_;
};

} // namespace simetry
