#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>

// namespace retry: waits between connection attempts.
// The timer is owned by the caller so that a pending wait can be cut short
// with timer.cancel() from another handler on the same io_context.
namespace simetry::retry {

namespace net = boost::asio;

using Delay = std::chrono::steady_clock::duration;

// Returns true when the full delay elapsed, false when the wait was cancelled.
inline bool WaitAsync(net::steady_timer &timer, net::yield_context yield,
                      Delay delay) {
  boost::system::error_code ec;
  timer.expires_after(delay);
  timer.async_wait(yield[ec]);
  return !ec;
}

} // namespace simetry::retry
