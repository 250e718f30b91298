#pragma once

#include "simetry/core/moment.hpp"
#include <boost/asio/spawn.hpp>
#include <memory>
#include <string_view>

namespace simetry {

namespace net = boost::asio;

// Simetry: a live connection to one sim.
// Threading model:
// - Owns its transport exclusively; lives on the io_context it was connected
//   on and is driven from a coroutine on that io_context
// - NextMoment suspends the calling coroutine until the sim publishes the next
//   reading, so moments come out in transport order
// - nullptr marks the end of the connection (sim closed or crashed). Once
//   returned, every later call returns nullptr without touching the transport
class Simetry {
public:
  virtual ~Simetry() = default;

  // Name of the sim we are connected to.
  virtual std::string_view Name() const = 0;

  std::unique_ptr<Moment> NextMoment(net::yield_context yield) {
    if (exhausted_) {
      return nullptr;
    }
    auto moment = ReadMoment(yield);
    if (!moment) {
      exhausted_ = true;
    }
    return moment;
  }

  bool Exhausted() const { return exhausted_; }

protected:
  // Backend hook: wait for and decode the next reading, nullptr once the
  // connection is permanently lost.
  virtual std::unique_ptr<Moment> ReadMoment(net::yield_context yield) = 0;

private:
  bool exhausted_ = false;
};

} // namespace simetry
