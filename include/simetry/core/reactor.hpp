#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <optional>
#include <thread>

namespace simetry {

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns the io_context the race and the session coroutines run on
// - Runs io_context::run() on a single worker std::jthread; races and
//   sessions keep their state unsynchronized
// - A work guard keeps run() alive while coroutines are only waiting on
//   timers or sockets
class Reactor {
public:
  Reactor() = default;

  net::io_context &GetIoContext() { return ioc_; }

  void Start() {
    if (thread_.joinable()) {
      return;
    }
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    thread_ = std::jthread([this] { ioc_.run(); });
  }

  void Stop() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    ioc_.stop();
  }

  // Stops the io_context and waits for the worker to return.
  void Join() {
    Stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  ~Reactor() { Join(); }

private:
  net::io_context ioc_;
  std::jthread thread_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};

} // namespace simetry
