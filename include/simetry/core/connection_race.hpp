#pragma once

#include "simetry/core/connector.hpp"
#include "simetry/core/simetry.hpp"
#include "simetry/logging/log.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <vector>

namespace simetry {

namespace net = boost::asio;

// ConnectionRace
// Threading model:
// - Every connector runs as its own coroutine (spawn) on one io_context that
//   must be driven by a single thread; the race keeps no locks
// - The first connector to return a session wins. All others are cancelled at
//   once and Run resumes only after every attempt has returned, so no
//   transport of a losing backend outlives the race
// - There is no timeout: without a running sim Run stays suspended. Cancel
//   abandons the race, in which case Run returns nullptr
class ConnectionRace {
public:
  ConnectionRace(net::io_context &ioc,
                 std::vector<std::unique_ptr<Connector>> connectors)
      : ioc_(ioc), connectors_(std::move(connectors)), done_(ioc) {}

  ConnectionRace(const ConnectionRace &) = delete;
  ConnectionRace &operator=(const ConnectionRace &) = delete;

  std::unique_ptr<Simetry> Run(net::yield_context yield) {
    if (started_) {
      throw std::logic_error("ConnectionRace::Run called more than once");
    }
    started_ = true;
    if (cancelled_) {
      return nullptr;
    }
    pending_ = connectors_.size();
    for (std::size_t i = 0; i < connectors_.size(); ++i) {
      net::spawn(ioc_, [this, i](net::yield_context attempt_yield) {
        OnAttemptDone(i, connectors_[i]->Connect(attempt_yield));
      });
    }
    while (pending_ > 0 || (connectors_.empty() && !cancelled_)) {
      boost::system::error_code ec;
      done_.expires_at(net::steady_timer::time_point::max());
      done_.async_wait(yield[ec]);
    }
    if (cancelled_) {
      winner_.reset();
    }
    return std::move(winner_);
  }

  // Abandons the race. Safe before, during or after Run.
  void Cancel() {
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    for (auto &c : connectors_) {
      c->Cancel();
    }
    done_.cancel();
  }

  std::size_t Pending() const { return pending_; }

private:
  void OnAttemptDone(std::size_t index, std::unique_ptr<Simetry> session) {
    if (session) {
      if (!winner_ && !cancelled_) {
        logging::Info("race", connectors_[index]->Name(), " won, connected to ",
                      session->Name());
        winner_ = std::move(session);
        for (std::size_t j = 0; j < connectors_.size(); ++j) {
          if (j != index) {
            connectors_[j]->Cancel();
          }
        }
      } else {
        session.reset();
      }
    }
    if (--pending_ == 0) {
      done_.cancel();
    }
  }

  net::io_context &ioc_;
  std::vector<std::unique_ptr<Connector>> connectors_;
  net::steady_timer done_;
  std::unique_ptr<Simetry> winner_;
  std::size_t pending_ = 0;
  bool started_ = false;
  bool cancelled_ = false;
};

} // namespace simetry
