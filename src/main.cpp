#include "simetry/core/reactor.hpp"
#include "simetry/logging/log.hpp"
#include "simetry/simetry.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace net = boost::asio;

struct Options {
  std::string generic_http = simetry::sims::generic_http::kDefaultUri;
  std::string truck_simulator = simetry::sims::truck_simulator::kDefaultUri;
  std::string dirt_rally_2 = simetry::sims::dirt_rally_2::kDefaultUri;
  int retry_ms = 5000;
  int seconds = 0; // 0 = run until interrupted
  int every = 30;  // print every Nth moment
  bool quiet = false;
};

static void PrintUsage(const char *argv0) {
  std::cout << "usage: " << argv0
            << " [-g|--generic-http URL] [-k|--truck-simulator URL]"
               " [-d|--dirt-rally-2 HOST:PORT] [-r|--retry-ms MS]"
               " [-t|--seconds N] [-e|--every N] [-q|--quiet]\n";
}

static Options ParseArgs(int argc, char **argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-g" || a == "--generic-http") && i + 1 < argc)
      opt.generic_http = argv[++i];
    else if ((a == "-k" || a == "--truck-simulator") && i + 1 < argc)
      opt.truck_simulator = argv[++i];
    else if ((a == "-d" || a == "--dirt-rally-2") && i + 1 < argc)
      opt.dirt_rally_2 = argv[++i];
    else if ((a == "-r" || a == "--retry-ms") && i + 1 < argc)
      opt.retry_ms = std::max(1, std::atoi(argv[++i]));
    else if ((a == "-t" || a == "--seconds") && i + 1 < argc)
      opt.seconds = std::max(0, std::atoi(argv[++i]));
    else if ((a == "-e" || a == "--every") && i + 1 < argc)
      opt.every = std::max(1, std::atoi(argv[++i]));
    else if (a == "-q" || a == "--quiet")
      opt.quiet = true;
    else if (a == "-h" || a == "--help") {
      PrintUsage(argv[0]);
      std::exit(0);
    }
  }
  return opt;
}

static std::string FlagList(const simetry::RacingFlags &f) {
  std::ostringstream oss;
  auto add = [&oss](bool on, const char *name) {
    if (on) {
      oss << (oss.tellp() > 0 ? "," : "") << name;
    }
  };
  add(f.green, "green");
  add(f.yellow, "yellow");
  add(f.blue, "blue");
  add(f.white, "white");
  add(f.red, "red");
  add(f.black, "black");
  add(f.black_white, "black_white");
  add(f.orange, "orange");
  add(f.checkered, "checkered");
  return f.Any() ? oss.str() : "-";
}

static void PrintMoment(std::size_t index, const simetry::Moment &m) {
  namespace units = simetry::units;
  std::ostringstream line;
  line << "#" << index;
  if (auto t = m.GetBasicTelemetry()) {
    line << " gear=" << static_cast<int>(t->gear) << std::fixed
         << std::setprecision(1)
         << " speed=" << units::ToKilometersPerHour(t->speed) << "km/h"
         << " rpm=" << units::ToRpm(t->engine_rotation_speed) << "/"
         << units::ToRpm(t->max_engine_rotation_speed)
         << (t->pit_limiter_engaged ? " limiter" : "")
         << (t->in_pit_lane ? " pitlane" : "");
  } else {
    line << " telemetry=n/a";
  }
  if (auto sp = m.ShiftPoint()) {
    line << " shift=" << units::ToRpm(*sp);
  }
  line << " flags=" << FlagList(m.Flags())
       << " car=" << m.VehicleUniqueId().value_or("?")
       << " ignition=" << (m.IgnitionOn() ? "on" : "off")
       << (m.StarterOn() ? " starter" : "")
       << (m.VehicleLeft() ? " <car" : "") << (m.VehicleRight() ? " car>" : "");
  std::cout << line.str() << "\n";
}

int main(int argc, char **argv) {
  auto opt = ParseArgs(argc, argv);
  if (opt.quiet) {
    simetry::logging::SetLevel(simetry::logging::Level::warn);
  }

  simetry::SimetryConnectionBuilder builder;
  builder.generic_http_uri = opt.generic_http;
  builder.truck_simulator_uri = opt.truck_simulator;
  builder.dirt_rally_2_uri = opt.dirt_rally_2;
  builder.retry_delay = std::chrono::milliseconds(opt.retry_ms);

  simetry::Reactor reactor;
  auto &ioc = reactor.GetIoContext();
  try {
    (void)builder.MakeConnectors(ioc);
  } catch (const std::invalid_argument &e) {
    simetry::logging::Error("config", e.what());
    return 1;
  }

  // Everything below is touched only from the reactor thread.
  std::promise<void> done;
  bool finished = false;
  bool stopping = false;
  simetry::ConnectionRace *active_race = nullptr;
  auto finish = [&] {
    if (!finished) {
      finished = true;
      done.set_value();
    }
  };
  // A running race is cancelled and the connect loop finishes once Run has
  // released every attempt; a session may be blocked on a silent sim, so it
  // is finished right away.
  auto shutdown = [&] {
    stopping = true;
    if (active_race != nullptr) {
      active_race->Cancel();
    } else {
      finish();
    }
  };

  net::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int) {
    if (!ec) {
      shutdown();
    }
  });

  net::spawn(ioc, [&](net::yield_context yield) {
    while (!stopping) {
      std::cout << "Waiting for a supported sim...\n";
      simetry::ConnectionRace race(ioc, builder.MakeConnectors(ioc));
      active_race = &race;
      auto sim = race.Run(yield);
      active_race = nullptr;
      if (!sim) {
        break;
      }
      std::cout << "Connected to " << sim->Name() << "\n";
      std::size_t n = 0;
      while (auto moment = sim->NextMoment(yield)) {
        if (stopping) {
          break;
        }
        if (n % static_cast<std::size_t>(opt.every) == 0) {
          PrintMoment(n, *moment);
        }
        ++n;
      }
      std::cout << "Disconnected from " << sim->Name() << " after " << n
                << " moments\n";
    }
    finish();
  });

  reactor.Start();
  auto finished_future = done.get_future();
  if (opt.seconds > 0 && finished_future.wait_for(std::chrono::seconds(
                             opt.seconds)) == std::future_status::timeout) {
    net::post(ioc, shutdown);
  }
  finished_future.wait();
  reactor.Join();
  return 0;
}
