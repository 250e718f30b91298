#pragma once

#include "simetry/core/basic_telemetry.hpp"
#include "simetry/core/connection_race.hpp"
#include "simetry/core/connector.hpp"
#include "simetry/core/moment.hpp"
#include "simetry/core/racing_flags.hpp"
#include "simetry/core/simetry.hpp"
#include "simetry/sims/dirt_rally_2.hpp"
#include "simetry/sims/generic_http.hpp"
#include "simetry/sims/truck_simulator.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace simetry {

namespace net = boost::asio;

// SimetryConnectionBuilder: where to look for each networked sim and how
// long to wait between attempts. Defaults match each sim's stock setup.
struct SimetryConnectionBuilder {
  std::string generic_http_uri = sims::generic_http::kDefaultUri;
  std::string truck_simulator_uri = sims::truck_simulator::kDefaultUri;
  std::string dirt_rally_2_uri = sims::dirt_rally_2::kDefaultUri;
  std::chrono::milliseconds retry_delay{5000};

  bool operator==(const SimetryConnectionBuilder &) const = default;

  // One connector per supported sim. Throws std::invalid_argument on a
  // malformed endpoint.
  std::vector<std::unique_ptr<Connector>>
  MakeConnectors(net::io_context &ioc) const {
    std::vector<std::unique_ptr<Connector>> connectors;
    connectors.reserve(3);
    connectors.emplace_back(
        std::make_unique<sims::generic_http::GenericHttpConnector>(
            ioc, generic_http_uri, retry_delay));
    connectors.emplace_back(
        std::make_unique<sims::truck_simulator::TruckSimulatorConnector>(
            ioc, truck_simulator_uri, retry_delay));
    connectors.emplace_back(
        std::make_unique<sims::dirt_rally_2::DirtRally2Connector>(
            ioc, dirt_rally_2_uri, retry_delay));
    return connectors;
  }

  // Suspends until any supported sim is running and returns the connection.
  // The io_context must be run by a single thread.
  std::unique_ptr<Simetry> Connect(net::io_context &ioc,
                                   net::yield_context yield) const {
    ConnectionRace race(ioc, MakeConnectors(ioc));
    return race.Run(yield);
  }
};

// Connect to any running sim that is supported, using default endpoints.
inline std::unique_ptr<Simetry> Connect(net::io_context &ioc,
                                        net::yield_context yield) {
  return SimetryConnectionBuilder{}.Connect(ioc, yield);
}

} // namespace simetry
