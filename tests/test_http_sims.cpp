#include "simetry/core/connection_race.hpp"
#include "simetry/sims/generic_http.hpp"
#include "simetry/sims/truck_simulator.hpp"
#include <array>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <catch2/catch.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace simetry;
using namespace std::chrono_literals;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

const char *kGenericDocument = R"({
  "name": "Test Sim",
  "vehicle_right": true,
  "basic_telemetry": {"gear": 4, "speed": 30.5,
                      "engine_rotation_speed": 600.0,
                      "max_engine_rotation_speed": 800.0,
                      "pit_limiter_engaged": true},
  "shift_point": 750.0,
  "flags": {"blue": true},
  "vehicle_unique_id": "test-car",
  "starter_on": true
})";

const char *kTruckDocument = R"({
  "game": {"connected": true, "gameName": "ETS2", "paused": false},
  "truck": {"id": "scania.r", "make": "Scania", "model": "R",
            "speed": -7.2, "displayedGear": -1, "gear": -1,
            "engineRpm": 900.0, "engineRpmMax": 2500.0,
            "engineOn": true, "electricOn": true}
})";

// Answers every request with body until `replies` answers were sent in
// total, then drops the connection and stops listening.
void ServeJson(boost::asio::io_context &ioc, tcp::acceptor &acceptor,
               std::string body, int replies) {
  auto left = std::make_shared<int>(replies);
  boost::asio::spawn(ioc, [&ioc, &acceptor, body, left](
                              boost::asio::yield_context yield) {
    for (;;) {
      beast::error_code ec;
      tcp::socket socket(ioc);
      acceptor.async_accept(socket, yield[ec]);
      if (ec) {
        return;
      }
      auto peer = std::make_shared<tcp::socket>(std::move(socket));
      boost::asio::spawn(ioc, [&acceptor, body, left,
                               peer](boost::asio::yield_context conn) {
        beast::error_code ec;
        beast::flat_buffer buffer;
        while (*left > 0) {
          http::request<http::string_body> req;
          http::async_read(*peer, buffer, req, conn[ec]);
          if (ec) {
            return;
          }
          http::response<http::string_body> res{http::status::ok,
                                                req.version()};
          res.set(http::field::content_type, "application/json");
          res.keep_alive(true);
          res.body() = body;
          res.prepare_payload();
          http::async_write(*peer, res, conn[ec]);
          if (ec) {
            return;
          }
          --*left;
        }
        peer->shutdown(tcp::socket::shutdown_both, ec);
        peer->close(ec);
        acceptor.close(ec);
      });
    }
  });
}

} // namespace

TEST_CASE("Generic HTTP documents map onto every moment query") {
  auto m = sims::generic_http::ParseMoment(kGenericDocument);
  REQUIRE(m.has_value());
  const Moment &moment = **m;
  REQUIRE((*m)->name == "Test Sim");
  REQUIRE_FALSE(moment.VehicleLeft());
  REQUIRE(moment.VehicleRight());
  auto t = moment.GetBasicTelemetry();
  REQUIRE(t.has_value());
  REQUIRE(t->gear == 4);
  REQUIRE(t->speed.value() == Approx(30.5));
  REQUIRE(t->pit_limiter_engaged);
  REQUIRE(moment.ShiftPoint()->value() == Approx(750.0));
  REQUIRE(moment.Flags().blue);
  REQUIRE(moment.VehicleUniqueId() == std::optional<std::string>("test-car"));
  REQUIRE(moment.IgnitionOn());
  REQUIRE(moment.StarterOn());
}

TEST_CASE("Generic HTTP empty document falls back to defaults") {
  auto m = sims::generic_http::ParseMoment("{}");
  REQUIRE(m.has_value());
  const Moment &moment = **m;
  REQUIRE((*m)->name == sims::generic_http::kDefaultName);
  REQUIRE_FALSE(moment.GetBasicTelemetry().has_value());
  REQUIRE_FALSE(moment.ShiftPoint().has_value());
  REQUIRE_FALSE(moment.VehicleUniqueId().has_value());
  REQUIRE(moment.IgnitionOn());
  REQUIRE_FALSE(moment.StarterOn());
  REQUIRE_FALSE(moment.Flags().Any());
}

TEST_CASE("Generic HTTP null fields read as absent") {
  auto m = sims::generic_http::ParseMoment(R"({
    "name": null, "vehicle_left": null, "vehicle_right": null,
    "basic_telemetry": null, "shift_point": null, "flags": null,
    "vehicle_unique_id": null, "ignition_on": null, "starter_on": null
  })");
  REQUIRE(m.has_value());
  const Moment &moment = **m;
  REQUIRE((*m)->name == sims::generic_http::kDefaultName);
  REQUIRE_FALSE(moment.VehicleLeft());
  REQUIRE_FALSE(moment.VehicleRight());
  REQUIRE_FALSE(moment.GetBasicTelemetry().has_value());
  REQUIRE_FALSE(moment.ShiftPoint().has_value());
  REQUIRE_FALSE(moment.Flags().Any());
  REQUIRE_FALSE(moment.VehicleUniqueId().has_value());
  REQUIRE(moment.IgnitionOn());
  REQUIRE_FALSE(moment.StarterOn());
}

TEST_CASE("Generic HTTP null inside nested objects reads as absent") {
  auto m = sims::generic_http::ParseMoment(R"({
    "name": "X",
    "basic_telemetry": {"gear": 2, "speed": 1.5,
                        "engine_rotation_speed": 100,
                        "max_engine_rotation_speed": 200,
                        "pit_limiter_engaged": null, "in_pit_lane": null},
    "flags": {"yellow": null, "green": true}
  })");
  REQUIRE(m.has_value());
  REQUIRE((*m)->name == "X");
  auto t = (*m)->GetBasicTelemetry();
  REQUIRE(t.has_value());
  REQUIRE(t->gear == 2);
  REQUIRE_FALSE(t->pit_limiter_engaged);
  REQUIRE_FALSE(t->in_pit_lane);
  REQUIRE((*m)->Flags().green);
  REQUIRE_FALSE((*m)->Flags().yellow);
}

TEST_CASE("Generic HTTP null gear still fails telemetry") {
  REQUIRE_FALSE(sims::generic_http::ParseMoment(
                    R"({"basic_telemetry": {"gear": null, "speed": 1,
                        "engine_rotation_speed": 1,
                        "max_engine_rotation_speed": 1}})")
                    .has_value());
}

TEST_CASE("Generic HTTP rejects broken telemetry") {
  REQUIRE_FALSE(
      sims::generic_http::ParseMoment(R"({"basic_telemetry": {"gear": 1}})")
          .has_value());
  REQUIRE_FALSE(sims::generic_http::ParseMoment("[").has_value());
}

TEST_CASE("Generic HTTP session polls until the server goes away") {
  boost::asio::io_context ioc;
  tcp::acceptor acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  const auto port = acceptor.local_endpoint().port();
  ServeJson(ioc, acceptor, kGenericDocument, 3);

  std::vector<std::unique_ptr<Connector>> connectors;
  connectors.push_back(std::make_unique<sims::generic_http::GenericHttpConnector>(
      ioc, "http://127.0.0.1:" + std::to_string(port) + "/", 50ms));
  ConnectionRace race(ioc, std::move(connectors));

  std::string name;
  int moments = 0;
  bool ended = false;
  boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
    auto sim = race.Run(yield);
    REQUIRE(sim != nullptr);
    name = std::string(sim->Name());
    while (auto m = sim->NextMoment(yield)) {
      REQUIRE(m->GetBasicTelemetry()->gear == 4);
      ++moments;
    }
    ended = sim->NextMoment(yield) == nullptr;
  });
  ioc.run_for(10s);

  REQUIRE(name == "Test Sim");
  // the first reply was consumed by the connection attempt
  REQUIRE(moments == 2);
  REQUIRE(ended);
}

TEST_CASE("Truck simulator documents convert units and ids") {
  auto doc = sims::truck_simulator::ParseDocument(kTruckDocument);
  REQUIRE(doc.has_value());
  REQUIRE(doc->connected);
  REQUIRE(sims::truck_simulator::DisplayName(doc->game_name) ==
          "Euro Truck Simulator 2");
  const Moment &m = *doc->moment;
  auto t = m.GetBasicTelemetry();
  REQUIRE(t.has_value());
  REQUIRE(t->gear == -1);
  REQUIRE(t->speed.value() == Approx(2.0));
  REQUIRE(units::ToRpm(t->engine_rotation_speed) == Approx(900.0));
  REQUIRE(units::ToRpm(t->max_engine_rotation_speed) == Approx(2500.0));
  REQUIRE(m.VehicleUniqueId() == std::optional<std::string>("scania.r"));
  REQUIRE(m.IgnitionOn());
  REQUIRE_FALSE(m.StarterOn());
  REQUIRE_FALSE(m.ShiftPoint().has_value());
}

TEST_CASE("Truck simulator without a running game is not connected") {
  auto doc = sims::truck_simulator::ParseDocument(
      R"({"game": {"connected": false, "gameName": null}, "truck": {}})");
  REQUIRE(doc.has_value());
  REQUIRE_FALSE(doc->connected);
  REQUIRE_FALSE(doc->moment->VehicleUniqueId().has_value());
  REQUIRE_FALSE(sims::truck_simulator::ParseDocument("{}").has_value());
}

TEST_CASE("Truck simulator null ids and game name read as absent") {
  auto doc = sims::truck_simulator::ParseDocument(R"({
    "game": {"connected": true, "gameName": null},
    "truck": {"id": null, "make": null, "model": null, "speed": 10.8,
              "displayedGear": null, "gear": 2, "electricOn": null}
  })");
  REQUIRE(doc.has_value());
  REQUIRE(doc->connected);
  REQUIRE(doc->game_name.empty());
  REQUIRE(sims::truck_simulator::DisplayName(doc->game_name) == "Truck Simulator");
  REQUIRE_FALSE(doc->moment->VehicleUniqueId().has_value());
  REQUIRE(doc->moment->GetBasicTelemetry()->gear == 2);
  REQUIRE(doc->moment->IgnitionOn());
}

TEST_CASE("Truck simulator null id falls back to make and model") {
  auto doc = sims::truck_simulator::ParseDocument(R"({
    "game": {"connected": true, "gameName": "ATS"},
    "truck": {"id": null, "make": "Peterbilt", "model": "579"}
  })");
  REQUIRE(doc.has_value());
  REQUIRE(doc->moment->VehicleUniqueId() ==
          std::optional<std::string>("Peterbilt/579"));
}

TEST_CASE("Truck simulator connector waits for the game to connect") {
  boost::asio::io_context ioc;
  tcp::acceptor acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  const auto port = acceptor.local_endpoint().port();
  ServeJson(ioc, acceptor,
            R"({"game": {"connected": false}, "truck": {}})", 100);

  auto connector = std::make_unique<sims::truck_simulator::TruckSimulatorConnector>(
      ioc, "http://127.0.0.1:" + std::to_string(port) + "/api/ets2/telemetry",
      20ms);
  auto *truck = connector.get();
  std::vector<std::unique_ptr<Connector>> connectors;
  connectors.push_back(std::move(connector));
  ConnectionRace race(ioc, std::move(connectors));

  std::unique_ptr<Simetry> sim;
  bool returned = false;
  boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
    sim = race.Run(yield);
    returned = true;
  });
  ioc.run_for(150ms);
  REQUIRE_FALSE(returned);
  REQUIRE(truck->Attempts() >= 2);

  boost::asio::post(ioc, [&] {
    race.Cancel();
    acceptor.close();
  });
  ioc.run_for(2s);
  REQUIRE(returned);
  REQUIRE(sim == nullptr);
}

TEST_CASE("HTTP connector cancelled mid-request closes its connection") {
  boost::asio::io_context ioc;
  // listens but never answers: the connect completes from the backlog and the
  // attempt stays suspended waiting for the response
  tcp::acceptor acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  const auto port = acceptor.local_endpoint().port();

  std::vector<std::unique_ptr<Connector>> connectors;
  connectors.push_back(std::make_unique<sims::generic_http::GenericHttpConnector>(
      ioc, "http://127.0.0.1:" + std::to_string(port) + "/", 20ms));
  ConnectionRace race(ioc, std::move(connectors));

  std::unique_ptr<Simetry> sim;
  bool returned = false;
  boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
    sim = race.Run(yield);
    returned = true;
  });
  ioc.run_for(100ms);
  REQUIRE_FALSE(returned);

  boost::asio::post(ioc, [&] { race.Cancel(); });
  ioc.run_for(500ms);
  REQUIRE(returned);
  REQUIRE(sim == nullptr);
  REQUIRE(race.Pending() == 0);

  // the request arrives, then the client side is already closed
  beast::error_code read_ec;
  bool drained = false;
  boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
    tcp::socket peer(ioc);
    beast::error_code ec;
    acceptor.async_accept(peer, yield[ec]);
    REQUIRE_FALSE(ec);
    std::array<char, 512> buf;
    for (;;) {
      peer.async_read_some(boost::asio::buffer(buf), yield[read_ec]);
      if (read_ec) {
        break;
      }
    }
    drained = true;
  });
  ioc.restart();
  ioc.run_for(2s);
  REQUIRE(drained);
  REQUIRE((read_ec == boost::asio::error::eof ||
           read_ec == boost::asio::error::connection_reset));
}
