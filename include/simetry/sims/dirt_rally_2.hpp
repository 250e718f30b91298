#pragma once

#include "simetry/core/connector.hpp"
#include "simetry/core/simetry.hpp"
#include "simetry/logging/log.hpp"
#include "simetry/net/net_ops.hpp"
#include "simetry/net/url.hpp"
#include <array>
#include <bit>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/endian/conversion.hpp>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

// DiRT Rally 2.0 over UDP. Enable in hardware_settings_config.xml with
//   <udp enabled="true" extradata="3" ip="127.0.0.1" port="20777" delay="1" />
// Every packet is 66 little-endian floats. Engine rates are sent in rpm / 10.
namespace simetry::sims::dirt_rally_2 {

namespace net = boost::asio;
using udp = net::ip::udp;

inline constexpr const char *kDefaultUri = "127.0.0.1:20777";
inline constexpr const char *kName = "DiRT Rally 2.0";
inline constexpr std::size_t kFieldCount = 66;
inline constexpr std::size_t kPacketSize = kFieldCount * sizeof(float);
// The game stops sending in menus and when closed; a silent stage start rarely
// takes this long.
inline constexpr std::chrono::seconds kSilenceTimeout{10};

// Float offsets within a packet.
enum Field : std::size_t {
  kSpeed = 7,
  kGear = 33,
  kEngineRate = 37,
  kInPit = 47,
  kMaxRpm = 63,
  kIdleRpm = 64,
  kMaxGears = 65,
};

// Gear value the game uses for reverse.
inline constexpr float kReverseGear = 10.0f;

struct Packet {
  std::array<float, kFieldCount> fields{};

  float operator[](Field f) const { return fields[f]; }
};

inline std::optional<Packet> DecodePacket(std::span<const std::byte> data) {
  if (data.size() < kPacketSize) {
    return std::nullopt;
  }
  Packet p;
  for (std::size_t i = 0; i < kFieldCount; ++i) {
    std::uint32_t raw;
    std::memcpy(&raw, data.data() + i * sizeof(float), sizeof(raw));
    p.fields[i] = std::bit_cast<float>(boost::endian::little_to_native(raw));
  }
  return p;
}

inline BasicTelemetry ToBasicTelemetry(const Packet &p) {
  BasicTelemetry t;
  const float gear = p[kGear];
  if (gear == kReverseGear || gear < 0.0f) {
    t.gear = -1;
  } else {
    t.gear = static_cast<std::int8_t>(std::lround(gear));
  }
  t.speed = units::MetersPerSecond(p[kSpeed]);
  t.engine_rotation_speed = units::Rpm(p[kEngineRate] * 10.0);
  t.max_engine_rotation_speed = units::Rpm(p[kMaxRpm] * 10.0);
  t.in_pit_lane = p[kInPit] > 0.0f;
  return t;
}

class DirtRally2Moment : public Moment {
public:
  explicit DirtRally2Moment(const Packet &packet)
      : telemetry_(ToBasicTelemetry(packet)) {}

  std::optional<BasicTelemetry> GetBasicTelemetry() const override {
    return telemetry_;
  }

private:
  BasicTelemetry telemetry_;
};

// DirtRally2Client
// Threading model:
// - Owns the bound UDP socket; ReadMoment suspends on async_receive
// - Short datagrams are skipped; kSilenceTimeout without a packet or a socket
//   error ends the session
class DirtRally2Client : public Simetry {
public:
  DirtRally2Client(udp::socket socket, Packet first)
      : socket_(std::move(socket)), first_(first) {}

  std::string_view Name() const override { return kName; }

protected:
  std::unique_ptr<Moment> ReadMoment(net::yield_context yield) override {
    if (first_) {
      auto m = std::make_unique<DirtRally2Moment>(*first_);
      first_.reset();
      return m;
    }
    for (;;) {
      auto n = netops::AsyncReceiveFor(socket_, net::buffer(buffer_),
                                       kSilenceTimeout, yield);
      if (!n) {
        logging::Info("dirt_rally_2", "connection lost: ", n.error().message());
        boost::system::error_code ignored;
        socket_.close(ignored);
        return nullptr;
      }
      if (auto packet = DecodePacket(std::span(buffer_.data(), *n))) {
        return std::make_unique<DirtRally2Moment>(*packet);
      }
    }
  }

private:
  udp::socket socket_;
  std::optional<Packet> first_;
  std::array<std::byte, 2048> buffer_{};
};

// DirtRally2Connector: an attempt binds the listening socket and waits for the
// first well-formed packet. Only a failure to bind is retried after the delay;
// Abort closes the socket.
class DirtRally2Connector : public RetryingConnector {
public:
  DirtRally2Connector(net::io_context &ioc, const std::string &uri,
                      retry::Delay retry_delay)
      : RetryingConnector(ioc, retry_delay), endpoint_(ParseOrThrow(uri)),
        resolver_(ioc) {}

  std::string_view Name() const override { return "dirt_rally_2"; }

protected:
  ConnectResult TryConnect(net::yield_context yield) override {
    auto endpoint = netops::AsyncResolveUdp(resolver_, endpoint_.host,
                                            endpoint_.port, yield);
    if (!endpoint) {
      return std::unexpected(endpoint.error());
    }
    if (Cancelled()) {
      return std::unexpected(net::error::make_error_code(net::error::operation_aborted));
    }
    socket_.emplace(ioc_);
    if (auto st = netops::BindUdp(*socket_, *endpoint); !st) {
      socket_.reset();
      return std::unexpected(st.error());
    }
    std::array<std::byte, 2048> buffer{};
    for (;;) {
      auto n = netops::AsyncReceive(*socket_, net::buffer(buffer), yield);
      if (!n) {
        socket_.reset();
        return std::unexpected(n.error());
      }
      if (auto packet = DecodePacket(std::span(buffer.data(), *n))) {
        auto client =
            std::make_unique<DirtRally2Client>(std::move(*socket_), *packet);
        socket_.reset();
        return client;
      }
    }
  }

  void Abort() override {
    resolver_.cancel();
    if (socket_) {
      boost::system::error_code ignored;
      socket_->close(ignored);
    }
  }

private:
  static url::UdpEndpoint ParseOrThrow(const std::string &uri) {
    auto e = url::ParseUdpEndpoint(uri);
    if (!e) {
      throw std::invalid_argument("invalid UDP endpoint (expected host:port): " +
                                  uri);
    }
    return *e;
  }

  url::UdpEndpoint endpoint_;
  udp::resolver resolver_;
  std::optional<udp::socket> socket_;
};

} // namespace simetry::sims::dirt_rally_2
