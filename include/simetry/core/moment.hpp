#pragma once

#include "simetry/core/basic_telemetry.hpp"
#include "simetry/core/racing_flags.hpp"
#include <optional>
#include <string>

namespace simetry {

// Moment: telemetry of one sim at one instant.
// Every query has a fixed fallback used when the connected sim does not
// provide the datum. Backends override only what they support; callers never
// need to check for support. Boolean states fall back to normal driving
// (no car alongside, ignition on, starter off) while data-bearing queries
// fall back to "no value" so that unsupported never reads as a measured zero.
class Moment {
public:
  virtual ~Moment() = default;

  // Vehicle alongside on the left. Unsupported: false.
  virtual bool VehicleLeft() const { return false; }

  // Vehicle alongside on the right. Unsupported: false.
  virtual bool VehicleRight() const { return false; }

  virtual std::optional<BasicTelemetry> GetBasicTelemetry() const {
    return std::nullopt;
  }

  // Engine speed at which the driver should shift up.
  virtual std::optional<AngularVelocity> ShiftPoint() const {
    return std::nullopt;
  }

  virtual RacingFlags Flags() const { return RacingFlags{}; }

  // ID that uniquely identifies the current vehicle make and model. Use it to
  // attach behavior to a specific car. Unsupported: no value, never "".
  virtual std::optional<std::string> VehicleUniqueId() const {
    return std::nullopt;
  }

  // Unsupported: true, sims without ignition modeling always run.
  virtual bool IgnitionOn() const { return true; }

  // Unsupported: false.
  virtual bool StarterOn() const { return false; }
};

} // namespace simetry
