#pragma once

#include <boost/units/quantity.hpp>
#include <boost/units/systems/si/angular_velocity.hpp>
#include <boost/units/systems/si/velocity.hpp>
#include <cstdint>
#include <numbers>

namespace simetry {

namespace si = boost::units::si;

using Velocity = boost::units::quantity<si::velocity>;
using AngularVelocity = boost::units::quantity<si::angular_velocity>;

// BasicTelemetry: normalized reading shared by every sim.
// Physical values carry their SI unit in the type; use the helpers below to
// convert from the units sims usually report.
struct BasicTelemetry {
  std::int8_t gear = 0; // negative = reverse, 0 = neutral
  Velocity speed = 0.0 * si::meters_per_second;
  AngularVelocity engine_rotation_speed = 0.0 * si::radians_per_second;
  AngularVelocity max_engine_rotation_speed = 0.0 * si::radians_per_second;
  bool pit_limiter_engaged = false;
  bool in_pit_lane = false;

  bool operator==(const BasicTelemetry &) const = default;
};

namespace units {

inline Velocity MetersPerSecond(double v) { return v * si::meters_per_second; }

inline Velocity KilometersPerHour(double v) {
  return MetersPerSecond(v / 3.6);
}

inline AngularVelocity RadiansPerSecond(double v) {
  return v * si::radians_per_second;
}

inline AngularVelocity Rpm(double v) {
  return RadiansPerSecond(v * 2.0 * std::numbers::pi / 60.0);
}

inline double ToKilometersPerHour(Velocity v) { return v.value() * 3.6; }

inline double ToRpm(AngularVelocity w) {
  return w.value() * 60.0 / (2.0 * std::numbers::pi);
}

} // namespace units

} // namespace simetry
