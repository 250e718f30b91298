#pragma once

#include "simetry/core/basic_telemetry.hpp"
#include "simetry/core/racing_flags.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

// namespace serde: JSON form of the normalized values.
// Physical quantities are written in SI base units: speed in m/s, rotation
// speeds in rad/s. Boolean fields that are missing or null read as false.
// PropertyTree keeps every leaf as text, so WriteJson emits numbers and
// booleans as JSON strings ({"gear":"3","in_pit_lane":"false"}). Readers
// accept both the quoted and the bare form. A JSON null is read as a missing
// field; the quoted string "null" cannot be told apart from it.
namespace simetry::serde {

namespace pt = boost::property_tree;

// read_json stores null as a childless node holding "null".
inline bool IsNull(const pt::ptree &node) {
  return node.empty() && node.data() == "null";
}

// Child at key, or nullptr when it is missing or null.
inline const pt::ptree *Child(const pt::ptree &tree, const std::string &key) {
  auto child = tree.get_child_optional(key);
  if (!child || IsNull(*child)) {
    return nullptr;
  }
  return &*child;
}

// Leaf at key converted to T; missing, null or unconvertible give no value.
template <typename T>
std::optional<T> Get(const pt::ptree &tree, const std::string &key) {
  const pt::ptree *child = Child(tree, key);
  if (child == nullptr) {
    return std::nullopt;
  }
  auto value = child->get_value_optional<T>();
  if (!value) {
    return std::nullopt;
  }
  return *value;
}

template <typename T>
T GetOr(const pt::ptree &tree, const std::string &key, const T &fallback) {
  return Get<T>(tree, key).value_or(fallback);
}

inline std::expected<pt::ptree, std::string> ParseJson(std::string_view body) {
  pt::ptree tree;
  std::istringstream in{std::string(body)};
  try {
    pt::read_json(in, tree);
  } catch (const pt::json_parser_error &e) {
    return std::unexpected(std::string("malformed json: ") + e.message());
  }
  return tree;
}

inline std::string WriteJson(const pt::ptree &tree) {
  std::ostringstream out;
  pt::write_json(out, tree, false);
  std::string s = out.str();
  if (!s.empty() && s.back() == '\n') {
    s.pop_back();
  }
  return s;
}

inline pt::ptree ToPtree(const BasicTelemetry &t) {
  pt::ptree tree;
  tree.put("gear", static_cast<int>(t.gear));
  tree.put("speed", t.speed.value());
  tree.put("engine_rotation_speed", t.engine_rotation_speed.value());
  tree.put("max_engine_rotation_speed", t.max_engine_rotation_speed.value());
  tree.put("pit_limiter_engaged", t.pit_limiter_engaged);
  tree.put("in_pit_lane", t.in_pit_lane);
  return tree;
}

inline std::expected<BasicTelemetry, std::string>
BasicTelemetryFromPtree(const pt::ptree &tree) {
  auto gear = Get<int>(tree, "gear");
  if (!gear || *gear < std::numeric_limits<std::int8_t>::min() ||
      *gear > std::numeric_limits<std::int8_t>::max()) {
    return std::unexpected(std::string("missing or invalid gear"));
  }
  auto speed = Get<double>(tree, "speed");
  auto rot = Get<double>(tree, "engine_rotation_speed");
  auto max_rot = Get<double>(tree, "max_engine_rotation_speed");
  if (!speed || !rot || !max_rot) {
    return std::unexpected(std::string("missing speed or rotation speed"));
  }
  BasicTelemetry t;
  t.gear = static_cast<std::int8_t>(*gear);
  t.speed = units::MetersPerSecond(*speed);
  t.engine_rotation_speed = units::RadiansPerSecond(*rot);
  t.max_engine_rotation_speed = units::RadiansPerSecond(*max_rot);
  t.pit_limiter_engaged = GetOr(tree, "pit_limiter_engaged", false);
  t.in_pit_lane = GetOr(tree, "in_pit_lane", false);
  return t;
}

inline std::string ToJson(const BasicTelemetry &t) {
  return WriteJson(ToPtree(t));
}

inline std::expected<BasicTelemetry, std::string>
BasicTelemetryFromJson(std::string_view body) {
  auto tree = ParseJson(body);
  if (!tree) {
    return std::unexpected(tree.error());
  }
  return BasicTelemetryFromPtree(*tree);
}

inline pt::ptree ToPtree(const RacingFlags &f) {
  pt::ptree tree;
  tree.put("green", f.green);
  tree.put("yellow", f.yellow);
  tree.put("blue", f.blue);
  tree.put("white", f.white);
  tree.put("red", f.red);
  tree.put("black", f.black);
  tree.put("black_white", f.black_white);
  tree.put("orange", f.orange);
  tree.put("checkered", f.checkered);
  return tree;
}

inline RacingFlags RacingFlagsFromPtree(const pt::ptree &tree) {
  RacingFlags f;
  f.green = GetOr(tree, "green", false);
  f.yellow = GetOr(tree, "yellow", false);
  f.blue = GetOr(tree, "blue", false);
  f.white = GetOr(tree, "white", false);
  f.red = GetOr(tree, "red", false);
  f.black = GetOr(tree, "black", false);
  f.black_white = GetOr(tree, "black_white", false);
  f.orange = GetOr(tree, "orange", false);
  f.checkered = GetOr(tree, "checkered", false);
  return f;
}

} // namespace simetry::serde
