// types.cpp
#include "types.h"

namespace vp {

const char* to_string(TransportMode m) {
  switch (m) {
    case TransportMode::Car:  return "car";
    case TransportMode::Bike: return "bike";
    case TransportMode::Walk: return "walk";
  }
  return "car";
}

std::optional<TransportMode> transport_mode_from_string(const std::string& s) {
  if (s == "car")  return TransportMode::Car;
  if (s == "bike") return TransportMode::Bike;
  if (s == "walk") return TransportMode::Walk;
  return std::nullopt;
}

const char* to_string(UnassignedReason r) {
  return r == UnassignedReason::OutOfRadius ? "out_of_radius" : "no_provider";
}

} // namespace vp
