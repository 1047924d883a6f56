#pragma once

#include <cstdint>
#include <string_view>

// Schema type: risk band.
// Alert triage: coarse bucket derived from the risk score.
namespace vigil::schema {

enum class risk_band_t : uint8_t {
  moderate = 0,
  high = 1,
};

constexpr std::string_view risk_band_name(const risk_band_t value) {
  return value == risk_band_t::high ? "high" : "moderate";
}

}  // namespace vigil::schema
