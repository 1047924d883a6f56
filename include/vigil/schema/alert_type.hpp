#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: alert type.
// Detection rule tag: one value per rule; an alert lists every tag that
// matched its transaction during the pass.
namespace vigil::schema {

enum class alert_type_t : uint8_t {
  high_value = 0,
  high_risk_counterparty = 1,
  high_risk_jurisdiction = 2,
  rapid_succession = 3,
  round_amount = 4,
  high_frequency = 5,
  new_counterparty = 6,
  cluster_member = 7,
};

inline constexpr auto kAlertTypeNames =
    std::array<std::pair<std::string_view, alert_type_t>, 8>{{
        {"high_value", alert_type_t::high_value},
        {"high_risk_counterparty", alert_type_t::high_risk_counterparty},
        {"high_risk_jurisdiction", alert_type_t::high_risk_jurisdiction},
        {"rapid_succession", alert_type_t::rapid_succession},
        {"round_amount", alert_type_t::round_amount},
        {"high_frequency", alert_type_t::high_frequency},
        {"new_counterparty", alert_type_t::new_counterparty},
        {"cluster_member", alert_type_t::cluster_member},
    }};

constexpr std::optional<alert_type_t> try_parse_alert_type(
    const std::string_view value) {
  for (const auto& [name, type] : kAlertTypeNames) {
    if (name == value) {
      return type;
    }
  }
  return std::nullopt;
}

constexpr std::string_view alert_type_name(const alert_type_t value) {
  for (const auto& [name, type] : kAlertTypeNames) {
    if (type == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace vigil::schema
