#pragma once

#include <vigil/schema/alert_type.hpp>
#include <vigil/schema/primitives.hpp>
#include <vigil/schema/risk_band.hpp>
#include <vector>

namespace vigil::schema {

template <uint16_t Version>
struct alert;

template <>
struct alert<1> final {
  uint16_t version{1};
  alert_id_t id{};
  transaction_id_t transaction_id;
  std::vector<alert_type_t> alert_types;
  uint32_t risk_score{};
  risk_band_t risk_band{risk_band_t::moderate};
  pass_id_t pass_id{};
  timestamp_milliseconds_t created_at{};
};

using alert_t = alert<1>;

}  // namespace vigil::schema
