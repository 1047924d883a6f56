#pragma once

#include <vigil/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace vigil::schema {

enum class validation_issue_t : uint8_t {
  non_positive_amount = 0,
  missing_field = 1,
};

/// Advisory finding about a single transaction row.
struct validation_warning final {
  transaction_id_t transaction_id;
  validation_issue_t issue{validation_issue_t::missing_field};
  // Name of the offending field ("amount", "timestamp", ...).
  std::string_view field;
};

using validation_warning_t = validation_warning;

}  // namespace vigil::schema
