#pragma once

#include <vigil/schema/asset_class.hpp>
#include <vigil/schema/primitives.hpp>
#include <optional>

namespace vigil::schema {

template <uint16_t Version>
struct transaction;

/// A transfer under review. Ingestion may leave any of the optional fields
/// unset; such rows are reported by the validator and still evaluated.
template <>
struct transaction<1> final {
  uint16_t version{1};
  transaction_id_t id;
  asset_class_t asset_class{asset_class_t::fiat};
  std::optional<entity_id_t> source;
  std::optional<entity_id_t> destination;
  std::optional<amount_t> amount;
  std::optional<timestamp_milliseconds_t> timestamp;
  // Country code for fiat, network tag for crypto.
  std::string jurisdiction;
  bool reviewed{false};
};

using transaction_t = transaction<1>;

}  // namespace vigil::schema
