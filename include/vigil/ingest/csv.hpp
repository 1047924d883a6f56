#pragma once

#include <vigil/schema/asset_class.hpp>
#include <vigil/schema/transaction.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace vigil::ingest {

inline constexpr auto kCsvHeader =
    std::string_view{"id,source,destination,amount,timestamp_ms,jurisdiction"};

/// Parse one CSV row in kCsvHeader layout. Empty source, destination, amount
/// or timestamp cells become missing fields; the id is required. On failure
/// `error` holds a human-readable reason.
std::optional<vigil::schema::transaction_t> try_parse_transaction_row(
    std::string_view line,
    vigil::schema::asset_class_t asset_class,
    std::string& error);

}  // namespace vigil::ingest
