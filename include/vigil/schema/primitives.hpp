#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using transaction_id_t = std::string;
using entity_id_t = std::string;
using alert_id_t = uint64_t;
using pass_id_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

/// Signed fixed-point decimal with kAmountScale minor units per whole unit.
using amount_t = int64_t;

inline constexpr auto kAmountDecimals = 8;
inline constexpr auto kAmountScale = amount_t{100'000'000};
inline constexpr auto kMillisecondsPerSecond = duration_milliseconds_t{1'000};
inline constexpr auto kMillisecondsPerDay = duration_milliseconds_t{86'400'000};

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);

/// Whole units to fixed point, e.g. make_amount(10000) is 10 000.00000000.
amount_t make_amount(int64_t whole_units);

/// Parse "1234", "-12.5", "0.00000001". More than kAmountDecimals fractional
/// digits, empty input or overflow yield std::nullopt.
std::optional<amount_t> try_parse_amount(std::string_view text);

/// Render with trailing fractional zeros stripped ("10000", "12.5").
std::string format_amount(amount_t amount);

/// UTC calendar day index since the epoch.
uint64_t day_index(timestamp_milliseconds_t timestamp);

}  // namespace vigil::schema
