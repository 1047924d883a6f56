#include <vigil/schema/primitives.hpp>

#include <cctype>
#include <limits>
#include <string_view>

namespace vigil::schema {

namespace {

std::optional<int64_t> digit_value(const char c) {
  if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
    return std::nullopt;
  }
  return static_cast<int64_t>(c - '0');
}

}  // namespace

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

amount_t make_amount(const int64_t whole_units) {
  return whole_units * kAmountScale;
}

std::optional<amount_t> try_parse_amount(std::string_view text) {
  constexpr auto kMax = std::numeric_limits<amount_t>::max();

  auto negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  auto point = text.find('.');
  auto whole = text.substr(0, point);
  auto fraction =
      point == std::string_view::npos ? std::string_view{} : text.substr(point + 1);
  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }
  if (fraction.size() > static_cast<std::size_t>(kAmountDecimals)) {
    return std::nullopt;
  }

  auto value = amount_t{};
  for (const auto c : whole) {
    auto digit = digit_value(c);
    if (!digit) {
      return std::nullopt;
    }
    if (value > (kMax - *digit) / 10) {
      return std::nullopt;
    }
    value = (value * 10) + *digit;
  }
  if (value > kMax / kAmountScale) {
    return std::nullopt;
  }
  value *= kAmountScale;

  auto unit = kAmountScale;
  auto fractional = amount_t{};
  for (const auto c : fraction) {
    auto digit = digit_value(c);
    if (!digit) {
      return std::nullopt;
    }
    unit /= 10;
    fractional += *digit * unit;
  }
  if (value > kMax - fractional) {
    return std::nullopt;
  }
  value += fractional;
  return negative ? -value : value;
}

std::string format_amount(const amount_t amount) {
  auto magnitude = amount < 0 ? uint64_t{0} - static_cast<uint64_t>(amount)
                              : static_cast<uint64_t>(amount);
  auto scale = static_cast<uint64_t>(kAmountScale);
  auto out = std::string{amount < 0 ? "-" : ""};
  out += std::to_string(magnitude / scale);

  auto fraction = magnitude % scale;
  if (fraction == 0) {
    return out;
  }
  auto digits = std::to_string(fraction);
  digits.insert(0, static_cast<std::size_t>(kAmountDecimals) - digits.size(),
                '0');
  while (!digits.empty() && digits.back() == '0') {
    digits.pop_back();
  }
  out.push_back('.');
  out += digits;
  return out;
}

uint64_t day_index(const timestamp_milliseconds_t timestamp) {
  return timestamp / kMillisecondsPerDay;
}

}  // namespace vigil::schema
