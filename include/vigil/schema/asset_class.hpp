#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: asset class.
// Monitoring profile: selects entity/jurisdiction semantics (accounts and
// country codes for fiat, wallet addresses and chain tags for crypto).
namespace vigil::schema {

enum class asset_class_t : uint8_t {
  fiat = 0,
  crypto = 1,
};

inline constexpr auto kAssetClassNames =
    std::array<std::pair<std::string_view, asset_class_t>, 2>{{
        {"fiat", asset_class_t::fiat},
        {"crypto", asset_class_t::crypto},
    }};

constexpr std::optional<asset_class_t> try_parse_asset_class(
    const std::string_view value) {
  for (const auto& [name, asset_class] : kAssetClassNames) {
    if (name == value) {
      return asset_class;
    }
  }
  return std::nullopt;
}

constexpr std::string_view asset_class_name(const asset_class_t value) {
  for (const auto& [name, asset_class] : kAssetClassNames) {
    if (asset_class == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace vigil::schema
