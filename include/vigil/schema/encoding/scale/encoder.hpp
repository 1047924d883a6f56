#pragma once
#include <vigil/schema/encoding/encoder.hpp>
#include <vigil/schema/encoding/scale/alert.hpp>
#include <vigil/schema/encoding/scale/alert_type.hpp>
#include <vigil/schema/encoding/scale/asset_class.hpp>
#include <vigil/schema/encoding/scale/risk_band.hpp>
#include <vigil/schema/encoding/scale/transaction.hpp>
#include <scale/scale.hpp>
#include <stdexcept>

namespace vigil::schema::encoding {

struct scale_encoder_tag {};

/// Raised by encoder<scale_encoder_tag>::decode on malformed input. Storage
/// reads through try_decode instead and logs and skips undecodable records.
struct decode_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  vigil::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const vigil::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const vigil::schema::bytes_view_t& bytes);
};

template <typename T>
vigil::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    throw std::runtime_error{"failed to encode SCALE object"};
  }
  return encoded.value();
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const vigil::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    throw decode_error{"failed to decode SCALE bytes"};
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const vigil::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace vigil::schema::encoding
