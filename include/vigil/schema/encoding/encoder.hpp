#pragma once
#include <vigil/schema/primitives.hpp>
#include <optional>
#include <span>

namespace vigil::schema::encoding {

/// Value codec selected at build time by tag, the same way storage backends
/// are. Every persisted record goes through an encoder specialization.
template <typename Library>
struct encoder {
  template <typename T>
  vigil::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const vigil::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const vigil::schema::bytes_view_t& bytes);
};

}  // namespace vigil::schema::encoding
