#pragma once

#include <vigil/schema/primitives.hpp>
#include <chrono>
#include <functional>

namespace vigil::monitoring {

using now_fn_t = std::function<vigil::schema::timestamp_milliseconds_t()>;

inline vigil::schema::timestamp_milliseconds_t system_now() {
  return static_cast<vigil::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace vigil::monitoring
