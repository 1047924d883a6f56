#pragma once

#include <spdlog/common.h>
#include <vigil/detection/policy.hpp>
#include <vigil/monitoring/loop.hpp>
#include <vigil/schema/asset_class.hpp>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace vigil::config {

/// Option value that parsed but is not acceptable (unknown rule tag,
/// malformed amount, zero poll interval, ...).
struct config_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct logging_config final {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string file{"vigil.log"};
};

struct monitor_config final {
  std::string db_path{"vigil.db"};
  vigil::schema::asset_class_t asset_class{vigil::schema::asset_class_t::fiat};
  vigil::detection::detection_policy policy;
  vigil::monitoring::loop_options loop;
  logging_config logging;
};

/// Parse the command line and, when --config is given, an INI style file.
/// Command line values win over file values; anything left unset falls back
/// to the asset-class profile. Returns std::nullopt after printing the help
/// text to out when --help is present.
///
/// Throws config_error or boost::program_options::error.
std::optional<monitor_config> parse_config(int argc,
                                           const char* const argv[],
                                           std::ostream& out);

}  // namespace vigil::config
