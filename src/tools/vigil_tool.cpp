#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <vigil/common/critical.hpp>
#include <vigil/ingest/csv.hpp>
#include <vigil/schema/alert.hpp>
#include <vigil/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;
using storage_t = vigil::storage::storage<vigil::storage::rocksdb_storage_tag>;

storage_t open_storage(const po::variables_map& vm) {
  try {
    return vigil::storage::make_storage<vigil::storage::rocksdb_storage_tag>(
        vm["db-path"].as<std::string>());
  } catch (const vigil::storage::storage_unavailable& ex) {
    vigil::common::critical("Cannot open transaction store: {}", ex.what());
  }
}

// Downstream report generators only accept alerts with every required field.
bool is_complete(const vigil::schema::alert_t& alert) {
  return alert.id != 0 && !alert.transaction_id.empty() &&
         !alert.alert_types.empty();
}

std::string join_types(const vigil::schema::alert_t& alert) {
  auto out = std::string{};
  for (const auto type : alert.alert_types) {
    if (!out.empty()) {
      out.push_back(';');
    }
    out += vigil::schema::alert_type_name(type);
  }
  return out;
}

int run_ingest(const po::variables_map& vm) {
  if (!vm.contains("file")) {
    std::cerr << "ingest requires --file" << std::endl;
    return 1;
  }
  auto asset_class_name = vm["asset-class"].as<std::string>();
  auto asset_class = vigil::schema::try_parse_asset_class(asset_class_name);
  if (!asset_class) {
    std::cerr << "unknown asset class '" << asset_class_name << "'"
              << std::endl;
    return 1;
  }

  auto path = vm["file"].as<std::string>();
  auto input = std::ifstream{path};
  if (!input) {
    std::cerr << "cannot read '" << path << "'" << std::endl;
    return 1;
  }

  auto storage = open_storage(vm);
  auto loaded = uint64_t{};
  auto rejected = uint64_t{};
  auto line_number = uint64_t{};
  auto line = std::string{};
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty() || line.starts_with(vigil::ingest::kCsvHeader)) {
      continue;
    }
    auto error = std::string{};
    auto tx = vigil::ingest::try_parse_transaction_row(line, *asset_class, error);
    if (!tx) {
      spdlog::warn("{}:{}: {}", path, line_number, error);
      ++rejected;
      continue;
    }
    try {
      storage.put_transaction(*tx);
      ++loaded;
    } catch (const vigil::storage::storage_unavailable& ex) {
      spdlog::error("{}:{}: {}", path, line_number, ex.what());
      return 1;
    }
  }
  std::cout << "loaded " << loaded << " transaction(s), rejected " << rejected
            << std::endl;
  return rejected == 0 ? 0 : 2;
}

int run_alerts(const po::variables_map& vm) {
  auto storage = open_storage(vm);
  try {
    auto alerts = storage.list_alerts(vm["from-id"].as<uint64_t>(),
                                      vm["limit"].as<std::size_t>());
    std::cout << "id,transaction_id,alert_types,risk_score,risk_band,pass_id,"
                 "created_at"
              << std::endl;
    for (const auto& alert : alerts) {
      if (!is_complete(alert)) {
        spdlog::warn("Skipping incomplete alert {}", alert.id);
        continue;
      }
      std::cout << alert.id << ',' << alert.transaction_id << ','
                << join_types(alert) << ',' << alert.risk_score << ','
                << vigil::schema::risk_band_name(alert.risk_band) << ','
                << alert.pass_id << ',' << alert.created_at << std::endl;
    }
  } catch (const vigil::storage::storage_unavailable& ex) {
    std::cerr << "cannot list alerts: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto description = po::options_description{"vigil_tool"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(), "ingest or alerts")(
      "db-path", po::value<std::string>()->default_value("vigil.db"),
      "RocksDB directory")(
      "asset-class", po::value<std::string>()->default_value("fiat"),
      "Asset class of ingested rows")(
      "file", po::value<std::string>(),
      "CSV file: id,source,destination,amount,timestamp_ms,jurisdiction")(
      "from-id", po::value<uint64_t>()->default_value(1),
      "First alert id to list")(
      "limit", po::value<std::size_t>()->default_value(1000),
      "Maximum number of alerts to list");
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
  }

  if (vm.contains("help") || !vm.contains("command")) {
    std::cout << description << std::endl;
    return vm.contains("help") ? 0 : 1;
  }

  auto command = vm["command"].as<std::string>();
  if (command == "ingest") {
    return run_ingest(vm);
  }
  if (command == "alerts") {
    return run_alerts(vm);
  }
  std::cerr << "unknown command '" << command << "'" << std::endl;
  return 1;
}
