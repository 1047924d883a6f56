#include <boost/program_options.hpp>
#include <vigil/config/config.hpp>
#include <vigil/schema/alert_type.hpp>

#include <chrono>
#include <fstream>
#include <iterator>
#include <string_view>
#include <vector>

namespace po = boost::program_options;

namespace vigil::config {

namespace {

std::string_view trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

std::vector<vigil::schema::alert_type_t> parse_rule_list(
    const std::string& text) {
  auto rules = std::vector<vigil::schema::alert_type_t>{};
  auto rest = std::string_view{text};
  while (!rest.empty()) {
    auto comma = rest.find(',');
    auto name = trim(rest.substr(0, comma));
    rest = comma == std::string_view::npos ? std::string_view{}
                                           : rest.substr(comma + 1);
    if (name.empty()) {
      continue;
    }
    auto type = vigil::schema::try_parse_alert_type(name);
    if (!type) {
      throw config_error{"unknown rule '" + std::string{name} + "'"};
    }
    rules.push_back(*type);
  }
  return rules;
}

vigil::schema::amount_t parse_amount_option(const po::variables_map& vm,
                                            const std::string& name) {
  auto text = vm[name].as<std::string>();
  auto amount = vigil::schema::try_parse_amount(text);
  if (!amount) {
    throw config_error{"invalid amount '" + text + "' for --" + name};
  }
  return *amount;
}

spdlog::level::level_enum parse_log_level(const std::string& text) {
  auto level = spdlog::level::from_str(text);
  if (level == spdlog::level::off && text != "off") {
    throw config_error{"unknown log level '" + text + "'"};
  }
  return level;
}

template <typename T>
void override_if_set(const po::variables_map& vm,
                     const std::string& name,
                     T& target) {
  if (vm.contains(name)) {
    target = vm[name].as<T>();
  }
}

std::string weight_option(const std::string_view tag) {
  return "weight." + std::string{tag};
}

}  // namespace

std::optional<monitor_config> parse_config(const int argc,
                                           const char* const argv[],
                                           std::ostream& out) {
  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI style configuration file");

  auto monitoring = po::options_description{"Monitoring"};
  monitoring.add_options()(
      "db-path", po::value<std::string>()->default_value("vigil.db"),
      "RocksDB directory holding transactions and alerts")(
      "asset-class", po::value<std::string>()->default_value("fiat"),
      "Profile supplying default rules: fiat or crypto")(
      "rules", po::value<std::string>(),
      "Comma separated rule tags, overriding the profile")(
      "threshold", po::value<std::string>(), "High value threshold")(
      "risk-list", po::value<std::vector<std::string>>()->composing(),
      "High risk entity (repeatable)")(
      "high-risk-jurisdiction",
      po::value<std::vector<std::string>>()->composing(),
      "High risk country code or chain tag (repeatable)")(
      "frequency-gap-seconds", po::value<uint64_t>(),
      "Minimum gap between transfers from one source")(
      "round-amount-unit", po::value<std::string>(),
      "Amounts that are exact multiples of this unit are flagged")(
      "daily-frequency-limit", po::value<uint64_t>(),
      "Maximum transfers per source per day")(
      "graph-node-limit", po::value<uint64_t>(),
      "Skip cluster detection above this many entities")(
      "graph-edge-limit", po::value<uint64_t>(),
      "Skip cluster detection above this many transfers (0 = unbounded)")(
      "cluster-size-limit", po::value<uint64_t>(),
      "Clusters with more entities than this are flagged")(
      "retention-days", po::value<uint32_t>()->default_value(30),
      "Archive transactions older than this many days (0 = never)")(
      "poll-interval-seconds", po::value<uint64_t>()->default_value(300),
      "Sleep between monitoring passes")(
      "max-passes", po::value<uint64_t>()->default_value(0),
      "Stop after this many passes (0 = run until signalled)")(
      "score-cap", po::value<uint32_t>(), "Upper bound of the risk score")(
      "high-risk-score", po::value<uint32_t>(),
      "Scores at or above this are reported as high risk");
  for (const auto& [name, type] : vigil::schema::kAlertTypeNames) {
    monitoring.add_options()(weight_option(name).c_str(),
                             po::value<uint32_t>(),
                             "Risk score weight of the rule");
  }

  auto logging = po::options_description{"Logging"};
  logging.add_options()("log-level",
                        po::value<std::string>()->default_value("info"),
                        "trace, debug, info, warn, err, critical or off")(
      "log-file", po::value<std::string>()->default_value("vigil.log"),
      "Log file path");

  auto command_line = po::options_description{"vigild"};
  command_line.add(generic).add(monitoring).add(logging);
  auto config_file = po::options_description{};
  config_file.add(monitoring).add(logging);

  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, command_line), vm);
  if (vm.contains("help")) {
    out << command_line << std::endl;
    return std::nullopt;
  }
  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    auto file = std::ifstream{path};
    if (!file) {
      throw config_error{"cannot read configuration file '" + path + "'"};
    }
    po::store(po::parse_config_file(file, config_file), vm);
  }
  po::notify(vm);

  auto config = monitor_config{};
  config.db_path = vm["db-path"].as<std::string>();

  auto asset_class_name = vm["asset-class"].as<std::string>();
  auto asset_class = vigil::schema::try_parse_asset_class(asset_class_name);
  if (!asset_class) {
    throw config_error{"unknown asset class '" + asset_class_name + "'"};
  }
  config.asset_class = *asset_class;

  auto& policy = config.policy;
  policy = vigil::detection::make_default_policy(config.asset_class);
  if (vm.contains("rules")) {
    policy.rules = parse_rule_list(vm["rules"].as<std::string>());
  }
  if (vm.contains("threshold")) {
    policy.threshold = parse_amount_option(vm, "threshold");
  }
  if (vm.contains("risk-list")) {
    auto entries = vm["risk-list"].as<std::vector<std::string>>();
    policy.risk_list = {std::begin(entries), std::end(entries)};
  }
  if (vm.contains("high-risk-jurisdiction")) {
    auto entries = vm["high-risk-jurisdiction"].as<std::vector<std::string>>();
    policy.high_risk_jurisdictions = {std::begin(entries), std::end(entries)};
  }
  if (vm.contains("frequency-gap-seconds")) {
    policy.frequency_gap = vm["frequency-gap-seconds"].as<uint64_t>() *
                           vigil::schema::kMillisecondsPerSecond;
  }
  if (vm.contains("round-amount-unit")) {
    policy.round_amount_unit = parse_amount_option(vm, "round-amount-unit");
  }
  override_if_set(vm, "daily-frequency-limit", policy.daily_frequency_limit);
  override_if_set(vm, "graph-node-limit", policy.graph_node_limit);
  override_if_set(vm, "graph-edge-limit", policy.graph_edge_limit);
  override_if_set(vm, "cluster-size-limit", policy.cluster_size_limit);
  override_if_set(vm, "score-cap", policy.scoring.score_cap);
  override_if_set(vm, "high-risk-score", policy.scoring.high_risk_score);
  for (const auto& [name, type] : vigil::schema::kAlertTypeNames) {
    auto option = weight_option(name);
    if (vm.contains(option)) {
      policy.scoring.weights[type] = vm[option].as<uint32_t>();
    }
  }
  if (policy.scoring.score_cap > 100) {
    throw config_error{"score cap must not exceed 100"};
  }

  auto poll_seconds = vm["poll-interval-seconds"].as<uint64_t>();
  if (poll_seconds == 0) {
    throw config_error{"poll interval must be at least one second"};
  }
  constexpr auto kMaxPollSeconds =
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::milliseconds::max())
          .count();
  if (poll_seconds > static_cast<uint64_t>(kMaxPollSeconds)) {
    throw config_error{"poll interval of " + std::to_string(poll_seconds) +
                       " seconds is out of range"};
  }
  config.loop.poll_interval = std::chrono::seconds{
      static_cast<std::chrono::seconds::rep>(poll_seconds)};
  config.loop.retention_days = vm["retention-days"].as<uint32_t>();
  config.loop.max_passes = vm["max-passes"].as<uint64_t>();

  config.logging.level = parse_log_level(vm["log-level"].as<std::string>());
  config.logging.file = vm["log-file"].as<std::string>();
  return config;
}

}  // namespace vigil::config
