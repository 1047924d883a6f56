#include <vigil/ingest/csv.hpp>

#include <charconv>
#include <vector>

namespace vigil::ingest {

namespace {

std::vector<std::string_view> split_cells(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  auto cells = std::vector<std::string_view>{};
  while (true) {
    auto comma = line.find(',');
    cells.push_back(line.substr(0, comma));
    if (comma == std::string_view::npos) {
      break;
    }
    line.remove_prefix(comma + 1);
  }
  return cells;
}

std::optional<std::string> optional_cell(const std::string_view cell) {
  if (cell.empty()) {
    return std::nullopt;
  }
  return std::string{cell};
}

}  // namespace

std::optional<vigil::schema::transaction_t> try_parse_transaction_row(
    const std::string_view line,
    const vigil::schema::asset_class_t asset_class,
    std::string& error) {
  auto cells = split_cells(line);
  if (cells.size() != 6) {
    error = "expected 6 columns, found " + std::to_string(cells.size());
    return std::nullopt;
  }
  if (cells[0].empty()) {
    error = "missing transaction id";
    return std::nullopt;
  }

  auto tx = vigil::schema::transaction_t{};
  tx.id = std::string{cells[0]};
  tx.asset_class = asset_class;
  tx.source = optional_cell(cells[1]);
  tx.destination = optional_cell(cells[2]);
  tx.jurisdiction = std::string{cells[5]};

  if (!cells[3].empty()) {
    tx.amount = vigil::schema::try_parse_amount(cells[3]);
    if (!tx.amount) {
      error = "invalid amount '" + std::string{cells[3]} + "'";
      return std::nullopt;
    }
  }

  if (!cells[4].empty()) {
    auto timestamp = vigil::schema::timestamp_milliseconds_t{};
    auto [end, ec] = std::from_chars(
        cells[4].data(), cells[4].data() + cells[4].size(), timestamp);
    if (ec != std::errc{} || end != cells[4].data() + cells[4].size()) {
      error = "invalid timestamp '" + std::string{cells[4]} + "'";
      return std::nullopt;
    }
    tx.timestamp = timestamp;
  }
  return tx;
}

}  // namespace vigil::ingest
