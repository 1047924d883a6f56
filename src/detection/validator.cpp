#include <vigil/detection/validator.hpp>

using namespace vigil::schema;

namespace vigil::detection {

std::vector<validation_warning_t> validate(
    const std::vector<transaction_t>& batch) {
  auto warnings = std::vector<validation_warning_t>{};

  auto report = [&](const transaction_t& tx, const validation_issue_t issue,
                    const std::string_view field) {
    warnings.push_back(validation_warning_t{
        .transaction_id = tx.id, .issue = issue, .field = field});
  };

  for (const auto& tx : batch) {
    if (tx.amount.has_value() && *tx.amount <= 0) {
      report(tx, validation_issue_t::non_positive_amount, "amount");
    }
    if (!tx.timestamp.has_value()) {
      report(tx, validation_issue_t::missing_field, "timestamp");
    }
    if (!tx.amount.has_value()) {
      report(tx, validation_issue_t::missing_field, "amount");
    }
    if (!tx.source.has_value()) {
      report(tx, validation_issue_t::missing_field, "source");
    }
    if (!tx.destination.has_value()) {
      report(tx, validation_issue_t::missing_field, "destination");
    }
  }
  return warnings;
}

}  // namespace vigil::detection
