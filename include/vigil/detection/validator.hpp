#pragma once

#include <vigil/schema/transaction.hpp>
#include <vigil/schema/validation_warning.hpp>
#include <vector>

namespace vigil::detection {

/// Report malformed rows: amount <= 0, or any of timestamp, amount, source,
/// destination missing. Purely advisory; the batch is left untouched.
std::vector<vigil::schema::validation_warning_t> validate(
    const std::vector<vigil::schema::transaction_t>& batch);

}  // namespace vigil::detection
