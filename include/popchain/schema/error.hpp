#pragma once

#include <popchain/schema/transaction_error_code.hpp>
#include <string>

namespace popchain::schema {

/// Failure detail reported by constructors that return `std::optional`.
struct failure_t final {
  transaction_error_code code{transaction_error_code::invalid_transaction};
  std::string message;
};

}  // namespace popchain::schema
