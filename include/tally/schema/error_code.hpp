#pragma once

#include <cstdint>

namespace tally::schema {

// Result codes of rejected commands. Zero is success.
enum class error_code : uint32_t {
  invalid_command = 1,
  unsupported_version = 2,
  invalid_state = 3,
  empty_transaction = 4,
  unbalanced_transaction = 5,
  invalid_amount = 6,
  not_found = 7,
  inactive_account = 8,
  already_exists = 9,
  over_allocation = 10,
  exceeds_balance = 11,
  has_allocations = 12,
  already_allocated = 13,
  type_mismatch = 14,
  duplicate_import = 15,
  amount_mismatch = 16,
  no_match = 17,
  version_conflict = 18,
};

}  // namespace tally::schema
