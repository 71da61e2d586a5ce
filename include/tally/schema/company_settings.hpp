#pragma once
#include <tally/schema/primitives.hpp>
#include <string>

namespace tally::schema {

inline constexpr uint32_t kDefaultAuditRetentionDays{2555};
inline constexpr uint32_t kMinimumAuditRetentionDays{90};

template <uint16_t Version>
struct company_settings;

// Control accounts are referenced by code and resolved through the
// account directory at posting time.
template <>
struct company_settings<1> final {
  uint16_t version{1};
  company_id_t company_id{};
  std::string receivables_code{"1100"};
  std::string payables_code{"2100"};
  std::string tax_paid_code{"1150"};
  std::string tax_collected_code{"2200"};
  uint32_t audit_retention_days{kDefaultAuditRetentionDays};
};

using company_settings_t = company_settings<1>;

}  // namespace tally::schema
