#pragma once
#include <tally/schema/company_settings.hpp>
#include <tally/schema/primitives.hpp>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct configure_company;

template <>
struct configure_company<1> final {
  uint16_t version{1};
  std::string receivables_code{"1100"};
  std::string payables_code{"2100"};
  std::string tax_paid_code{"1150"};
  std::string tax_collected_code{"2200"};
  uint32_t audit_retention_days{kDefaultAuditRetentionDays};
};

using configure_company_t = configure_company<1>;

}  // namespace tally::schema
