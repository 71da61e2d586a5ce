#pragma once

#include <tally/execution/unit_of_work.hpp>
#include <tally/reporting/reports.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <vector>

namespace tally::reporting {

/// Loads records from one snapshot of committed state and folds them into a
/// report. Never writes.
class reporter final {
 public:
  reporter(tally::execution::encoder_t& encoder,
           const tally::execution::storage_t& storage);

  trial_balance trial_balance_for(const tally::schema::company_id_t& company_id,
                                  std::optional<tally::schema::date_t> start,
                                  tally::schema::date_t end,
                                  const report_filter& filter = {}) const;

  profit_and_loss profit_and_loss_for(
      const tally::schema::company_id_t& company_id,
      tally::schema::date_t start,
      tally::schema::date_t end,
      const report_filter& filter = {}) const;

  balance_sheet balance_sheet_for(const tally::schema::company_id_t& company_id,
                                  tally::schema::date_t as_of,
                                  const report_filter& filter = {}) const;

  /// Empty when the receivables or payables control account is above the
  /// filter's security level.
  aging_report aging_for(const tally::schema::company_id_t& company_id,
                         aging_kind_t kind,
                         tally::schema::date_t as_of,
                         const report_filter& filter = {}) const;

  std::vector<cashflow_line> cashflow_for(
      const tally::schema::company_id_t& company_id,
      tally::schema::date_t start,
      tally::schema::date_t end,
      const report_filter& filter = {}) const;

  /// std::nullopt when the account does not exist or is above the filter's
  /// security level.
  std::optional<bank_register> bank_register_for(
      const tally::schema::company_id_t& company_id,
      const tally::schema::account_id_t& account_id,
      tally::schema::date_t start,
      tally::schema::date_t end,
      const report_filter& filter = {}) const;

 private:
  tally::execution::encoder_t& encoder_;
  const tally::execution::storage_t& storage_;
};

}  // namespace tally::reporting
