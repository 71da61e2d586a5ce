#include <tally/execution/repository.hpp>
#include <tally/ledger/ledger.hpp>
#include <tally/reporting/reporter.hpp>
#include <limits>

using namespace tally::schema;
using tally::execution::unit_of_work;

namespace tally::reporting {

namespace {

constexpr auto kBeginningOfTime = std::numeric_limits<date_t>::min();

}  // namespace

reporter::reporter(tally::execution::encoder_t& encoder,
                   const tally::execution::storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

trial_balance reporter::trial_balance_for(const company_id_t& company_id,
                                          const std::optional<date_t> start,
                                          const date_t end,
                                          const report_filter& filter) const {
  auto work = unit_of_work{encoder_, storage_, unit_of_work::read_only};
  return make_trial_balance(
      tally::execution::load_accounts(work, company_id),
      tally::ledger::entries_in_range(work, company_id,
                                      start.value_or(kBeginningOfTime), end),
      filter, start, end);
}

profit_and_loss reporter::profit_and_loss_for(
    const company_id_t& company_id,
    const date_t start,
    const date_t end,
    const report_filter& filter) const {
  auto work = unit_of_work{encoder_, storage_, unit_of_work::read_only};
  return make_profit_and_loss(
      tally::execution::load_accounts(work, company_id),
      tally::ledger::entries_in_range(work, company_id, start, end), filter,
      start, end);
}

balance_sheet reporter::balance_sheet_for(const company_id_t& company_id,
                                          const date_t as_of,
                                          const report_filter& filter) const {
  auto work = unit_of_work{encoder_, storage_, unit_of_work::read_only};
  return make_balance_sheet(
      tally::execution::load_accounts(work, company_id),
      tally::ledger::entries_in_range(work, company_id, kBeginningOfTime,
                                      as_of),
      filter, as_of);
}

aging_report reporter::aging_for(const company_id_t& company_id,
                                 const aging_kind_t kind,
                                 const date_t as_of,
                                 const report_filter& filter) const {
  auto work = unit_of_work{encoder_, storage_, unit_of_work::read_only};
  auto settings = tally::execution::load_company_settings(work, company_id);
  auto control = tally::execution::load_account_by_code(
      work, company_id,
      kind == aging_kind_t::receivable ? settings.receivables_code
                                       : settings.payables_code);
  if (control && !account_visible(*control, filter)) {
    return aging_report{.kind = kind, .as_of = as_of};
  }
  return make_aging(tally::execution::load_documents(work, company_id),
                    tally::execution::load_allocations(work, company_id), kind,
                    as_of, filter);
}

std::vector<cashflow_line> reporter::cashflow_for(
    const company_id_t& company_id,
    const date_t start,
    const date_t end,
    const report_filter& filter) const {
  auto work = unit_of_work{encoder_, storage_, unit_of_work::read_only};
  return make_cashflow(
      tally::execution::load_accounts(work, company_id),
      tally::ledger::entries_in_range(work, company_id, kBeginningOfTime, end),
      filter, start, end);
}

std::optional<bank_register> reporter::bank_register_for(
    const company_id_t& company_id,
    const account_id_t& account_id,
    const date_t start,
    const date_t end,
    const report_filter& filter) const {
  auto work = unit_of_work{encoder_, storage_, unit_of_work::read_only};
  auto account = tally::execution::load_account(work, company_id, account_id);
  if (!account || !account_visible(*account, filter)) {
    return std::nullopt;
  }
  return make_bank_register(
      tally::ledger::entries_in_range(work, company_id, account_id,
                                      kBeginningOfTime, end),
      filter, start, end);
}

}  // namespace tally::reporting
