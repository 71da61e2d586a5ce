#include <tally/reporting/reports.hpp>
#include <algorithm>
#include <map>

using namespace tally::schema;

namespace tally::reporting {

namespace {

struct totals final {
  amount_t debit{};
  amount_t credit{};
};

/// Debit and credit totals per visible account over entries the predicate
/// accepts.
template <typename Predicate>
std::map<account_id_t, totals> accumulate(
    const std::vector<ledger_entry_t>& entries,
    const report_filter& filter,
    Predicate&& accept) {
  auto result = std::map<account_id_t, totals>{};
  for (const auto& entry : entries) {
    if (!entry_visible(entry, filter) || !accept(entry)) {
      continue;
    }
    auto& total = result[entry.account_id];
    total.debit += entry.amount_dr;
    total.credit += entry.amount_cr;
  }
  return result;
}

account_line make_line(const account_t& account, const totals& total) {
  auto line = account_line{};
  line.account_id = account.account_id;
  line.code = account.code;
  line.name = account.name;
  line.classification = account.classification;
  line.debit = total.debit;
  line.credit = total.credit;
  line.balance =
      signed_balance(account.classification, total.debit, total.credit);
  return line;
}

/// Visible accounts in code order.
std::vector<const account_t*> visible_accounts(
    const std::vector<account_t>& accounts,
    const report_filter& filter) {
  auto visible = std::vector<const account_t*>{};
  for (const auto& account : accounts) {
    if (account_visible(account, filter)) {
      visible.push_back(&account);
    }
  }
  std::sort(std::begin(visible), std::end(visible),
            [](const account_t* lhs, const account_t* rhs) {
              return lhs->code < rhs->code;
            });
  return visible;
}

}  // namespace

bool account_visible(const account_t& account, const report_filter& filter) {
  return !account.security_level ||
         *account.security_level <= filter.max_security_level;
}

bool entry_visible(const ledger_entry_t& entry, const report_filter& filter) {
  return !filter.department || entry.department == filter.department;
}

bool document_visible(const document_state_t& document,
                      const report_filter& filter) {
  if (!filter.department) {
    return true;
  }
  return std::any_of(std::begin(document.lines), std::end(document.lines),
                     [&](const document_line_t& line) {
                       return line.department == filter.department;
                     });
}

trial_balance make_trial_balance(const std::vector<account_t>& accounts,
                                 const std::vector<ledger_entry_t>& entries,
                                 const report_filter& filter,
                                 const std::optional<date_t> start,
                                 const date_t end) {
  auto sums = accumulate(entries, filter, [&](const ledger_entry_t& entry) {
    return (!start || entry.entry_date >= *start) && entry.entry_date <= end;
  });

  auto report = trial_balance{};
  for (const auto* account : visible_accounts(accounts, filter)) {
    auto found = sums.find(account->account_id);
    if (found == std::end(sums)) {
      continue;
    }
    auto net = found->second.debit - found->second.credit;
    if (net == 0) {
      continue;
    }
    auto line = make_line(*account, found->second);
    line.debit = net > 0 ? net : 0;
    line.credit = net < 0 ? -net : 0;
    report.total_debit += line.debit;
    report.total_credit += line.credit;
    report.lines.push_back(std::move(line));
  }
  return report;
}

profit_and_loss make_profit_and_loss(const std::vector<account_t>& accounts,
                                     const std::vector<ledger_entry_t>& entries,
                                     const report_filter& filter,
                                     const date_t start,
                                     const date_t end) {
  auto sums = accumulate(entries, filter, [&](const ledger_entry_t& entry) {
    return entry.entry_date >= start && entry.entry_date <= end;
  });

  auto report = profit_and_loss{};
  for (const auto* account : visible_accounts(accounts, filter)) {
    auto found = sums.find(account->account_id);
    if (found == std::end(sums)) {
      continue;
    }
    auto line = make_line(*account, found->second);
    if (account->classification == account_class_t::income) {
      report.total_income += line.balance;
      report.income.push_back(std::move(line));
    } else if (account->classification == account_class_t::expense) {
      report.total_expenses += line.balance;
      report.expenses.push_back(std::move(line));
    }
  }
  return report;
}

balance_sheet make_balance_sheet(const std::vector<account_t>& accounts,
                                 const std::vector<ledger_entry_t>& entries,
                                 const report_filter& filter,
                                 const date_t as_of) {
  auto sums = accumulate(entries, filter, [&](const ledger_entry_t& entry) {
    return entry.entry_date <= as_of;
  });

  auto report = balance_sheet{};
  for (const auto* account : visible_accounts(accounts, filter)) {
    auto found = sums.find(account->account_id);
    if (found == std::end(sums)) {
      continue;
    }
    auto line = make_line(*account, found->second);
    switch (account->classification) {
      case account_class_t::asset:
        report.total_assets += line.balance;
        report.assets.push_back(std::move(line));
        break;
      case account_class_t::liability:
        report.total_liabilities += line.balance;
        report.liabilities.push_back(std::move(line));
        break;
      case account_class_t::equity:
        report.total_equity += line.balance;
        report.equity.push_back(std::move(line));
        break;
      case account_class_t::income:
        report.current_earnings += line.balance;
        break;
      case account_class_t::expense:
        report.current_earnings -= line.balance;
        break;
    }
  }
  report.total_equity += report.current_earnings;
  return report;
}

std::size_t aging_bucket(const int32_t days_past_due) {
  if (days_past_due <= 0) {
    return 0;
  }
  if (days_past_due <= 30) {
    return 1;
  }
  if (days_past_due <= 60) {
    return 2;
  }
  if (days_past_due <= 90) {
    return 3;
  }
  return 4;
}

aging_report make_aging(const std::vector<document_state_t>& documents,
                        const std::vector<allocation_t>& allocations,
                        const aging_kind_t kind,
                        const date_t as_of,
                        const report_filter& filter) {
  auto paid = std::map<document_id_t, amount_t>{};
  for (const auto& allocation : allocations) {
    if (allocation.effective_date <= as_of) {
      paid[allocation.document_id] += allocation.amount;
    }
  }

  auto wanted = kind == aging_kind_t::receivable
                    ? document_kind_t::sales_invoice
                    : document_kind_t::supplier_bill;
  auto by_contact = std::map<std::string, aging_row>{};
  auto report = aging_report{.kind = kind, .as_of = as_of};
  for (const auto& document : documents) {
    if (document.kind != wanted ||
        document.status != posting_status_t::posted ||
        document.issue_date > as_of || !document_visible(document, filter)) {
      continue;
    }
    auto open = total(document);
    if (auto found = paid.find(document.document_id);
        found != std::end(paid)) {
      open -= found->second;
    }
    if (open <= 0) {
      continue;
    }
    auto bucket = aging_bucket(as_of - document.due_date);
    auto& row = by_contact[document.contact];
    row.contact = document.contact;
    row.buckets[bucket] += open;
    row.total += open;
    report.totals[bucket] += open;
    report.total += open;
  }
  for (auto& [contact, row] : by_contact) {
    report.rows.push_back(std::move(row));
  }
  return report;
}

std::vector<cashflow_line> make_cashflow(
    const std::vector<account_t>& accounts,
    const std::vector<ledger_entry_t>& entries,
    const report_filter& filter,
    const date_t start,
    const date_t end) {
  auto before = accumulate(entries, filter, [&](const ledger_entry_t& entry) {
    return entry.entry_date < start;
  });
  auto during = accumulate(entries, filter, [&](const ledger_entry_t& entry) {
    return entry.entry_date >= start && entry.entry_date <= end;
  });

  auto lines = std::vector<cashflow_line>{};
  for (const auto* account : visible_accounts(accounts, filter)) {
    if (!account->is_bank) {
      continue;
    }
    auto line = cashflow_line{};
    line.account_id = account->account_id;
    line.code = account->code;
    line.name = account->name;
    if (auto found = before.find(account->account_id);
        found != std::end(before)) {
      line.opening = found->second.debit - found->second.credit;
    }
    if (auto found = during.find(account->account_id);
        found != std::end(during)) {
      line.inflow = found->second.debit;
      line.outflow = found->second.credit;
    }
    line.closing = line.opening + line.inflow - line.outflow;
    lines.push_back(std::move(line));
  }
  return lines;
}

bank_register make_bank_register(const std::vector<ledger_entry_t>& entries,
                                 const report_filter& filter,
                                 const date_t start,
                                 const date_t end) {
  auto report = bank_register{};
  for (const auto& entry : entries) {
    if (!entry_visible(entry, filter)) {
      continue;
    }
    if (entry.entry_date < start) {
      report.opening_balance += entry.amount_dr - entry.amount_cr;
    }
  }
  auto running = report.opening_balance;
  for (const auto& entry : entries) {
    if (!entry_visible(entry, filter) || entry.entry_date < start ||
        entry.entry_date > end) {
      continue;
    }
    running += entry.amount_dr - entry.amount_cr;
    report.rows.push_back(register_row{.entry = entry,
                                       .running_balance = running});
  }
  report.closing_balance = running;
  return report;
}

}  // namespace tally::reporting
