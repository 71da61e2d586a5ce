#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tally/blake3/hash.hpp>
#include <tally/execution/engine.hpp>
#include <tally/reconciliation/bank_feed.hpp>
#include <tally/reporting/reporter.hpp>
#include <tally/scheduler/scheduler.hpp>
#include <tally/schema/date.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace tally::schema;

namespace {

namespace po = boost::program_options;

inline constexpr auto kCommands = std::array<std::string_view, 9>{
    "trial-balance", "profit-and-loss", "balance-sheet",
    "aging",         "cashflow",        "bank-register",
    "unmatched",     "run-recurring",   "retention-sweep"};

struct cli_options final {
  std::string db_path;
  std::string company;
  std::string command;
  std::string actor;
  std::optional<std::string> from;
  std::optional<std::string> to;
  std::optional<std::string> account;
  std::optional<std::string> department;
  std::string aging_kind;
  uint32_t security_level{};
  uint32_t match_window_days{};
  std::string log_level;
  std::string log_file;
};

timestamp_milliseconds_t now_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

/// A 64 digit hex id is used as is; any other text is hashed into an id.
hash32_t resolve_id(const std::string_view text) {
  if (auto id = try_make_hash32(text)) {
    return *id;
  }
  return tally::blake3::hash(text);
}

std::optional<date_t> parse_date_option(const std::optional<std::string>& text,
                                        const std::string_view name) {
  if (!text) {
    return std::nullopt;
  }
  auto date = try_parse_date(*text);
  if (!date) {
    throw po::error{fmt::format("--{} must be an ISO date, got '{}'", name,
                                *text)};
  }
  return date;
}

void print_line(const tally::reporting::account_line& line,
                const amount_t amount) {
  fmt::print("  {:<8} {:<32} {:>14}\n", line.code, line.name,
             format_amount(amount));
}

int run(const cli_options& options) {
  auto encoder = tally::execution::encoder_t{};
  auto storage =
      tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(
          options.db_path);
  auto engine = tally::execution::engine{
      encoder, storage,
      tally::execution::engine_options{.match_window_days =
                                           options.match_window_days}};
  auto reporter = tally::reporting::reporter{encoder, storage};

  auto company_id = resolve_id(options.company);
  auto now = now_milliseconds();
  auto today = date_of(now);
  auto from = parse_date_option(options.from, "from");
  auto to = parse_date_option(options.to, "to").value_or(today);
  auto filter = tally::reporting::report_filter{
      .department = options.department,
      .max_security_level = options.security_level};

  auto resolve_account = [&]() -> std::optional<account_t> {
    if (!options.account) {
      spdlog::error("--account is required for {}", options.command);
      return std::nullopt;
    }
    auto account = engine.find_account_by_code(company_id, *options.account);
    if (!account) {
      spdlog::error("Account {} not found", *options.account);
    }
    return account;
  };

  if (options.command == "trial-balance") {
    auto report = reporter.trial_balance_for(company_id, from, to, filter);
    fmt::print("Trial balance to {}\n", to_iso_string(to));
    for (const auto& line : report.lines) {
      fmt::print("  {:<8} {:<32} {:>14} {:>14}\n", line.code, line.name,
                 line.debit > 0 ? format_amount(line.debit) : "",
                 line.credit > 0 ? format_amount(line.credit) : "");
    }
    fmt::print("  {:<41} {:>14} {:>14}\n", "Total",
               format_amount(report.total_debit),
               format_amount(report.total_credit));
    return report.balanced() ? 0 : 2;
  }
  if (options.command == "profit-and-loss") {
    auto start = from.value_or(make_date(1970, 1, 1));
    auto report = reporter.profit_and_loss_for(company_id, start, to, filter);
    fmt::print("Profit and loss {} to {}\nIncome\n", to_iso_string(start),
               to_iso_string(to));
    for (const auto& line : report.income) {
      print_line(line, line.balance);
    }
    fmt::print("Expenses\n");
    for (const auto& line : report.expenses) {
      print_line(line, line.balance);
    }
    fmt::print("Net profit {}\n", format_amount(report.net_profit()));
    return 0;
  }
  if (options.command == "balance-sheet") {
    auto report = reporter.balance_sheet_for(company_id, to, filter);
    fmt::print("Balance sheet as of {}\nAssets\n", to_iso_string(to));
    for (const auto& line : report.assets) {
      print_line(line, line.balance);
    }
    fmt::print("Liabilities\n");
    for (const auto& line : report.liabilities) {
      print_line(line, line.balance);
    }
    fmt::print("Equity\n");
    for (const auto& line : report.equity) {
      print_line(line, line.balance);
    }
    fmt::print("  {:<41} {:>14}\n", "Current earnings",
               format_amount(report.current_earnings));
    fmt::print("Assets {} Liabilities {} Equity {}\n",
               format_amount(report.total_assets),
               format_amount(report.total_liabilities),
               format_amount(report.total_equity));
    return report.balanced() ? 0 : 2;
  }
  if (options.command == "aging") {
    auto kind = tally::schema::from_string(options.aging_kind,
                                           tally::reporting::kAgingKindMappings)
                    .value_or(tally::reporting::aging_kind_t::receivable);
    auto report = reporter.aging_for(company_id, kind, to, filter);
    fmt::print("{} aging as of {}\n  {:<24}", options.aging_kind,
               to_iso_string(to), "Contact");
    for (const auto name : tally::reporting::kAgingBucketNames) {
      fmt::print(" {:>12}", name);
    }
    fmt::print(" {:>12}\n", "Total");
    for (const auto& row : report.rows) {
      fmt::print("  {:<24}", row.contact);
      for (const auto amount : row.buckets) {
        fmt::print(" {:>12}", format_amount(amount));
      }
      fmt::print(" {:>12}\n", format_amount(row.total));
    }
    fmt::print("  {:<24}", "Total");
    for (const auto amount : report.totals) {
      fmt::print(" {:>12}", format_amount(amount));
    }
    fmt::print(" {:>12}\n", format_amount(report.total));
    return 0;
  }
  if (options.command == "cashflow") {
    auto start = from.value_or(make_date(1970, 1, 1));
    fmt::print("Cashflow {} to {}\n", to_iso_string(start), to_iso_string(to));
    for (const auto& line :
         reporter.cashflow_for(company_id, start, to, filter)) {
      fmt::print("  {:<8} {:<24} open {:>12} in {:>12} out {:>12} close {:>12}\n",
                 line.code, line.name, format_amount(line.opening),
                 format_amount(line.inflow), format_amount(line.outflow),
                 format_amount(line.closing));
    }
    return 0;
  }
  if (options.command == "bank-register") {
    auto account = resolve_account();
    if (!account) {
      return 1;
    }
    auto start = from.value_or(make_date(1970, 1, 1));
    auto report = reporter.bank_register_for(company_id, account->account_id,
                                             start, to, filter);
    if (!report) {
      spdlog::error("Account {} is above security level {}", account->code,
                    options.security_level);
      return 1;
    }
    fmt::print("{} {} register\n  {:<10} {:<32} {:>12}\n", account->code,
               account->name, to_iso_string(start), "Opening balance",
               format_amount(report->opening_balance));
    for (const auto& row : report->rows) {
      fmt::print("  {:<10} {:<32} {:>12} {:>12} {:>12}\n",
                 to_iso_string(row.entry.entry_date),
                 row.entry.memo.value_or(""),
                 format_amount(row.entry.amount_dr),
                 format_amount(row.entry.amount_cr),
                 format_amount(row.running_balance));
    }
    fmt::print("  {:<10} {:<32} {:>12}\n", to_iso_string(to),
               "Closing balance", format_amount(report->closing_balance));
    return 0;
  }
  if (options.command == "unmatched") {
    auto account = resolve_account();
    if (!account) {
      return 1;
    }
    auto work = tally::execution::unit_of_work{
        encoder, storage, tally::execution::unit_of_work::read_only};
    auto summary = tally::reconciliation::summarize_unmatched(
        work, company_id, account->account_id);
    fmt::print("{} unmatched items totalling {}{}\n", summary.count,
               format_amount(summary.total),
               summary.oldest
                   ? fmt::format(", oldest {}", to_iso_string(*summary.oldest))
                   : std::string{});
    for (const auto& item : tally::reconciliation::oldest_unmatched(
             work, company_id, account->account_id, 20)) {
      fmt::print("  {:<10} {:<16} {:>12} {}\n", to_iso_string(item.posted_date),
                 item.fit_id, format_amount(item.amount), item.description);
    }
    return 0;
  }
  if (options.command == "run-recurring") {
    auto scheduler = tally::scheduler::scheduler{engine};
    auto summary = scheduler.run_recurring(company_id, resolve_id(options.actor),
                                           to, now);
    fmt::print("{} run(s) executed, {} failed\n", summary.executed,
               summary.failed);
    return summary.failed == 0 ? 0 : 2;
  }
  if (options.command == "retention-sweep") {
    auto scheduler = tally::scheduler::scheduler{engine};
    fmt::print("{} audit event(s) purged\n",
               scheduler.enforce_retention(company_id, now));
    return 0;
  }
  spdlog::error("Unknown command '{}'", options.command);
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = cli_options{};
  auto config_path = std::string{};

  auto description = po::options_description{"Tally"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI style file with option defaults")(
      "db", po::value<std::string>(&options.db_path)->default_value("tally.db"),
      "RocksDB directory")(
      "company", po::value<std::string>(&options.company)->required(),
      "Company id (hex) or name")(
      "command", po::value<std::string>(&options.command)->required(),
      "One of trial-balance, profit-and-loss, balance-sheet, aging, cashflow, "
      "bank-register, unmatched, run-recurring, retention-sweep")(
      "from", po::value<std::string>(), "Start date (YYYY-MM-DD)")(
      "to", po::value<std::string>(), "End or as-of date, default today")(
      "account", po::value<std::string>(), "Account code")(
      "department", po::value<std::string>(), "Department filter")(
      "kind", po::value<std::string>(&options.aging_kind)
                  ->default_value("receivable"),
      "Aging kind: receivable or payable")(
      "security-level",
      po::value<uint32_t>(&options.security_level)->default_value(0),
      "Highest account security level included in reports")(
      "match-window-days",
      po::value<uint32_t>(&options.match_window_days)->default_value(3),
      "Bank feed matching window")(
      "actor", po::value<std::string>(&options.actor)->default_value("cli"),
      "Actor recorded on scheduled postings")(
      "log-level", po::value<std::string>(&options.log_level)
                       ->default_value("info"),
      "trace, debug, info, warn, error or critical")(
      "log-file", po::value<std::string>(&options.log_file)
                      ->default_value("tally.log"),
      "Log file path");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto file = std::ifstream{vm["config"].as<std::string>()};
      if (!file) {
        std::cerr << "Cannot open config file "
                  << vm["config"].as<std::string>() << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    po::notify(vm);
    if (std::find(std::begin(kCommands), std::end(kCommands),
                  options.command) == std::end(kCommands)) {
      throw po::error{fmt::format("unknown command '{}'", options.command)};
    }
    if (!tally::schema::from_string(options.aging_kind,
                                    tally::reporting::kAgingKindMappings)) {
      throw po::error{fmt::format(
          "--kind must be one of {}",
          tally::schema::join_names(tally::reporting::kAgingKindMappings))};
    }
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }
  auto optional_value = [&](const char* name) -> std::optional<std::string> {
    if (vm.contains(name)) {
      return vm[name].as<std::string>();
    }
    return std::nullopt;
  };
  options.from = optional_value("from");
  options.to = optional_value("to");
  options.account = optional_value("account");
  options.department = optional_value("department");

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "tally", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options.log_level));

  auto status = 0;
  try {
    status = run(options);
  } catch (const po::error& ex) {
    spdlog::error("{}", ex.what());
    status = 1;
  }
  spdlog::shutdown();
  return status;
}
