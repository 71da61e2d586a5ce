#include <tally/schema/date.hpp>

#include <charconv>
#include <chrono>

#include <fmt/format.h>

namespace tally::schema {

namespace {

std::chrono::year_month_day to_civil(const date_t date) {
  return std::chrono::year_month_day{
      std::chrono::sys_days{std::chrono::days{date}}};
}

date_t from_civil(const std::chrono::year_month_day& civil) {
  return static_cast<date_t>(
      std::chrono::sys_days{civil}.time_since_epoch().count());
}

template <typename T>
std::optional<T> parse_digits(const std::string_view text) {
  auto value = T{};
  auto [end, error] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (error != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

date_t make_date(const int32_t year, const uint32_t month, const uint32_t day) {
  return from_civil(std::chrono::year_month_day{
      std::chrono::year{year}, std::chrono::month{month},
      std::chrono::day{day}});
}

std::optional<date_t> try_parse_date(const std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  auto year = parse_digits<int32_t>(text.substr(0, 4));
  auto month = parse_digits<uint32_t>(text.substr(5, 2));
  auto day = parse_digits<uint32_t>(text.substr(8, 2));
  if (!year || !month || !day) {
    return std::nullopt;
  }
  auto civil = std::chrono::year_month_day{std::chrono::year{*year},
                                           std::chrono::month{*month},
                                           std::chrono::day{*day}};
  if (!civil.ok()) {
    return std::nullopt;
  }
  return from_civil(civil);
}

std::string to_iso_string(const date_t date) {
  auto civil = to_civil(date);
  return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(civil.year()),
                     static_cast<unsigned>(civil.month()),
                     static_cast<unsigned>(civil.day()));
}

date_t add_months(const date_t date, const int32_t months) {
  auto civil = to_civil(date);
  auto shifted = civil.year() / civil.month() + std::chrono::months{months};
  auto last = std::chrono::year_month_day_last{shifted.year(),
                                               std::chrono::month_day_last{
                                                   shifted.month()}};
  auto day = civil.day() > last.day() ? last.day() : civil.day();
  return from_civil(std::chrono::year_month_day{shifted.year(),
                                                shifted.month(), day});
}

date_t date_of(const timestamp_milliseconds_t timestamp) {
  return static_cast<date_t>(timestamp / 86'400'000ull);
}

}  // namespace tally::schema
