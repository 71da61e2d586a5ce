#pragma once

#include <tally/schema/error_code.hpp>
#include <tally/schema/operation_result.hpp>
#include <optional>
#include <string>
#include <utility>
#include <string_view>

namespace tally::execution {

inline constexpr std::string_view kDirectoryCodespace{"tally.directory"};
inline constexpr std::string_view kPostingCodespace{"tally.posting"};
inline constexpr std::string_view kDocumentCodespace{"tally.document"};
inline constexpr std::string_view kAllocationCodespace{"tally.allocation"};
inline constexpr std::string_view kReconciliationCodespace{
    "tally.reconciliation"};
inline constexpr std::string_view kRecurringCodespace{"tally.recurring"};
inline constexpr std::string_view kEngineCodespace{"tally.engine"};

inline tally::schema::operation_result_t make_error(
    const tally::schema::error_code code,
    const std::string_view codespace,
    std::string log,
    std::string info = {}) {
  auto result = tally::schema::operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

inline tally::schema::operation_result_t make_success(
    const std::string_view codespace,
    std::string info,
    std::optional<tally::schema::hash32_t> subject_id = std::nullopt) {
  auto result = tally::schema::operation_result_t{};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  result.subject_id = subject_id;
  return result;
}

/// Leading hex digits of an id, for log and result text.
inline std::string short_id(const tally::schema::hash32_t& id) {
  return tally::schema::to_hex(
             tally::schema::bytes_view_t{id.data(), id.size()})
      .substr(0, 12);
}

inline bool succeeded(const tally::schema::operation_result_t& result) {
  return result.code == 0;
}

inline bool has_error(const tally::schema::operation_result_t& result,
                      const tally::schema::error_code code) {
  return result.code == static_cast<uint32_t>(code);
}

}  // namespace tally::execution
