#pragma once

#include <coffer/schema/program_error_code.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace coffer::schema {

inline constexpr auto kProgramCodespace = std::string_view{"coffer.program"};
inline constexpr auto kSystemCodespace = std::string_view{"coffer.system"};
inline constexpr auto kLedgerCodespace = std::string_view{"coffer.ledger"};

template <uint16_t Version>
struct program_result;

/// Outcome of one request. `code` is zero on success, otherwise a
/// `program_error_code`.
template <>
struct program_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
};

using program_result_t = program_result<1>;

inline program_result_t make_success() {
  return program_result_t{};
}

inline program_result_t make_failure(const program_error_code code,
                                     std::string log,
                                     const std::string_view codespace) {
  return program_result_t{.version = 1,
                          .code = static_cast<uint32_t>(code),
                          .log = std::move(log),
                          .codespace = std::string{codespace}};
}

inline bool succeeded(const program_result_t& result) {
  return result.code == 0;
}

inline bool failed_with(const program_result_t& result,
                        const program_error_code code) {
  return result.code == static_cast<uint32_t>(code);
}

}  // namespace coffer::schema
