#pragma once

#include <cstdlib>
#include <utility>

#include <spdlog/spdlog.h>

namespace coffer::common {

/// Process exit status after a fatal failure (EX_SOFTWARE).
inline constexpr int kCriticalExitStatus = 70;

/// Log a fatal failure of the host environment and exit.
///
/// Reserved for conditions the ledger cannot continue past: an unreadable
/// store, a crypto backend that refuses a key, or a host helper handed
/// input its caller already validated. Program and transaction failures
/// are returned as `program_result_t` instead.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::exit(kCriticalExitStatus);
}

}  // namespace coffer::common
