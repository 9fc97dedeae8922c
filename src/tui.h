#pragma once

#include "util.h"

#include <cstdarg>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#if defined(__clang__) || defined(__GNUC__)
#define RTPACK_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define RTPACK_TUI_PRINTF(idx, first)
#endif

namespace rtpack::tui {

enum class level { TUI_TRACE, TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

using output_handler_t = std::function<void(std::string_view)>;

// Explicit logging handle passed to every operation. There is no process-wide
// logger; main() owns the root and hands references down. Safe to share across
// threads; writes are serialized.
class logger : unmovable {
 public:
  // Null handler writes to stderr. A null threshold logs everything.
  explicit logger(std::optional<level> threshold = level::TUI_INFO,
                  bool decorated = false,
                  output_handler_t handler = nullptr);

  // Child logger that prefixes every message with "[label] " and forwards to parent.
  logger(logger &parent, std::string label);

  // Discards all output. Used by tests and by callers that only want exceptions.
  static logger silent();

  void trace(char const *fmt, ...) RTPACK_TUI_PRINTF(2, 3);
  void debug(char const *fmt, ...) RTPACK_TUI_PRINTF(2, 3);
  void info(char const *fmt, ...) RTPACK_TUI_PRINTF(2, 3);
  void warn(char const *fmt, ...) RTPACK_TUI_PRINTF(2, 3);
  void error(char const *fmt, ...) RTPACK_TUI_PRINTF(2, 3);

  bool enabled(level severity) const;

 private:
  void log_formatted(level severity, char const *fmt, va_list args);
  void emit(level severity, std::string_view message);

  logger *parent_{ nullptr };
  std::string label_;
  std::optional<level> threshold_;
  bool decorated_{ false };
  output_handler_t handler_;
  std::mutex mutex_;
};

void print_stdout(char const *fmt, ...) RTPACK_TUI_PRINTF(1, 2);

bool is_tty();

}  // namespace rtpack::tui

#undef RTPACK_TUI_PRINTF
