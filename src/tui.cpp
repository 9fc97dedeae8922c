#include "tui.h"

#include "platform.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

using rtpack::tui::level;

constexpr std::size_t kSeverityLabelWidth{ 3 };

namespace {

std::mutex s_stdout_mutex;
std::mutex s_stderr_mutex;

std::string_view level_to_string(level value) {
  switch (value) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "UNKNOWN";
}

std::tm make_local_tm(std::time_t time) {
  std::tm result{};

#if defined(_WIN32)
  localtime_s(&result, &time);
#else
  localtime_r(&time, &result);
#endif

  return result;
}

std::string format_prefix(level severity) {
  auto const now{ std::chrono::system_clock::now() };
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(now) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(now) };
  std::tm const local_tm{ make_local_tm(timestamp) };

  char timestamp_buf[32]{};
  if (std::strftime(timestamp_buf, sizeof timestamp_buf, "%Y-%m-%d %H:%M:%S", &local_tm) ==
      0) {
    return {};
  }

  std::ostringstream oss;
  oss << '[' << timestamp_buf << '.' << std::setfill('0') << std::setw(3) << millis
      << "] [" << std::left << std::setfill(' ') << std::setw(kSeverityLabelWidth)
      << level_to_string(severity) << "] ";
  return oss.str();
}

}  // namespace

namespace rtpack::tui {

logger::logger(std::optional<level> threshold, bool decorated, output_handler_t handler)
    : threshold_{ threshold }, decorated_{ decorated }, handler_{ std::move(handler) } {}

logger::logger(logger &parent, std::string label)
    : parent_{ &parent },
      label_{ std::move(label) },
      threshold_{ parent.threshold_ },
      decorated_{ parent.decorated_ } {}

logger logger::silent() {
  return logger{ std::nullopt, false, [](std::string_view) {} };
}

bool logger::enabled(level severity) const {
  return !threshold_ || severity >= *threshold_;
}

void logger::emit(level severity, std::string_view message) {
  if (parent_) {
    std::string labeled{ "[" + label_ + "] " };
    labeled.append(message);
    parent_->emit(severity, labeled);
    return;
  }

  std::string output;
  if (decorated_) { output = format_prefix(severity); }
  output.append(message);
  output.push_back('\n');

  std::lock_guard<std::mutex> lock{ mutex_ };
  if (handler_) {
    handler_(output);
    return;
  }

  std::lock_guard<std::mutex> stderr_lock{ s_stderr_mutex };
  std::fwrite(output.data(), 1, output.size(), stderr);
  std::fflush(stderr);
}

void logger::log_formatted(level severity, char const *fmt, va_list args) {
  if (fmt == nullptr || !enabled(severity)) { return; }

  std::string buffer(1024, '\0');

  va_list args_copy;
  va_copy(args_copy, args);
  int written{ std::vsnprintf(buffer.data(), buffer.size(), fmt, args) };
  if (written <= 0) {
    va_end(args_copy);
    return;
  }

  if (static_cast<std::size_t>(written) >= buffer.size()) {
    buffer.resize(static_cast<std::size_t>(written) + 1);
    written = std::vsnprintf(buffer.data(), buffer.size(), fmt, args_copy);
  }
  va_end(args_copy);

  if (written <= 0) { return; }

  buffer.resize(static_cast<std::size_t>(written));
  emit(severity, buffer);
}

void logger::trace(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_TRACE, fmt, args);
  va_end(args);
}

void logger::debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void logger::info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_INFO, fmt, args);
  va_end(args);
}

void logger::warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_WARN, fmt, args);
  va_end(args);
}

void logger::error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  std::lock_guard<std::mutex> lock{ s_stdout_mutex };

  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);

  if (written > 0) { std::fflush(stdout); }
}

bool is_tty() { return platform::is_tty(); }

}  // namespace rtpack::tui
