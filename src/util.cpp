#include "util.h"

#include "platform.h"

#include <cstdio>
#include <cstring>
#include <list>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace rtpack {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
#if defined(_WIN32)
  std::wstring wide_mode;
  wide_mode.reserve(std::strlen(mode));
  for (char const *p{ mode }; *p != '\0'; ++p) {
    wide_mode.push_back(static_cast<wchar_t>(*p));
  }
  return file_ptr_t{ _wfopen(path.c_str(), wide_mode.c_str()) };
#else
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
#endif
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

namespace {

std::filesystem::path temp_sibling(std::filesystem::path const &path) {
  static thread_local std::mt19937_64 rng{ std::random_device{}() };

  auto const dir{ path.parent_path() };
  if (!dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      throw std::runtime_error("util_write_file_atomic: failed to create directory " +
                               dir.string() + ": " + ec.message());
    }
  }

  std::filesystem::path tmp{ path };
  tmp += ".tmp-" + std::to_string(rng());
  return tmp;
}

void write_whole_file(std::filesystem::path const &tmp, std::string_view content) {
  auto file{ util_open_file(tmp, "wb") };
  if (!file) {
    throw std::runtime_error("util_write_file_atomic: failed to open " + tmp.string());
  }

  if (!content.empty() &&
      std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
    throw std::runtime_error("util_write_file_atomic: short write to " + tmp.string());
  }

  if (std::fflush(file.get()) != 0) {
    throw std::runtime_error("util_write_file_atomic: failed to flush " + tmp.string());
  }
}

}  // namespace

void util_write_file_atomic(std::filesystem::path const &path, std::string_view content) {
  util_write_files_atomic({ { path, content } });
}

void util_write_files_atomic(std::vector<util_file_write> const &files) {
  std::list<scoped_path_cleanup> staged;
  for (auto const &f : files) {
    auto const &tmp{ staged.emplace_back(temp_sibling(f.path)) };
    write_whole_file(tmp.path(), f.content);
  }

  auto tmp{ staged.begin() };
  for (auto const &f : files) {
    platform::atomic_rename(tmp->path(), f.path);
    tmp->reset();  // renamed away, nothing left to remove
    ++tmp;
  }
}

std::vector<std::string> util_split_whitespace(std::string_view s) {
  std::vector<std::string> out;
  size_t pos{ 0 };

  while (pos < s.size()) {
    while (pos < s.size() &&
           (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\r' || s[pos] == '\n')) {
      ++pos;
    }
    size_t const start{ pos };
    while (pos < s.size() && s[pos] != ' ' && s[pos] != '\t' && s[pos] != '\r' &&
           s[pos] != '\n') {
      ++pos;
    }
    if (pos > start) { out.emplace_back(s.substr(start, pos - start)); }
  }

  return out;
}

std::string util_join(std::vector<std::string> const &parts, std::string_view sep) {
  std::string out;
  for (size_t i{ 0 }; i < parts.size(); ++i) {
    if (i) { out += sep; }
    out += parts[i];
  }
  return out;
}

std::string_view util_trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r") - start + 1);
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  path_.clear();
}

}  // namespace rtpack
