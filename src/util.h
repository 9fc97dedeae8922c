#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Write bytes to a temporary sibling of `path`, then rename over `path`. A failure
// at any point leaves `path` untouched and removes the temporary.
void util_write_file_atomic(std::filesystem::path const &path, std::string_view content);

struct util_file_write {
  std::filesystem::path path;
  std::string_view content;
};

// Stages every file as a temporary sibling before renaming any of them, so a
// failed write leaves every destination untouched.
void util_write_files_atomic(std::vector<util_file_write> const &files);

// Split on runs of spaces, tabs, CR and LF. Empty tokens are never produced.
std::vector<std::string> util_split_whitespace(std::string_view s);

std::string util_join(std::vector<std::string> const &parts, std::string_view sep);

std::string_view util_trim(std::string_view s);

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace rtpack
