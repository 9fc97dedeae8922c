#include "platform.h"

#include <cstdio>
#include <string>
#include <system_error>

namespace rtpack::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (!::MoveFileExW(from.c_str(),
                     to.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
    throw std::system_error(::GetLastError(),
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

bool is_tty() { return ::_isatty(::_fileno(stderr)) != 0; }

}  // namespace rtpack::platform
