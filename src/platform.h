#pragma once

#include "util.h"

#include <filesystem>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <io.h>
#include <windows.h>
#endif

namespace rtpack::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

bool is_tty();

}  // namespace rtpack::platform
