#pragma once

#include <cstddef>
#include <string_view>

#include <sys/types.h>

namespace duct {

// Shell used by sh()
inline constexpr std::string_view SHELL_PATH = "/bin/sh";
inline constexpr std::string_view SHELL_FLAG = "-c";

inline constexpr std::string_view NULL_DEVICE = "/dev/null";

// Permission bits for files created by *_path() redirections (before umask)
inline constexpr mode_t CREATE_FILE_MODE = 0666;

// Process management constants
inline constexpr int    SIGNAL_EXIT_CODE_OFFSET = 128;
inline constexpr size_t READ_CHUNK_SIZE         = 8192;
inline constexpr size_t WRITE_CHUNK_SIZE        = 65536;

// Environment variable enabling verbose tracing
inline constexpr std::string_view VERBOSE_ENV_VAR = "DUCT_VERBOSE";

} // namespace duct
