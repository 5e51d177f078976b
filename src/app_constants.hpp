#ifndef STORIFY_SRC_APP_CONSTANTS_HPP_
#define STORIFY_SRC_APP_CONSTANTS_HPP_

#include <spdlog/common.h>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Storify::Constants
{
// Application Info
constexpr std::string_view APP_NAME = "storify";
// TODO: Derive from cmake
constexpr std::string_view APP_VERSION_STRING = "storify version 0.3.0";

// Logging
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL   = spdlog::level::warn;
constexpr spdlog::level::level_enum DEFAULT_FLUSH_LEVEL = spdlog::level::warn;
constexpr std::string_view DEFAULT_CONSOLE_LOG_PATTERN  = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

// Configuration discovery
constexpr std::string_view CONFIG_PATH_ENV_VAR   = "STORIFY_CONFIG";
constexpr std::string_view PROVIDER_ENV_VAR      = "STORAGE_PROVIDER";
constexpr std::string_view ROOT_ENV_VAR          = "STORAGE_ROOT";
constexpr std::string_view BUCKET_ENV_VAR        = "STORAGE_BUCKET";
constexpr std::string_view ENDPOINT_ENV_VAR      = "STORAGE_ENDPOINT";
constexpr std::string_view REGION_ENV_VAR        = "STORAGE_REGION";
constexpr std::string_view DEFAULT_PROVIDER_NAME = "fs";

// Streaming I/O
constexpr std::size_t DEFAULT_CHUNK_SIZE  = 64 * 1024;
constexpr std::size_t DEFAULT_BUFFER_SIZE = 8 * 1024;
constexpr std::size_t MIN_CHUNK_SIZE      = 1024;
constexpr std::size_t MAX_CHUNK_SIZE      = 64 * 1024 * 1024;

// Operations
constexpr std::uint64_t DEFAULT_HEAD_LINES    = 10;
constexpr std::uint64_t DEFAULT_TAIL_LINES    = 10;
constexpr std::uint64_t DEFAULT_SIZE_LIMIT_MB = 0;  // 0 disables the limit
constexpr std::string_view TRUNCATE_TEMP_INFIX = ".truncate.tmp-";

}  // namespace Storify::Constants

#endif  // STORIFY_SRC_APP_CONSTANTS_HPP_
