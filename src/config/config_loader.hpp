#ifndef STORIFY_SRC_CONFIG_CONFIG_LOADER_HPP_
#define STORIFY_SRC_CONFIG_CONFIG_LOADER_HPP_

#include "config/config_types.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace Storify::Config
{

//------------------------------------------------------------------------------//
// Error Handling for Configuration Loading
//------------------------------------------------------------------------------//

enum class LoadError {
    FileNotFound,
    JsonParseError,
    ValidationError,
};

using LoadResult   = std::expected<AppConfig, LoadError>;
using LoadErrorMsg = std::expected<AppConfig, std::string>;

// Looks up an environment variable; std::nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

std::optional<std::string> ProcessEnvLookup(std::string_view key);

// Parses a size string (e.g., "500MB", "2GB", "1024") into bytes.
std::optional<std::uint64_t> ParseSizeStringToBytes(const std::string &size_str);

LoadResult loadConfigFromString(const std::string &json_text);
LoadResult loadConfigFromFile(const std::filesystem::path &file_path);
LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path);

// Resolution order: explicit file, $STORIFY_CONFIG, STORAGE_* variables,
// then an fs store rooted at the current directory.
LoadErrorMsg resolveConfig(
    const std::optional<std::filesystem::path> &explicit_path,
    const EnvLookup &env = ProcessEnvLookup
);

}  // namespace Storify::Config

#endif  // STORIFY_SRC_CONFIG_CONFIG_LOADER_HPP_
