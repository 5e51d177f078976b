#include "config_loader.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>
#include "config_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <unordered_map>

#define TRY_ASSIGN(target, json_obj, key, type)                            \
    try {                                                                  \
        if (json_obj.contains(key)) {                                      \
            target = json_obj.at(key).get<type>();                         \
        }                                                                  \
    } catch (const nlohmann::json::exception &e) {                         \
        spdlog::error("JSON parse error for key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                 \
    }

#define TRY_ASSIGN_REQUIRED(target, json_obj, key, type)                            \
    try {                                                                           \
        if (!json_obj.contains(key)) {                                              \
            spdlog::error("Missing required JSON key: '{}'", key);                  \
            return std::unexpected(LoadError::ValidationError);                     \
        }                                                                           \
        target = json_obj.at(key).get<type>();                                      \
    } catch (const nlohmann::json::exception &e) {                                  \
        spdlog::error("JSON parse error for required key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                          \
    }

namespace Storify::Config
{

namespace
{

LoadResult ParseConfigJson(const nlohmann::json &j)
{
    if (!j.is_object()) {
        spdlog::error("Configuration root must be a JSON object.");
        return std::unexpected(LoadError::ValidationError);
    }

    AppConfig config;

    if (!j.contains("storage") || !j.at("storage").is_object()) {
        spdlog::error("'storage' object is missing or not an object.");
        return std::unexpected(LoadError::ValidationError);
    }
    const auto &storage_json = j.at("storage");
    {
        std::string provider_str;
        TRY_ASSIGN_REQUIRED(provider_str, storage_json, "provider", std::string);

        auto provider_opt = StringToProviderType(provider_str);
        if (!provider_opt) {
            spdlog::error(
                "Unsupported storage provider: {}. Allowed: 'oss' | 's3' | 'minio' | 'cos' | "
                "'fs' | 'hdfs' | 'azblob' | 'memory'",
                provider_str
            );
            return std::unexpected(LoadError::ValidationError);
        }
        config.storage.provider = *provider_opt;

        std::string root_str;
        TRY_ASSIGN(root_str, storage_json, "root", std::string);
        config.storage.root = root_str;

        std::string value;
        if (storage_json.contains("bucket")) {
            TRY_ASSIGN(value, storage_json, "bucket", std::string);
            config.storage.bucket = value;
        }
        if (storage_json.contains("endpoint")) {
            TRY_ASSIGN(value, storage_json, "endpoint", std::string);
            config.storage.endpoint = value;
        }
        if (storage_json.contains("region")) {
            TRY_ASSIGN(value, storage_json, "region", std::string);
            config.storage.region = value;
        }
        if (storage_json.contains("name_node")) {
            TRY_ASSIGN(value, storage_json, "name_node", std::string);
            config.storage.name_node = value;
        }
        TRY_ASSIGN(
            config.storage.synthesize_change_tags, storage_json, "synthesize_change_tags", bool
        );
    }

    if (!config.storage.IsValid()) {
        spdlog::error("Parsed storage definition is invalid.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::debug(
        "Parsed storage: provider='{}', root='{}'",
        ProviderTypeToString(config.storage.provider), config.storage.root.string()
    );

    if (j.contains("global_settings")) {
        const auto &gs = j.at("global_settings");
        if (!gs.is_object()) {
            spdlog::error("'global_settings' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        std::string log_level_str;
        TRY_ASSIGN(log_level_str, gs, "log_level", std::string);
        if (!log_level_str.empty()) {
            auto level_opt = StringToLogLevel(log_level_str);
            if (!level_opt) {
                spdlog::error(
                    "Invalid 'log_level' value: {}. Using default '{}'.", log_level_str,
                    spdlog::level::to_string_view(config.global_settings.log_level)
                );
                // Keep the default already set in config.global_settings
            } else {
                config.global_settings.log_level = *level_opt;
            }
        }

        if (gs.contains("chunk_size")) {
            if (gs.at("chunk_size").is_string()) {
                std::string chunk_str;
                TRY_ASSIGN(chunk_str, gs, "chunk_size", std::string);
                auto parsed_bytes = ParseSizeStringToBytes(chunk_str);
                if (!parsed_bytes.has_value()) {
                    spdlog::error("Invalid 'chunk_size' string: '{}'", chunk_str);
                    return std::unexpected(LoadError::ValidationError);
                }
                config.global_settings.chunk_size = static_cast<std::size_t>(*parsed_bytes);
            } else if (gs.at("chunk_size").is_number_unsigned()) {
                TRY_ASSIGN(config.global_settings.chunk_size, gs, "chunk_size", std::size_t);
            } else {
                spdlog::error("'chunk_size' must be a string or a non-negative number.");
                return std::unexpected(LoadError::ValidationError);
            }
        }
        TRY_ASSIGN(config.global_settings.size_limit_mb, gs, "size_limit_mb", std::uint64_t);
    }

    if (!config.global_settings.IsValid()) {
        spdlog::error("Global settings are invalid.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::debug(
        "Global settings: log_level='{}', chunk_size={}, size_limit_mb={}",
        spdlog::level::to_string_view(config.global_settings.log_level),
        config.global_settings.chunk_size, config.global_settings.size_limit_mb
    );

    return config;
}

}  // namespace

std::optional<std::string> ProcessEnvLookup(std::string_view key)
{
    const char *value = std::getenv(std::string(key).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<uint64_t> ParseSizeStringToBytes(const std::string &size_str)
{
    if (size_str.empty()) {
        return std::nullopt;
    }

    std::string num_part;
    std::string unit_part;

    size_t i = 0;
    while (i < size_str.length() && std::isdigit(static_cast<unsigned char>(size_str[i]))) {
        num_part += size_str[i];
        i++;
    }

    // Allow optional space between number and unit
    while (i < size_str.length() && std::isspace(static_cast<unsigned char>(size_str[i]))) {
        i++;
    }

    while (i < size_str.length() && std::isalpha(static_cast<unsigned char>(size_str[i]))) {
        unit_part += size_str[i];
        i++;
    }

    if (i < size_str.length()) {
        spdlog::warn("Invalid characters found after unit in size string: '{}'", size_str);
        return std::nullopt;
    }

    if (num_part.empty()) {
        spdlog::warn("No numeric part in size string: '{}'", size_str);
        return std::nullopt;
    }

    uint64_t value;
    auto conv_res = std::from_chars(num_part.data(), num_part.data() + num_part.length(), value);
    if (conv_res.ec != std::errc() || conv_res.ptr != num_part.data() + num_part.length()) {
        spdlog::warn("Failed to parse numeric part '{}' of size string: '{}'", num_part, size_str);
        return std::nullopt;
    }

    if (unit_part.empty()) {  // Assume bytes if no unit
        return value;
    }

    std::ranges::transform(unit_part, unit_part.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    static const std::unordered_map<std::string, uint64_t> unit_multipliers = {
        { "b",                                     1},
        {"kb",                               1024ULL},
        { "k",                               1024ULL},
        {"mb",                     1024ULL * 1024ULL},
        { "m",                     1024ULL * 1024ULL},
        {"gb",           1024ULL * 1024ULL * 1024ULL},
        { "g",           1024ULL * 1024ULL * 1024ULL},
        {"tb", 1024ULL * 1024ULL * 1024ULL * 1024ULL},
        { "t", 1024ULL * 1024ULL * 1024ULL * 1024ULL}
    };
    auto it = unit_multipliers.find(unit_part);
    if (it == unit_multipliers.end()) {
        spdlog::warn("Unknown size unit '{}' in string '{}'", unit_part, size_str);
        return std::nullopt;
    }
    return value * it->second;
}

LoadResult loadConfigFromString(const std::string &json_text)
{
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }
    return ParseConfigJson(j);
}

LoadResult loadConfigFromFile(const std::filesystem::path &file_path)
{
    spdlog::debug("Attempting to load configuration from: {}", file_path.string());

    std::ifstream config_stream(file_path);
    if (!config_stream.is_open()) {
        spdlog::error("Failed to open config file: {}", file_path.string());
        return std::unexpected(LoadError::FileNotFound);
    }

    nlohmann::json j;
    try {
        config_stream >> j;
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config file: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }

    return ParseConfigJson(j);
}

LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path)
{
    auto result = loadConfigFromFile(file_path);
    if (result.has_value()) {
        return result.value();
    }
    std::string error_message = "Failed to load config (" + file_path.string() + "): ";
    switch (result.error()) {
        case LoadError::FileNotFound:
            error_message += "File not found.";
            break;
        case LoadError::JsonParseError:
            error_message += "JSON parsing failed.";
            break;
        case LoadError::ValidationError:
            error_message += "Configuration validation failed.";
            break;
        default:
            error_message += "Unknown error.";
            break;
    }
    return std::unexpected(error_message);
}

LoadErrorMsg resolveConfig(
    const std::optional<std::filesystem::path> &explicit_path, const EnvLookup &env
)
{
    if (explicit_path.has_value()) {
        return loadConfigFromFileVerbose(*explicit_path);
    }
    if (auto env_path = env(Constants::CONFIG_PATH_ENV_VAR); env_path && !env_path->empty()) {
        return loadConfigFromFileVerbose(*env_path);
    }

    AppConfig config;
    std::string provider_str = std::string(Constants::DEFAULT_PROVIDER_NAME);
    if (auto env_provider = env(Constants::PROVIDER_ENV_VAR); env_provider && !env_provider->empty()) {
        provider_str = *env_provider;
    }
    auto provider_opt = StringToProviderType(provider_str);
    if (!provider_opt) {
        return std::unexpected(
            "Unsupported storage provider: " + provider_str +
            ". Allowed: 'oss' | 's3' | 'minio' | 'cos' | 'fs' | 'hdfs' | 'azblob' | 'memory'"
        );
    }
    config.storage.provider = *provider_opt;

    if (auto root = env(Constants::ROOT_ENV_VAR); root && !root->empty()) {
        config.storage.root = *root;
    } else {
        std::error_code ec;
        config.storage.root = std::filesystem::current_path(ec);
        if (ec) {
            return std::unexpected("Cannot determine current directory: " + ec.message());
        }
    }
    if (auto bucket = env(Constants::BUCKET_ENV_VAR)) {
        config.storage.bucket = *bucket;
    }
    if (auto endpoint = env(Constants::ENDPOINT_ENV_VAR)) {
        config.storage.endpoint = *endpoint;
    }
    if (auto region = env(Constants::REGION_ENV_VAR)) {
        config.storage.region = *region;
    }

    if (!config.IsValid()) {
        return std::unexpected(
            std::string("Configuration from environment is invalid for provider '") +
            ProviderTypeToString(config.storage.provider) + "'"
        );
    }
    return config;
}

}  // namespace Storify::Config
