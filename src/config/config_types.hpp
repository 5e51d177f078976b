#ifndef STORIFY_SRC_CONFIG_CONFIG_TYPES_HPP_
#define STORIFY_SRC_CONFIG_CONFIG_TYPES_HPP_

#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace Storify::Config
{

//------------------------------------------------------------------------------//
// Enumerations for Configuration Types
//------------------------------------------------------------------------------//

enum class ProviderType : std::uint8_t { Fs, Memory, S3, Oss, Cos, Minio, Hdfs, Azblob };

std::optional<ProviderType> StringToProviderType(const std::string &type_str);
const char *ProviderTypeToString(ProviderType type);
bool IsBucketProvider(ProviderType type);

// Function to convert string to spdlog::level::level_enum
std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str);

//------------------------------------------------------------------------------//
// Structs for Configuration Types
//------------------------------------------------------------------------------//

struct GlobalSettings {
    spdlog::level::level_enum log_level = Constants::DEFAULT_LOG_LEVEL;
    std::size_t chunk_size              = Constants::DEFAULT_CHUNK_SIZE;
    std::uint64_t size_limit_mb         = Constants::DEFAULT_SIZE_LIMIT_MB;

    bool IsValid() const;
};

struct StorageDefinition {
    ProviderType provider = ProviderType::Fs;
    std::filesystem::path root;  ///< Root directory for fs/hdfs providers

    std::optional<std::string> bucket;  ///< Required for bucket-based providers
    std::optional<std::string> endpoint;
    std::optional<std::string> region;
    std::optional<std::string> name_node;  ///< HDFS only

    bool synthesize_change_tags = true;  ///< fs only: derive a tag from inode/mtime/size

    bool IsValid() const;
};

struct AppConfig {
    StorageDefinition storage;
    GlobalSettings global_settings;

    bool IsValid() const { return storage.IsValid() && global_settings.IsValid(); }
};

//------------------------------------------------------------------------------//
// Implementation of Enum / Logging Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str)
{
    if (level_str == "trace") {
        return spdlog::level::trace;
    }
    if (level_str == "debug") {
        return spdlog::level::debug;
    }
    if (level_str == "info") {
        return spdlog::level::info;
    }
    if (level_str == "warn") {
        return spdlog::level::warn;
    }
    if (level_str == "error") {
        return spdlog::level::err;
    }
    if (level_str == "fatal" || level_str == "critical") {
        return spdlog::level::critical;
    }
    if (level_str == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

inline std::optional<ProviderType> StringToProviderType(const std::string &type_str)
{
    if (type_str == "fs") {
        return ProviderType::Fs;
    }
    if (type_str == "memory") {
        return ProviderType::Memory;
    }
    if (type_str == "s3") {
        return ProviderType::S3;
    }
    if (type_str == "oss") {
        return ProviderType::Oss;
    }
    if (type_str == "cos") {
        return ProviderType::Cos;
    }
    if (type_str == "minio") {
        return ProviderType::Minio;
    }
    if (type_str == "hdfs") {
        return ProviderType::Hdfs;
    }
    if (type_str == "azblob") {
        return ProviderType::Azblob;
    }
    return std::nullopt;
}

inline const char *ProviderTypeToString(ProviderType type)
{
    switch (type) {
        case ProviderType::Fs:
            return "fs";
        case ProviderType::Memory:
            return "memory";
        case ProviderType::S3:
            return "s3";
        case ProviderType::Oss:
            return "oss";
        case ProviderType::Cos:
            return "cos";
        case ProviderType::Minio:
            return "minio";
        case ProviderType::Hdfs:
            return "hdfs";
        case ProviderType::Azblob:
            return "azblob";
        default:
            return "unknown";
    }
}

inline bool IsBucketProvider(ProviderType type)
{
    switch (type) {
        case ProviderType::S3:
        case ProviderType::Oss:
        case ProviderType::Cos:
        case ProviderType::Minio:
        case ProviderType::Azblob:
            return true;
        default:
            return false;
    }
}

//------------------------------------------------------------------------------//
// Implementation of Configuration Structs Functions
//------------------------------------------------------------------------------//

inline bool GlobalSettings::IsValid() const
{
    if (chunk_size < Constants::MIN_CHUNK_SIZE || chunk_size > Constants::MAX_CHUNK_SIZE) {
        spdlog::error(
            "chunk_size ({}) must be between {} and {} bytes.", chunk_size,
            Constants::MIN_CHUNK_SIZE, Constants::MAX_CHUNK_SIZE
        );
        return false;
    }
    return true;
}

inline bool StorageDefinition::IsValid() const
{
    if (IsBucketProvider(provider)) {
        if (!bucket.has_value() || bucket.value().empty()) {
            spdlog::error("Provider '{}' requires a bucket.", ProviderTypeToString(provider));
            return false;
        }
        return true;
    }
    if (provider == ProviderType::Fs && root.empty()) {
        spdlog::error("Provider 'fs' requires a root path.");
        return false;
    }
    if (provider == ProviderType::Hdfs && !name_node.has_value()) {
        spdlog::error("Provider 'hdfs' requires a name_node.");
        return false;
    }
    if (bucket.has_value() && !IsBucketProvider(provider)) {
        spdlog::warn("bucket specified for provider '{}' is ignored.", ProviderTypeToString(provider));
    }
    return true;
}

}  // namespace Storify::Config

#endif  // STORIFY_SRC_CONFIG_CONFIG_TYPES_HPP_
