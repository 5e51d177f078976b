#ifndef STORIFY_SRC_STORAGE_LOCAL_OBJECT_STORE_HPP_
#define STORIFY_SRC_STORAGE_LOCAL_OBJECT_STORE_HPP_

#include "config/config_types.hpp"
#include "storage/i_object_store.hpp"

#include <sys/stat.h>
#include <filesystem>
#include <string>
#include <system_error>

namespace Storify::Storage
{

namespace fs = std::filesystem;

// Object store view of a local directory tree.
class LocalObjectStore : public IObjectStore
{
    private:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//

    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit LocalObjectStore(const Config::StorageDefinition& definition);
    ~LocalObjectStore() override = default;

    LocalObjectStore(const LocalObjectStore&)            = delete;
    LocalObjectStore& operator=(const LocalObjectStore&) = delete;
    LocalObjectStore(LocalObjectStore&&)                 = delete;
    LocalObjectStore& operator=(LocalObjectStore&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    Config::ProviderType GetProvider() const override { return Config::ProviderType::Fs; }
    // Verifies the root exists and is a directory.
    StorageResult<void> Initialize();

    StorageResult<ObjectMetadata> Stat(const std::string& path) override;
    StorageResult<std::vector<std::byte>> ReadRange(
        const std::string& path, std::uint64_t start, std::uint64_t end
    ) override;
    StorageResult<void> Write(const std::string& path, std::span<const std::byte> data) override;
    StorageResult<std::unique_ptr<IObjectWriter>> OpenWriter(const std::string& path) override;
    StorageResult<void> Delete(const std::string& path) override;
    StorageResult<void> CreateParent(const std::string& path) override;
    StorageResult<void> Move(const std::string& from, const std::string& to) override;
    StorageResult<std::vector<ObjectEntry>> List(const std::string& path, bool recursive) override;

    fs::path GetFullPath(const std::string& relative_path) const;

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    std::error_code MapFilesystemError(const std::error_code& ec, const std::string& operation = "")
        const;
    ObjectMetadata MetadataFromStat(const struct stat& stbuf) const;
    std::string ToRelative(const fs::path& full_path, bool is_directory) const;

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const Config::StorageDefinition definition_;
    fs::path base_path_;
};

}  // namespace Storify::Storage

#endif  // STORIFY_SRC_STORAGE_LOCAL_OBJECT_STORE_HPP_
