#ifndef STORIFY_SRC_STORAGE_MEMORY_OBJECT_STORE_HPP_
#define STORIFY_SRC_STORAGE_MEMORY_OBJECT_STORE_HPP_

#include "storage/i_object_store.hpp"

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace Storify::Storage
{

// Flat key/value object store held in process memory. Directories are
// implicit: a key prefix is a directory when some object lives below it
// or CreateParent() registered it.
class MemoryObjectStore : public IObjectStore
{
    public:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//
    struct Options {
        bool report_size              = true;   ///< false: Stat() always reports size 0
        bool range_error_past_eof     = false;  ///< ReadRange() past EOF -> RangeNotSatisfiable
        bool provide_change_tags      = true;
        bool require_parent_for_write = false;  ///< Write() into a missing directory -> NotFound
    };

    private:
    struct StoredObject {
        std::vector<std::byte> data;
        std::uint64_t generation  = 0;
        std::time_t last_modified = 0;
    };

    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    MemoryObjectStore() : MemoryObjectStore(Options{}) {}
    explicit MemoryObjectStore(Options options);
    ~MemoryObjectStore() override = default;

    MemoryObjectStore(const MemoryObjectStore&)            = delete;
    MemoryObjectStore& operator=(const MemoryObjectStore&) = delete;
    MemoryObjectStore(MemoryObjectStore&&)                 = delete;
    MemoryObjectStore& operator=(MemoryObjectStore&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    Config::ProviderType GetProvider() const override { return Config::ProviderType::Memory; }

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

    // Direct accessors that bypass the counters; used to seed and inspect state.
    void PutString(const std::string& path, std::string_view content);
    std::optional<std::string> GetString(const std::string& path) const;
    bool Contains(const std::string& path) const;
    std::vector<std::string> Keys() const;

    std::uint64_t ReadCount() const;
    std::uint64_t WriteCount() const;

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    static std::string Normalize(const std::string& path);

    bool IsDirectoryLocked(const std::string& key) const;
    bool ParentExistsLocked(const std::string& key) const;
    void StoreLocked(const std::string& key, std::vector<std::byte> data);
    ObjectMetadata MetadataLocked(const StoredObject& object) const;
    ObjectMetadata DirectoryMetadata() const;

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const Options options_;

    mutable std::mutex mutex_;
    std::map<std::string, StoredObject> objects_;
    std::set<std::string> explicit_dirs_;
    std::uint64_t next_generation_    = 1;
    std::uint64_t write_count_        = 0;
    mutable std::uint64_t read_count_ = 0;
};

}  // namespace Storify::Storage

#endif  // STORIFY_SRC_STORAGE_MEMORY_OBJECT_STORE_HPP_
