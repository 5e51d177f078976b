#ifndef STORIFY_SRC_STORAGE_I_OBJECT_STORE_HPP_
#define STORIFY_SRC_STORAGE_I_OBJECT_STORE_HPP_

#include "config/config_types.hpp"
#include "storage/object_metadata.hpp"
#include "storage/storage_error.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace Storify::Storage
{

// Streaming writer for a single object. Data becomes visible at the target
// path only once Close() succeeds.
class IObjectWriter
{
    public:
    virtual ~IObjectWriter() = default;

    virtual StorageResult<void> Write(std::span<const std::byte> data) = 0;
    virtual StorageResult<void> Close()                                = 0;
};

// Capability every backend exposes to the operation engine. Paths are
// store-relative, '/'-separated; a trailing '/' denotes a directory.
class IObjectStore
{
    public:
    virtual ~IObjectStore() = default;

    [[nodiscard]] virtual Config::ProviderType GetProvider() const = 0;

    virtual StorageResult<ObjectMetadata> Stat(const std::string& path) = 0;

    // Returns bytes of [start, end). Ranges past EOF yield a short or empty
    // result, or RangeNotSatisfiable on backends that cannot tell.
    virtual StorageResult<std::vector<std::byte>> ReadRange(
        const std::string& path, std::uint64_t start, std::uint64_t end
    ) = 0;

    virtual StorageResult<void> Write(const std::string& path, std::span<const std::byte> data) = 0;

    virtual StorageResult<std::unique_ptr<IObjectWriter>> OpenWriter(const std::string& path) = 0;

    virtual StorageResult<void> Delete(const std::string& path) = 0;

    virtual StorageResult<void> CreateParent(const std::string& path) = 0;

    virtual StorageResult<void> Move(const std::string& from, const std::string& to) = 0;

    virtual StorageResult<std::vector<ObjectEntry>> List(const std::string& path, bool recursive) = 0;
};

}  // namespace Storify::Storage

#endif  // STORIFY_SRC_STORAGE_I_OBJECT_STORE_HPP_
