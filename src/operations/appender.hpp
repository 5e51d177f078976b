#ifndef STORIFY_SRC_OPERATIONS_APPENDER_HPP_
#define STORIFY_SRC_OPERATIONS_APPENDER_HPP_

#include "app_constants.hpp"
#include "storage/i_object_store.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace Storify::Operations
{

struct AppendOptions {
    bool no_create              = false;  ///< fail with NotFound instead of creating
    bool parents                = false;  ///< create a missing parent and retry the write once
    std::uint64_t size_limit_mb = 0;      ///< 0 disables the limit
    bool force                  = false;  ///< ignore size_limit_mb
    std::optional<std::uint64_t> if_size;
    std::optional<std::string> if_etag;
};

// Appends data to an object by rewriting it as existing + new.
//
// Object stores offer no append or compare-and-swap, so the rewrite is
// guarded by two checkpoints. W1 is the stat taken before the existing
// content is read; the read must return exactly W1.size bytes when the size
// is known. Right before the write the object is stat'ed again and compared
// with W1 (see Witness::Matches). A mismatch fails with
// ConcurrentModification and nothing is written. A writer that slips in
// between the second stat and the write is not detected.
class Appender
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit Appender(
        Storage::IObjectStore& store, std::size_t chunk_size = Constants::DEFAULT_CHUNK_SIZE
    );
    ~Appender() = default;

    Appender(const Appender&)            = delete;
    Appender& operator=(const Appender&) = delete;
    Appender(Appender&&)                 = delete;
    Appender& operator=(Appender&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    Storage::StorageResult<void> AppendBytes(
        const std::string& remote, std::span<const std::byte> data, const AppendOptions& options
    );

    Storage::StorageResult<void> AppendFromLocal(
        const std::filesystem::path& local, const std::string& remote,
        const AppendOptions& options
    );

    // Consumes `in` until EOF, enforcing the size limit while reading.
    Storage::StorageResult<void> AppendFromStream(
        std::istream& in, const std::string& remote, const AppendOptions& options
    );

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//

    // std::nullopt when the target does not exist.
    Storage::StorageResult<std::optional<Storage::ObjectMetadata>> StatTarget(
        const std::string& remote
    );
    Storage::StorageResult<std::optional<Storage::ObjectMetadata>> BeginAppend(
        const std::string& remote, std::uint64_t added, const AppendOptions& options
    );
    Storage::StorageResult<void> FinishAppend(
        const std::string& remote, const std::optional<Storage::ObjectMetadata>& initial,
        std::span<const std::byte> added, const AppendOptions& options
    );
    Storage::StorageResult<std::vector<std::byte>> ReadExisting(
        const std::string& remote, const Storage::ObjectMetadata& initial
    );
    Storage::StorageResult<void> WriteTarget(
        const std::string& remote, std::span<const std::byte> data, bool parents
    );

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    Storage::IObjectStore& store_;
    const std::size_t chunk_size_;
};

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_APPENDER_HPP_
