#ifndef STORIFY_SRC_OPERATIONS_TRUNCATER_HPP_
#define STORIFY_SRC_OPERATIONS_TRUNCATER_HPP_

#include "app_constants.hpp"
#include "storage/i_object_store.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Storify::Operations
{

struct TruncateOptions {
    bool no_create = false;  ///< missing target is left alone
    bool parents   = false;  ///< create missing parents before creating the target
};

enum class TruncateOutcome {
    Unchanged,  ///< already had the requested size
    Resized,
    Created,
    Skipped,  ///< missing target with no_create
};

const char* TruncateOutcomeToString(TruncateOutcome outcome);

// Resizes an object without holding it in memory. Shrinking copies a prefix
// and growing copies then zero-pads, both into a temporary object that is
// moved over the target. Truncating to zero rewrites the target directly.
// No concurrency check is made against other writers.
class Truncater
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit Truncater(
        Storage::IObjectStore& store, std::size_t block_size = Constants::DEFAULT_CHUNK_SIZE
    );
    ~Truncater() = default;

    Truncater(const Truncater&)            = delete;
    Truncater& operator=(const Truncater&) = delete;
    Truncater(Truncater&&)                 = delete;
    Truncater& operator=(Truncater&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    Storage::StorageResult<TruncateOutcome> Truncate(
        const std::string& path, std::uint64_t size, const TruncateOptions& options
    );

    // "<path>.truncate.tmp-<16 hex digits>"
    static std::string TempPathFor(const std::string& path);

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    Storage::StorageResult<TruncateOutcome> CreateSized(
        const std::string& path, std::uint64_t size, const TruncateOptions& options
    );
    // Copies at most `copy_len` bytes of the original, then zero-pads to `size`.
    Storage::StorageResult<void> Resize(
        const std::string& path, std::uint64_t copy_len, std::uint64_t size, bool size_known
    );
    Storage::StorageResult<std::uint64_t> CopyPrefix(
        const std::string& path, std::uint64_t length, bool size_known,
        Storage::IObjectWriter& writer
    );
    Storage::StorageResult<void> WriteZeros(Storage::IObjectWriter& writer, std::uint64_t count);

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    Storage::IObjectStore& store_;
    const std::size_t block_size_;
    std::vector<std::byte> zero_block_;
};

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_TRUNCATER_HPP_
