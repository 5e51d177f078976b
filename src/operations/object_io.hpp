#ifndef STORIFY_SRC_OPERATIONS_OBJECT_IO_HPP_
#define STORIFY_SRC_OPERATIONS_OBJECT_IO_HPP_

#include "storage/i_object_store.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Storify::Operations
{

// Stats `path` and rejects directories with IsADirectory.
Storage::StorageResult<Storage::ObjectMetadata> StatFile(
    Storage::IObjectStore& store, const std::string& path
);

// Writes raw bytes to `out`; IOError when the stream goes bad.
Storage::StorageResult<void> EmitBytes(std::ostream& out, std::span<const std::byte> bytes);
Storage::StorageResult<void> EmitBytes(std::ostream& out, std::string_view text);

// Size-limit rule shared by cat and append: the rounded-up MiB total must
// not exceed `limit_mb`. A limit of 0 disables the check.
Storage::StorageResult<void> EnforceSizeLimit(
    std::uint64_t total_bytes, std::uint64_t limit_mb, bool force
);

inline std::span<const std::byte> AsBytes(std::string_view text)
{
    return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_OBJECT_IO_HPP_
