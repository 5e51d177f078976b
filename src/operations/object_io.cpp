#include "operations/object_io.hpp"

#include <spdlog/spdlog.h>

namespace Storify::Operations
{

using Storage::StorageErrc;
using Storage::StorageResult;

StorageResult<Storage::ObjectMetadata> StatFile(
    Storage::IObjectStore& store, const std::string& path
)
{
    auto meta = store.Stat(path);
    if (!meta) {
        return std::unexpected(meta.error());
    }
    if (meta->is_directory) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }
    return meta;
}

StorageResult<void> EmitBytes(std::ostream& out, std::span<const std::byte> bytes)
{
    if (bytes.empty()) {
        return {};
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        return std::unexpected(make_error_code(StorageErrc::IOError));
    }
    return {};
}

StorageResult<void> EmitBytes(std::ostream& out, std::string_view text)
{
    return EmitBytes(out, AsBytes(text));
}

StorageResult<void> EnforceSizeLimit(std::uint64_t total_bytes, std::uint64_t limit_mb, bool force)
{
    if (limit_mb == 0 || force) {
        return {};
    }
    constexpr std::uint64_t kMiB = 1024 * 1024;
    const std::uint64_t total_mb = (total_bytes + kMiB - 1) / kMiB;
    if (total_mb > limit_mb) {
        spdlog::debug("Size limit exceeded: {}MB > {}MB", total_mb, limit_mb);
        return std::unexpected(make_error_code(StorageErrc::SizeLimitExceeded));
    }
    return {};
}

}  // namespace Storify::Operations
