#include "operations/toucher.hpp"

#include <spdlog/spdlog.h>

namespace Storify::Operations
{

using Storage::StorageErrc;
using Storage::StorageResult;

StorageResult<void> Toucher::WriteEmpty(const std::string& path)
{
    auto writer = store_.OpenWriter(path);
    if (!writer) {
        return std::unexpected(writer.error());
    }
    return (*writer)->Close();
}

StorageResult<TouchOutcome> Toucher::Touch(const std::string& path, const TouchOptions& options)
{
    spdlog::debug(
        "Toucher::Touch path={} no_create={} truncate={} parents={}", path, options.no_create,
        options.truncate, options.parents
    );
    if (path.empty() || path.back() == '/') {
        return std::unexpected(make_error_code(StorageErrc::InvalidArgument));
    }

    auto meta = store_.Stat(path);
    if (meta) {
        if (meta->is_directory) {
            return std::unexpected(make_error_code(StorageErrc::IsADirectory));
        }
        if (!options.truncate) {
            return TouchOutcome::Untouched;
        }
        if (auto res = WriteEmpty(path); !res) {
            return std::unexpected(res.error());
        }
        spdlog::info("Truncated '{}'", path);
        return TouchOutcome::Truncated;
    }
    if (!Storage::IsErrc(meta.error(), StorageErrc::NotFound)) {
        return std::unexpected(meta.error());
    }

    if (options.no_create) {
        return TouchOutcome::Skipped;
    }
    if (options.parents) {
        if (auto res = store_.CreateParent(path); !res) {
            spdlog::warn(
                "Toucher: failed to create parent of '{}': {}", path, res.error().message()
            );
        }
    }
    if (auto res = WriteEmpty(path); !res) {
        return std::unexpected(res.error());
    }
    spdlog::info("Created '{}'", path);
    return TouchOutcome::Created;
}

}  // namespace Storify::Operations
