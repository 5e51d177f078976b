#include "operations/cater.hpp"

#include "operations/object_io.hpp"
#include "scanner/chunked_scanner.hpp"

#include <spdlog/spdlog.h>

namespace Storify::Operations
{

using Storage::StorageResult;

Cater::Cater(Storage::IObjectStore& store, std::size_t chunk_size)
    : store_(store), chunk_size_(chunk_size)
{
}

StorageResult<std::uint64_t> Cater::Cat(
    const std::string& path, const CatOptions& options, std::ostream& out
)
{
    spdlog::debug(
        "Cater::Cat path={} size_limit_mb={} force={}", path, options.size_limit_mb, options.force
    );

    auto meta = StatFile(store_, path);
    if (!meta) {
        return std::unexpected(meta.error());
    }
    if (auto res = EnforceSizeLimit(meta->size, options.size_limit_mb, options.force); !res) {
        return std::unexpected(res.error());
    }

    Scanner::ChunkedScanner scanner(
        store_, path, chunk_size_, Scanner::Direction::Forward, meta->size
    );
    std::uint64_t written = 0;
    while (true) {
        auto window = scanner.Next();
        if (!window) {
            return std::unexpected(window.error());
        }
        if (!window->has_value()) {
            break;
        }
        const auto& bytes = window->value().bytes;
        // Sizeless backends are only caught here.
        const std::uint64_t total = written + bytes.size();
        if (auto res = EnforceSizeLimit(total, options.size_limit_mb, options.force); !res) {
            return std::unexpected(res.error());
        }
        if (auto res = EmitBytes(out, bytes); !res) {
            return std::unexpected(res.error());
        }
        written += bytes.size();
    }
    out.flush();
    return written;
}

}  // namespace Storify::Operations
