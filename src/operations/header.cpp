#include "operations/header.hpp"

#include "operations/object_io.hpp"
#include "scanner/line_reader.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>

namespace Storify::Operations
{

using Storage::StorageErrc;
using Storage::StorageResult;

Header::Header(Storage::IObjectStore& store, std::size_t chunk_size)
    : store_(store), chunk_size_(chunk_size)
{
}

StorageResult<void> Header::Head(const std::string& path, ReadMode mode, std::ostream& out)
{
    spdlog::debug(
        "Header::Head path={} unit={} count={}", path,
        mode.unit == ReadUnit::Lines ? "lines" : "bytes", mode.count
    );

    auto meta = StatFile(store_, path);
    if (!meta) {
        return std::unexpected(meta.error());
    }
    if (mode.count == 0) {
        return {};
    }

    if (mode.unit == ReadUnit::Lines) {
        return HeadLines(path, mode.count, meta->size, out);
    }
    return HeadBytes(path, mode.count, meta->size, out);
}

StorageResult<void> Header::HeadLines(
    const std::string& path, std::uint64_t count, std::uint64_t size, std::ostream& out
)
{
    Scanner::LineReader reader(
        Scanner::ChunkedScanner(store_, path, chunk_size_, Scanner::Direction::Forward, size)
    );

    while (reader.LinesRead() < count) {
        auto line = reader.NextLine();
        if (!line) {
            return std::unexpected(line.error());
        }
        if (!line->has_value()) {
            break;
        }
        if (auto res = EmitBytes(out, line->value().raw); !res) {
            return res;
        }
    }
    out.flush();
    return {};
}

StorageResult<void> Header::HeadBytes(
    const std::string& path, std::uint64_t count, std::uint64_t size, std::ostream& out
)
{
    // An unknown size (0) leaves the request as-is and lets the store clamp it.
    const std::uint64_t to_read = size > 0 ? std::min(count, size) : count;

    auto data = store_.ReadRange(path, 0, to_read);
    if (!data) {
        if (Storage::IsErrc(data.error(), StorageErrc::RangeNotSatisfiable)) {
            return {};
        }
        return std::unexpected(data.error());
    }
    if (auto res = EmitBytes(out, *data); !res) {
        return res;
    }
    out.flush();
    return {};
}

StorageResult<MultiPathReport> Header::HeadMany(
    const std::vector<std::string>& paths, std::optional<std::uint64_t> lines,
    std::optional<std::uint64_t> bytes, const HeaderOptions& options, std::ostream& out,
    std::ostream& err
)
{
    auto mode = ResolveReadMode(lines, bytes, Constants::DEFAULT_HEAD_LINES);
    if (!mode) {
        return std::unexpected(mode.error());
    }
    return RunForEachPath("head", paths, options, out, err, [&](const std::string& path) {
        return Head(path, *mode, out);
    });
}

}  // namespace Storify::Operations
