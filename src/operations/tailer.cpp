#include "operations/tailer.hpp"

#include "operations/object_io.hpp"
#include "scanner/chunked_scanner.hpp"
#include "scanner/line_reader.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <deque>

namespace Storify::Operations
{

using Storage::StorageErrc;
using Storage::StorageResult;

Tailer::Tailer(Storage::IObjectStore& store, std::size_t window_size)
    : store_(store), window_size_(window_size)
{
}

StorageResult<void> Tailer::Tail(const std::string& path, ReadMode mode, std::ostream& out)
{
    spdlog::debug(
        "Tailer::Tail path={} unit={} count={}", path,
        mode.unit == ReadUnit::Lines ? "lines" : "bytes", mode.count
    );

    auto meta = StatFile(store_, path);
    if (!meta) {
        return std::unexpected(meta.error());
    }
    if (mode.count == 0) {
        return {};
    }

    StorageResult<void> res;
    if (mode.unit == ReadUnit::Lines) {
        res = meta->HasKnownSize() ? TailLines(path, mode.count, meta->size, out)
                                   : TailLinesStreaming(path, mode.count, out);
    } else {
        res = meta->HasKnownSize() ? TailBytes(path, mode.count, meta->size, out)
                                   : TailBytesStreaming(path, mode.count, out);
    }
    out.flush();
    return res;
}

StorageResult<bool> Tailer::EndsWithNewline(const std::string& path, std::uint64_t size)
{
    auto last = store_.ReadRange(path, size - 1, size);
    if (!last) {
        if (Storage::IsErrc(last.error(), StorageErrc::RangeNotSatisfiable)) {
            return false;
        }
        return std::unexpected(last.error());
    }
    return !last->empty() && last->back() == std::byte{'\n'};
}

StorageResult<void> Tailer::TailLines(
    const std::string& path, std::uint64_t count, std::uint64_t size, std::ostream& out
)
{
    auto ends_with_newline = EndsWithNewline(path, size);
    if (!ends_with_newline) {
        return std::unexpected(ends_with_newline.error());
    }
    // A trailing '\n' closes the last line, so one more boundary is needed
    // to isolate `count` lines.
    const std::uint64_t required = *ends_with_newline ? count + 1 : count;

    auto offsets =
        Scanner::CollectTrailingNewlines(store_, path, size, required, window_size_);
    if (!offsets) {
        return std::unexpected(offsets.error());
    }

    std::uint64_t start = 0;
    if (offsets->size() >= required) {
        start = offsets->front() + 1;
    }
    spdlog::trace(
        "Tailer::TailLines '{}': {} boundaries found, reading [{}, {})", path, offsets->size(),
        start, size
    );
    if (start >= size) {
        return {};
    }

    auto data = store_.ReadRange(path, start, size);
    if (!data) {
        return std::unexpected(data.error());
    }
    return EmitBytes(out, *data);
}

StorageResult<void> Tailer::TailBytes(
    const std::string& path, std::uint64_t count, std::uint64_t size, std::ostream& out
)
{
    const std::uint64_t start = size - std::min(count, size);
    auto data                 = store_.ReadRange(path, start, size);
    if (!data) {
        return std::unexpected(data.error());
    }
    return EmitBytes(out, *data);
}

StorageResult<void> Tailer::TailLinesStreaming(
    const std::string& path, std::uint64_t count, std::ostream& out
)
{
    Scanner::LineReader reader(
        Scanner::ChunkedScanner(store_, path, window_size_, Scanner::Direction::Forward)
    );

    std::deque<std::string> last_lines;
    while (true) {
        auto line = reader.NextLine();
        if (!line) {
            return std::unexpected(line.error());
        }
        if (!line->has_value()) {
            break;
        }
        last_lines.push_back(std::move(line->value().raw));
        if (last_lines.size() > count) {
            last_lines.pop_front();
        }
    }

    for (const auto& text : last_lines) {
        if (auto res = EmitBytes(out, text); !res) {
            return res;
        }
    }
    return {};
}

StorageResult<void> Tailer::TailBytesStreaming(
    const std::string& path, std::uint64_t count, std::ostream& out
)
{
    Scanner::ChunkedScanner scanner(store_, path, window_size_, Scanner::Direction::Forward);

    std::deque<std::byte> last_bytes;
    while (true) {
        auto window = scanner.Next();
        if (!window) {
            return std::unexpected(window.error());
        }
        if (!window->has_value()) {
            break;
        }
        const auto& bytes = window->value().bytes;
        last_bytes.insert(last_bytes.end(), bytes.begin(), bytes.end());
        if (last_bytes.size() > count) {
            last_bytes.erase(
                last_bytes.begin(),
                last_bytes.begin() + static_cast<std::ptrdiff_t>(last_bytes.size() - count)
            );
        }
    }

    std::vector<std::byte> tail(last_bytes.begin(), last_bytes.end());
    return EmitBytes(out, tail);
}

StorageResult<MultiPathReport> Tailer::TailMany(
    const std::vector<std::string>& paths, std::optional<std::uint64_t> lines,
    std::optional<std::uint64_t> bytes, const HeaderOptions& options, std::ostream& out,
    std::ostream& err
)
{
    auto mode = ResolveReadMode(lines, bytes, Constants::DEFAULT_TAIL_LINES);
    if (!mode) {
        return std::unexpected(mode.error());
    }
    return RunForEachPath("tail", paths, options, out, err, [&](const std::string& path) {
        return Tail(path, *mode, out);
    });
}

}  // namespace Storify::Operations
