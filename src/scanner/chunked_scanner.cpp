#include "scanner/chunked_scanner.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace Storify::Scanner
{

using Storage::StorageErrc;
using Storage::StorageResult;

ChunkedScanner::ChunkedScanner(
    Storage::IObjectStore& store, std::string path, std::size_t window_size,
    Direction direction, std::uint64_t known_size
)
    : store_(store),
      path_(std::move(path)),
      window_size_(window_size),
      direction_(direction),
      known_size_(known_size),
      next_offset_(direction == Direction::Forward ? 0 : known_size)
{
    if (window_size_ == 0) {
        throw std::invalid_argument("ChunkedScanner window size must be positive.");
    }
    if (direction_ == Direction::Backward && known_size_ == 0) {
        exhausted_ = true;
    }
}

StorageResult<std::optional<Window>> ChunkedScanner::Next()
{
    if (exhausted_) {
        return std::optional<Window>{};
    }
    return direction_ == Direction::Forward ? NextForward() : NextBackward();
}

StorageResult<std::optional<Window>> ChunkedScanner::NextForward()
{
    std::uint64_t end = next_offset_ + window_size_;
    if (known_size_ > 0) {
        if (next_offset_ >= known_size_) {
            exhausted_ = true;
            return std::optional<Window>{};
        }
        end = std::min(end, known_size_);
    }
    const std::uint64_t requested = end - next_offset_;

    auto read_res = store_.ReadRange(path_, next_offset_, end);
    if (!read_res) {
        if (Storage::IsErrc(read_res.error(), StorageErrc::RangeNotSatisfiable)) {
            spdlog::trace("ChunkedScanner: '{}' range past EOF at {}", path_, next_offset_);
            exhausted_ = true;
            return std::optional<Window>{};
        }
        return std::unexpected(read_res.error());
    }

    Window window{next_offset_, std::move(read_res.value())};
    if (window.bytes.empty()) {
        exhausted_ = true;
        return std::optional<Window>{};
    }
    if (window.bytes.size() < requested) {
        // Short read: the object ended (or shrank) inside this window.
        exhausted_ = true;
    }
    next_offset_ = window.End();
    if (known_size_ > 0 && next_offset_ >= known_size_) {
        exhausted_ = true;
    }
    return std::optional<Window>{std::move(window)};
}

StorageResult<std::optional<Window>> ChunkedScanner::NextBackward()
{
    const std::uint64_t end   = next_offset_;
    const std::uint64_t start = end > window_size_ ? end - window_size_ : 0;

    auto read_res = store_.ReadRange(path_, start, end);
    if (!read_res) {
        if (Storage::IsErrc(read_res.error(), StorageErrc::RangeNotSatisfiable)) {
            exhausted_ = true;
            return std::optional<Window>{};
        }
        return std::unexpected(read_res.error());
    }

    next_offset_ = start;
    if (next_offset_ == 0) {
        exhausted_ = true;
    }
    return std::optional<Window>{Window{start, std::move(read_res.value())}};
}

StorageResult<std::vector<std::uint64_t>> CollectTrailingNewlines(
    Storage::IObjectStore& store, const std::string& path, std::uint64_t size,
    std::size_t required, std::size_t window_size
)
{
    std::vector<std::uint64_t> offsets;
    if (required == 0 || size == 0) {
        return offsets;
    }

    ChunkedScanner scanner(store, path, window_size, Direction::Backward, size);
    while (offsets.size() < required) {
        auto next = scanner.Next();
        if (!next) {
            return std::unexpected(next.error());
        }
        if (!next->has_value()) {
            break;
        }
        const Window& window = next->value();

        // Walk the window back to front so offsets stay in descending order.
        for (std::size_t i = window.bytes.size(); i > 0 && offsets.size() < required; --i) {
            if (window.bytes[i - 1] == std::byte{'\n'}) {
                offsets.push_back(window.offset + i - 1);
            }
        }
    }

    std::ranges::reverse(offsets);
    return offsets;
}

}  // namespace Storify::Scanner
