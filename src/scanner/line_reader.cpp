#include "scanner/line_reader.hpp"

#include <stdexcept>
#include <utility>

namespace Storify::Scanner
{

std::string_view Line::Content() const
{
    std::string_view view(raw);
    if (!view.empty() && view.back() == '\n') {
        view.remove_suffix(1);
    }
    if (!view.empty() && view.back() == '\r') {
        view.remove_suffix(1);
    }
    return view;
}

LineReader::LineReader(ChunkedScanner scanner) : scanner_(std::move(scanner))
{
    if (scanner_.GetDirection() != Direction::Forward) {
        throw std::invalid_argument("LineReader requires a forward scanner.");
    }
}

Storage::StorageResult<bool> LineReader::Refill()
{
    auto next = scanner_.Next();
    if (!next) {
        return std::unexpected(next.error());
    }
    if (!next->has_value()) {
        source_done_ = true;
        return false;
    }

    // Drop what was already handed out before growing the buffer.
    if (consumed_ > 0) {
        leftover_.erase(0, consumed_);
        search_from_ -= consumed_;
        consumed_ = 0;
    }
    const auto& bytes = next->value().bytes;
    leftover_.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return true;
}

Storage::StorageResult<std::optional<Line>> LineReader::NextLine()
{
    while (true) {
        auto newline = leftover_.find('\n', search_from_);
        if (newline != std::string::npos) {
            Line line{leftover_.substr(consumed_, newline + 1 - consumed_), true};
            consumed_    = newline + 1;
            search_from_ = consumed_;
            ++lines_read_;
            return std::optional<Line>{std::move(line)};
        }
        search_from_ = leftover_.size();

        if (source_done_) {
            if (consumed_ < leftover_.size()) {
                Line line{leftover_.substr(consumed_), false};
                consumed_ = leftover_.size();
                ++lines_read_;
                return std::optional<Line>{std::move(line)};
            }
            return std::optional<Line>{};
        }

        auto refilled = Refill();
        if (!refilled) {
            return std::unexpected(refilled.error());
        }
    }
}

}  // namespace Storify::Scanner
