#ifndef STORIFY_SRC_OPERATIONS_READ_MODE_HPP_
#define STORIFY_SRC_OPERATIONS_READ_MODE_HPP_

#include "storage/storage_error.hpp"

#include <cstdint>
#include <optional>

namespace Storify::Operations
{

enum class ReadUnit { Lines, Bytes };

// How much of an object head/tail emits.
struct ReadMode {
    ReadUnit unit      = ReadUnit::Lines;
    std::uint64_t count = 0;

    static ReadMode Lines(std::uint64_t n) { return {ReadUnit::Lines, n}; }
    static ReadMode Bytes(std::uint64_t n) { return {ReadUnit::Bytes, n}; }

    bool operator==(const ReadMode&) const = default;
};

// lines/bytes are mutually exclusive; neither given selects Lines(default_lines).
inline Storage::StorageResult<ReadMode> ResolveReadMode(
    std::optional<std::uint64_t> lines, std::optional<std::uint64_t> bytes,
    std::uint64_t default_lines
)
{
    if (lines.has_value() && bytes.has_value()) {
        return std::unexpected(make_error_code(Storage::StorageErrc::InvalidArgument));
    }
    if (bytes.has_value()) {
        return ReadMode::Bytes(*bytes);
    }
    return ReadMode::Lines(lines.value_or(default_lines));
}

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_READ_MODE_HPP_
