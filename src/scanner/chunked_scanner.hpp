#ifndef STORIFY_SRC_SCANNER_CHUNKED_SCANNER_HPP_
#define STORIFY_SRC_SCANNER_CHUNKED_SCANNER_HPP_

#include "storage/i_object_store.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Storify::Scanner
{

enum class Direction { Forward, Backward };

// A contiguous slice of the object starting at absolute offset `offset`.
struct Window {
    std::uint64_t offset = 0;
    std::vector<std::byte> bytes;

    std::uint64_t End() const { return offset + bytes.size(); }
};

// Pull-based cursor yielding fixed-size windows of an object.
//
// Forward scans start at offset 0. With an unknown size (0) a short window
// or RangeNotSatisfiable ends the scan. Backward scans start at the end of
// the object and need its size; each window covers the bytes immediately
// before the previous one. The sequence is finite and cannot be restarted.
class ChunkedScanner
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    ChunkedScanner(
        Storage::IObjectStore& store, std::string path, std::size_t window_size,
        Direction direction, std::uint64_t known_size = 0
    );
    ~ChunkedScanner() = default;

    ChunkedScanner(const ChunkedScanner&)            = delete;
    ChunkedScanner& operator=(const ChunkedScanner&) = delete;
    ChunkedScanner(ChunkedScanner&&)                 = default;
    ChunkedScanner& operator=(ChunkedScanner&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // Next window, std::nullopt once the scan is exhausted.
    Storage::StorageResult<std::optional<Window>> Next();

    bool Exhausted() const { return exhausted_; }
    Direction GetDirection() const { return direction_; }

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    Storage::StorageResult<std::optional<Window>> NextForward();
    Storage::StorageResult<std::optional<Window>> NextBackward();

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    Storage::IObjectStore& store_;
    const std::string path_;
    const std::size_t window_size_;
    const Direction direction_;
    const std::uint64_t known_size_;

    std::uint64_t next_offset_;
    bool exhausted_ = false;
};

// Absolute offsets of the last `required` newlines (ascending), scanning
// backward from the end of an object of `size` bytes. Fewer are returned
// when the object does not contain that many.
Storage::StorageResult<std::vector<std::uint64_t>> CollectTrailingNewlines(
    Storage::IObjectStore& store, const std::string& path, std::uint64_t size,
    std::size_t required, std::size_t window_size
);

}  // namespace Storify::Scanner

#endif  // STORIFY_SRC_SCANNER_CHUNKED_SCANNER_HPP_
