#ifndef STORIFY_SRC_OPERATIONS_TAILER_HPP_
#define STORIFY_SRC_OPERATIONS_TAILER_HPP_

#include "app_constants.hpp"
#include "operations/multi_path.hpp"
#include "operations/read_mode.hpp"
#include "storage/i_object_store.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Storify::Operations
{

// Emits the last lines or bytes of an object.
//
// With a known size, Lines(n) walks backward in fixed windows collecting
// newline offsets until the n-th line boundary from the end is found, then
// reads [boundary, size) in a single request. Objects whose store reports
// no size are scanned forward keeping only the last n lines (or bytes).
class Tailer
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit Tailer(
        Storage::IObjectStore& store, std::size_t window_size = Constants::DEFAULT_BUFFER_SIZE
    );
    ~Tailer() = default;

    Tailer(const Tailer&)            = delete;
    Tailer& operator=(const Tailer&) = delete;
    Tailer(Tailer&&)                 = delete;
    Tailer& operator=(Tailer&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    Storage::StorageResult<void> Tail(const std::string& path, ReadMode mode, std::ostream& out);

    Storage::StorageResult<MultiPathReport> TailMany(
        const std::vector<std::string>& paths, std::optional<std::uint64_t> lines,
        std::optional<std::uint64_t> bytes, const HeaderOptions& options, std::ostream& out,
        std::ostream& err
    );

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    Storage::StorageResult<void> TailLines(
        const std::string& path, std::uint64_t count, std::uint64_t size, std::ostream& out
    );
    Storage::StorageResult<void> TailBytes(
        const std::string& path, std::uint64_t count, std::uint64_t size, std::ostream& out
    );
    Storage::StorageResult<void> TailLinesStreaming(
        const std::string& path, std::uint64_t count, std::ostream& out
    );
    Storage::StorageResult<void> TailBytesStreaming(
        const std::string& path, std::uint64_t count, std::ostream& out
    );
    Storage::StorageResult<bool> EndsWithNewline(const std::string& path, std::uint64_t size);

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    Storage::IObjectStore& store_;
    const std::size_t window_size_;
};

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_TAILER_HPP_
