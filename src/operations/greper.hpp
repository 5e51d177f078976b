#ifndef STORIFY_SRC_OPERATIONS_GREPER_HPP_
#define STORIFY_SRC_OPERATIONS_GREPER_HPP_

#include "app_constants.hpp"
#include "storage/i_object_store.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace Storify::Operations
{

struct GrepOptions {
    bool ignore_case   = false;
    bool line_number   = false;  ///< prefix matches with "N:"
    bool with_filename = false;  ///< prefix matches with "path:"
    bool recursive     = false;
};

// Substring test used by Greper. With ignore_case the needle must already be
// lower-cased; pure-ASCII inputs are compared byte-wise without copying.
bool LineMatches(std::string_view line, std::string_view needle, bool ignore_case);

// Lower-cases UTF-8 text code point by code point. Invalid sequences become
// U+FFFD.
std::string Utf8ToLower(std::string_view text);

// Streaming substring search over the lines of an object.
class Greper
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit Greper(
        Storage::IObjectStore& store, std::size_t chunk_size = Constants::DEFAULT_CHUNK_SIZE
    );
    ~Greper() = default;

    Greper(const Greper&)            = delete;
    Greper& operator=(const Greper&) = delete;
    Greper(Greper&&)                 = delete;
    Greper& operator=(Greper&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // Searches a single object. Returns the number of matching lines.
    Storage::StorageResult<std::uint64_t> Grep(
        const std::string& path, const std::string& pattern, const GrepOptions& options,
        std::ostream& out
    );

    // Entry point for the grep command: a file is searched directly; a
    // directory (or a missing prefix) is walked when options.recursive is set
    // and every file below it is searched with the "path:" prefix.
    Storage::StorageResult<std::uint64_t> GrepPath(
        const std::string& path, const std::string& pattern, const GrepOptions& options,
        std::ostream& out
    );

    private:
    Storage::StorageResult<std::uint64_t> GrepTree(
        const std::string& path, const std::string& pattern, const GrepOptions& options,
        std::ostream& out
    );

    Storage::IObjectStore& store_;
    const std::size_t chunk_size_;
};

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_GREPER_HPP_
