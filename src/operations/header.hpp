#ifndef STORIFY_SRC_OPERATIONS_HEADER_HPP_
#define STORIFY_SRC_OPERATIONS_HEADER_HPP_

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

// Emits the first lines or bytes of an object.
class Header
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit Header(
        Storage::IObjectStore& store, std::size_t chunk_size = Constants::DEFAULT_CHUNK_SIZE
    );
    ~Header() = default;

    Header(const Header&)            = delete;
    Header& operator=(const Header&) = delete;
    Header(Header&&)                 = delete;
    Header& operator=(Header&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // Lines(n) stops reading as soon as n lines were written.
    Storage::StorageResult<void> Head(const std::string& path, ReadMode mode, std::ostream& out);

    Storage::StorageResult<MultiPathReport> HeadMany(
        const std::vector<std::string>& paths, std::optional<std::uint64_t> lines,
        std::optional<std::uint64_t> bytes, const HeaderOptions& options, std::ostream& out,
        std::ostream& err
    );

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    Storage::StorageResult<void> HeadLines(
        const std::string& path, std::uint64_t count, std::uint64_t size, std::ostream& out
    );
    Storage::StorageResult<void> HeadBytes(
        const std::string& path, std::uint64_t count, std::uint64_t size, std::ostream& out
    );

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    Storage::IObjectStore& store_;
    const std::size_t chunk_size_;
};

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_HEADER_HPP_
