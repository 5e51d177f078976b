#ifndef STORIFY_SRC_OPERATIONS_CATER_HPP_
#define STORIFY_SRC_OPERATIONS_CATER_HPP_

#include "app_constants.hpp"
#include "storage/i_object_store.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace Storify::Operations
{

struct CatOptions {
    std::uint64_t size_limit_mb = 0;
    bool force                  = false;
};

// Streams a whole object to `out` one window at a time.
class Cater
{
    public:
    explicit Cater(
        Storage::IObjectStore& store, std::size_t chunk_size = Constants::DEFAULT_CHUNK_SIZE
    );

    Cater(const Cater&)            = delete;
    Cater& operator=(const Cater&) = delete;

    // Returns the number of bytes written.
    Storage::StorageResult<std::uint64_t> Cat(
        const std::string& path, const CatOptions& options, std::ostream& out
    );

    private:
    Storage::IObjectStore& store_;
    const std::size_t chunk_size_;
};

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_CATER_HPP_
