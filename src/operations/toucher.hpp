#ifndef STORIFY_SRC_OPERATIONS_TOUCHER_HPP_
#define STORIFY_SRC_OPERATIONS_TOUCHER_HPP_

#include "storage/i_object_store.hpp"

#include <string>

namespace Storify::Operations
{

struct TouchOptions {
    bool no_create = false;
    bool truncate  = false;  ///< empty an existing object
    bool parents   = false;
};

enum class TouchOutcome { Untouched, Created, Truncated, Skipped };

// Ensures an object exists, optionally emptying it.
class Toucher
{
    public:
    explicit Toucher(Storage::IObjectStore& store) : store_(store) {}

    Toucher(const Toucher&)            = delete;
    Toucher& operator=(const Toucher&) = delete;

    Storage::StorageResult<TouchOutcome> Touch(const std::string& path, const TouchOptions& options);

    private:
    Storage::StorageResult<void> WriteEmpty(const std::string& path);

    Storage::IObjectStore& store_;
};

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_TOUCHER_HPP_
