#ifndef STORIFY_SRC_OPERATIONS_STATER_HPP_
#define STORIFY_SRC_OPERATIONS_STATER_HPP_

#include "storage/i_object_store.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace Storify::Operations
{

struct ObjectReport {
    std::string path;
    std::string entry_type;  ///< "file" | "dir"
    std::uint64_t size = 0;
    std::optional<std::string> last_modified;  ///< RFC 3339, UTC
    std::optional<std::string> etag;
    std::optional<std::string> content_type;
};

void to_json(nlohmann::json& j, const ObjectReport& report);

class Stater
{
    public:
    explicit Stater(Storage::IObjectStore& store) : store_(store) {}

    Stater(const Stater&)            = delete;
    Stater& operator=(const Stater&) = delete;

    Storage::StorageResult<ObjectReport> Stat(const std::string& path);

    // key=value lines; absent optional fields are printed as "-".
    static void PrintHuman(const ObjectReport& report, std::ostream& out);
    static void PrintJson(const ObjectReport& report, std::ostream& out);

    private:
    Storage::IObjectStore& store_;
};

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_STATER_HPP_
