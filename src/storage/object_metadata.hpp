#ifndef STORIFY_SRC_STORAGE_OBJECT_METADATA_HPP_
#define STORIFY_SRC_STORAGE_OBJECT_METADATA_HPP_

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace Storify::Storage
{

// Snapshot of a remote object's attributes. A size of 0 means "unknown or
// empty"; only a positive size is authoritative.
struct ObjectMetadata {
    std::uint64_t size = 0;
    std::optional<std::string> change_tag;
    bool is_directory = false;
    std::optional<std::time_t> last_modified;
    std::optional<std::string> content_type;

    bool HasKnownSize() const { return size > 0; }
};

struct ObjectEntry {
    std::string path;
    ObjectMetadata metadata;
};

}  // namespace Storify::Storage

#endif  // STORIFY_SRC_STORAGE_OBJECT_METADATA_HPP_
