#ifndef STORIFY_SRC_OPERATIONS_WITNESS_HPP_
#define STORIFY_SRC_OPERATIONS_WITNESS_HPP_

#include "storage/object_metadata.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace Storify::Operations
{

// (size, change tag) snapshot taken at a checkpoint.
struct Witness {
    std::uint64_t size = 0;
    std::optional<std::string> change_tag;

    static Witness From(const Storage::ObjectMetadata& meta) { return {meta.size, meta.change_tag}; }

    // Tags decide when both sides carry one; sizes decide when neither does.
    // A tag appearing or disappearing counts as a change.
    bool Matches(const Witness& other) const
    {
        if (change_tag.has_value() && other.change_tag.has_value()) {
            return *change_tag == *other.change_tag;
        }
        if (!change_tag.has_value() && !other.change_tag.has_value()) {
            return size == other.size;
        }
        return false;
    }
};

// Presence-aware comparison: both absent is unchanged, one absent is a change.
inline bool Unmodified(const std::optional<Witness>& before, const std::optional<Witness>& now)
{
    if (!before.has_value() || !now.has_value()) {
        return before.has_value() == now.has_value();
    }
    return before->Matches(*now);
}

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_WITNESS_HPP_
