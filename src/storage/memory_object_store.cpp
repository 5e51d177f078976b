#include "storage/memory_object_store.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace Storify::Storage
{

namespace
{

std::vector<std::byte> ToBytes(std::string_view text)
{
    std::vector<std::byte> out(text.size());
    std::ranges::transform(text, out.begin(), [](char c) { return static_cast<std::byte>(c); });
    return out;
}

std::string ParentKey(const std::string& key)
{
    auto pos = key.rfind('/');
    return pos == std::string::npos ? std::string{} : key.substr(0, pos);
}

// Buffers everything and publishes the object in one Write() on Close().
class MemoryObjectWriter : public IObjectWriter
{
    public:
    MemoryObjectWriter(IObjectStore& store, std::string path)
        : store_(store), path_(std::move(path))
    {
    }

    StorageResult<void> Write(std::span<const std::byte> data) override
    {
        if (closed_) {
            return std::unexpected(make_error_code(StorageErrc::InvalidArgument));
        }
        buffer_.insert(buffer_.end(), data.begin(), data.end());
        return {};
    }

    StorageResult<void> Close() override
    {
        if (closed_) {
            return {};
        }
        auto res = store_.Write(path_, buffer_);
        if (res) {
            closed_ = true;
            buffer_.clear();
        }
        return res;
    }

    private:
    IObjectStore& store_;
    std::string path_;
    std::vector<std::byte> buffer_;
    bool closed_ = false;
};

}  // namespace

MemoryObjectStore::MemoryObjectStore(Options options) : options_(options)
{
    spdlog::debug(
        "MemoryObjectStore created: report_size={}, range_error_past_eof={}, change_tags={}",
        options_.report_size, options_.range_error_past_eof, options_.provide_change_tags
    );
}

std::string MemoryObjectStore::Normalize(const std::string& path)
{
    auto first = path.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    auto last = path.find_last_not_of('/');
    return path.substr(first, last - first + 1);
}

bool MemoryObjectStore::IsDirectoryLocked(const std::string& key) const
{
    if (key.empty() || explicit_dirs_.contains(key)) {
        return true;
    }
    const std::string prefix = key + "/";
    auto it                  = objects_.lower_bound(prefix);
    if (it != objects_.end() && it->first.starts_with(prefix)) {
        return true;
    }
    auto dir_it = explicit_dirs_.lower_bound(prefix);
    return dir_it != explicit_dirs_.end() && dir_it->starts_with(prefix);
}

bool MemoryObjectStore::ParentExistsLocked(const std::string& key) const
{
    return IsDirectoryLocked(ParentKey(key));
}

void MemoryObjectStore::StoreLocked(const std::string& key, std::vector<std::byte> data)
{
    auto& object         = objects_[key];
    object.data          = std::move(data);
    object.generation    = next_generation_++;
    object.last_modified = std::time(nullptr);
}

ObjectMetadata MemoryObjectStore::MetadataLocked(const StoredObject& object) const
{
    ObjectMetadata meta;
    meta.size          = options_.report_size ? object.data.size() : 0;
    meta.last_modified = object.last_modified;
    meta.content_type  = "application/octet-stream";
    if (options_.provide_change_tags) {
        meta.change_tag = "\"gen-" + std::to_string(object.generation) + "\"";
    }
    return meta;
}

ObjectMetadata MemoryObjectStore::DirectoryMetadata() const
{
    ObjectMetadata meta;
    meta.is_directory = true;
    return meta;
}

StorageResult<ObjectMetadata> MemoryObjectStore::Stat(const std::string& path)
{
    const bool wants_dir = !path.empty() && path.back() == '/';
    const auto key       = Normalize(path);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!wants_dir) {
        if (auto it = objects_.find(key); it != objects_.end()) {
            return MetadataLocked(it->second);
        }
    }
    if (IsDirectoryLocked(key)) {
        return DirectoryMetadata();
    }
    spdlog::trace("MemoryObjectStore::Stat '{}': not found", path);
    return std::unexpected(make_error_code(StorageErrc::NotFound));
}

StorageResult<std::vector<std::byte>> MemoryObjectStore::ReadRange(
    const std::string& path, std::uint64_t start, std::uint64_t end
)
{
    const auto key = Normalize(path);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        if (IsDirectoryLocked(key)) {
            return std::unexpected(make_error_code(StorageErrc::IsADirectory));
        }
        return std::unexpected(make_error_code(StorageErrc::NotFound));
    }
    ++read_count_;

    const auto& data = it->second.data;
    if (end <= start) {
        return std::vector<std::byte>{};
    }
    if (start >= data.size()) {
        if (options_.range_error_past_eof) {
            return std::unexpected(make_error_code(StorageErrc::RangeNotSatisfiable));
        }
        return std::vector<std::byte>{};
    }
    const auto clamped_end = std::min<std::uint64_t>(end, data.size());
    spdlog::trace("MemoryObjectStore::ReadRange '{}' [{}, {})", path, start, clamped_end);
    return std::vector<std::byte>(
        data.begin() + static_cast<std::ptrdiff_t>(start),
        data.begin() + static_cast<std::ptrdiff_t>(clamped_end)
    );
}

StorageResult<void> MemoryObjectStore::Write(
    const std::string& path, std::span<const std::byte> data
)
{
    if (!path.empty() && path.back() == '/') {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }
    const auto key = Normalize(path);
    if (key.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!objects_.contains(key) && IsDirectoryLocked(key)) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }
    if (options_.require_parent_for_write && !ParentExistsLocked(key)) {
        spdlog::trace("MemoryObjectStore::Write '{}': parent missing", path);
        return std::unexpected(make_error_code(StorageErrc::NotFound));
    }
    StoreLocked(key, std::vector<std::byte>(data.begin(), data.end()));
    ++write_count_;
    spdlog::trace("MemoryObjectStore::Write '{}' -> {} bytes", path, data.size());
    return {};
}

StorageResult<std::unique_ptr<IObjectWriter>> MemoryObjectStore::OpenWriter(
    const std::string& path
)
{
    const auto key = Normalize(path);
    if (key.empty() || path.back() == '/') {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (options_.require_parent_for_write && !ParentExistsLocked(key)) {
            return std::unexpected(make_error_code(StorageErrc::NotFound));
        }
    }
    return std::make_unique<MemoryObjectWriter>(*this, key);
}

StorageResult<void> MemoryObjectStore::Delete(const std::string& path)
{
    const auto key = Normalize(path);

    std::lock_guard<std::mutex> lock(mutex_);
    if (objects_.erase(key) > 0) {
        ++write_count_;
    }
    explicit_dirs_.erase(key);
    return {};
}

StorageResult<void> MemoryObjectStore::CreateParent(const std::string& path)
{
    std::string parent = ParentKey(Normalize(path));

    std::lock_guard<std::mutex> lock(mutex_);
    while (!parent.empty()) {
        if (objects_.contains(parent)) {
            return std::unexpected(make_error_code(StorageErrc::NotADirectory));
        }
        explicit_dirs_.insert(parent);
        parent = ParentKey(parent);
    }
    return {};
}

StorageResult<void> MemoryObjectStore::Move(const std::string& from, const std::string& to)
{
    const auto from_key = Normalize(from);
    const auto to_key   = Normalize(to);
    if (to_key.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto node = objects_.extract(from_key);
    if (node.empty()) {
        return std::unexpected(make_error_code(StorageErrc::NotFound));
    }
    StoreLocked(to_key, std::move(node.mapped().data));
    ++write_count_;
    return {};
}

StorageResult<std::vector<ObjectEntry>> MemoryObjectStore::List(
    const std::string& path, bool recursive
)
{
    const auto key = Normalize(path);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsDirectoryLocked(key)) {
        if (objects_.contains(key)) {
            return std::unexpected(make_error_code(StorageErrc::NotADirectory));
        }
        return std::unexpected(make_error_code(StorageErrc::NotFound));
    }

    const std::string prefix = key.empty() ? std::string{} : key + "/";
    std::map<std::string, ObjectEntry> found;

    // Registers every intermediate directory between prefix and rel_key.
    auto add_directories = [&](const std::string& rel_key) {
        std::size_t pos = prefix.size();
        while ((pos = rel_key.find('/', pos)) != std::string::npos) {
            std::string dir_path = rel_key.substr(0, pos + 1);
            found.try_emplace(dir_path, ObjectEntry{dir_path, DirectoryMetadata()});
            if (!recursive) {
                return;
            }
            ++pos;
        }
    };

    for (auto it = objects_.lower_bound(prefix);
         it != objects_.end() && it->first.starts_with(prefix); ++it) {
        const auto& object_key = it->first;
        const bool nested = object_key.find('/', prefix.size()) != std::string::npos;
        add_directories(object_key);
        if (nested && !recursive) {
            continue;
        }
        found.try_emplace(object_key, ObjectEntry{object_key, MetadataLocked(it->second)});
    }
    for (auto it = explicit_dirs_.lower_bound(prefix);
         it != explicit_dirs_.end() && it->starts_with(prefix); ++it) {
        if (*it == key) {
            continue;
        }
        add_directories(*it + "/");
    }

    std::vector<ObjectEntry> entries;
    entries.reserve(found.size());
    for (auto& [_, entry] : found) {
        entries.push_back(std::move(entry));
    }
    return entries;
}

void MemoryObjectStore::PutString(const std::string& path, std::string_view content)
{
    std::lock_guard<std::mutex> lock(mutex_);
    StoreLocked(Normalize(path), ToBytes(content));
}

std::optional<std::string> MemoryObjectStore::GetString(const std::string& path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(Normalize(path));
    if (it == objects_.end()) {
        return std::nullopt;
    }
    std::string out(it->second.data.size(), '\0');
    std::ranges::transform(it->second.data, out.begin(), [](std::byte b) {
        return static_cast<char>(b);
    });
    return out;
}

bool MemoryObjectStore::Contains(const std::string& path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.contains(Normalize(path));
}

std::vector<std::string> MemoryObjectStore::Keys() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(objects_.size());
    for (const auto& [key, _] : objects_) {
        keys.push_back(key);
    }
    return keys;
}

std::uint64_t MemoryObjectStore::ReadCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return read_count_;
}

std::uint64_t MemoryObjectStore::WriteCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return write_count_;
}

}  // namespace Storify::Storage
