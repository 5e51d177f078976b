#include "storage/local_object_store.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace Storify::Storage
{

namespace fs = std::filesystem;

namespace
{

class FileDescriptorGuard
{
    private:
    int fd_;

    public:
    explicit FileDescriptorGuard(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptorGuard()
    {
        if (fd_ >= 0) {
            if (::close(fd_) == -1) {
                spdlog::error(
                    "~FileDescriptorGuard: Failed to close fd {}: {}", fd_, std::strerror(errno)
                );
            }
        }
    }
    FileDescriptorGuard(const FileDescriptorGuard&)            = delete;
    FileDescriptorGuard& operator=(const FileDescriptorGuard&) = delete;
    FileDescriptorGuard(FileDescriptorGuard&& other) noexcept : fd_(other.release()) {}
    FileDescriptorGuard& operator=(FileDescriptorGuard&& other) noexcept
    {
        reset(other.release());
        return *this;
    }
    int get() const noexcept { return fd_; }
    int release() noexcept { return std::exchange(fd_, -1); }
    void reset(int new_fd = -1) noexcept
    {
        if (fd_ >= 0 && fd_ != new_fd) {
            if (::close(fd_) == -1) {
                spdlog::error(
                    "FileDescriptorGuard.reset: Failed to close fd {}: {}", fd_,
                    std::strerror(errno)
                );
            }
        }
        fd_ = new_fd;
    }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

std::string StripLeadingSlashes(const std::string& path)
{
    auto first = path.find_first_not_of('/');
    return first == std::string::npos ? std::string{} : path.substr(first);
}

// Loops over pwrite until every byte of data landed at offset.
StorageResult<void> WriteFully(int fd, std::span<const std::byte> data, off_t offset)
{
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t res = ::pwrite(
            fd, data.data() + written, data.size() - written,
            offset + static_cast<off_t>(written)
        );
        if (res < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(make_error_code(ErrnoToStorageErrc(errno)));
        }
        written += static_cast<std::size_t>(res);
    }
    return {};
}

std::string RandomHexSuffix()
{
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << rng();
    return oss.str();
}

// Writes into a hidden sibling file and renames it over the target on Close().
class LocalObjectWriter : public IObjectWriter
{
    public:
    LocalObjectWriter(fs::path target, fs::path partial, int fd)
        : target_(std::move(target)), partial_(std::move(partial)), fd_guard_(fd)
    {
    }

    ~LocalObjectWriter() override
    {
        if (!closed_) {
            fd_guard_.reset();
            std::error_code ec;
            fs::remove(partial_, ec);
            if (ec) {
                spdlog::warn(
                    "LocalObjectWriter: failed to discard partial file '{}': {}",
                    partial_.string(), ec.message()
                );
            }
        }
    }

    StorageResult<void> Write(std::span<const std::byte> data) override
    {
        if (closed_) {
            return std::unexpected(make_error_code(StorageErrc::InvalidArgument));
        }
        auto res = WriteFully(fd_guard_.get(), data, offset_);
        if (!res) {
            return res;
        }
        offset_ += static_cast<off_t>(data.size());
        return {};
    }

    StorageResult<void> Close() override
    {
        if (closed_) {
            return {};
        }
        if (::fsync(fd_guard_.get()) == -1) {
            return std::unexpected(make_error_code(ErrnoToStorageErrc(errno)));
        }
        fd_guard_.reset();
        if (::rename(partial_.c_str(), target_.c_str()) == -1) {
            return std::unexpected(make_error_code(ErrnoToStorageErrc(errno)));
        }
        closed_ = true;
        return {};
    }

    private:
    fs::path target_;
    fs::path partial_;
    FileDescriptorGuard fd_guard_;
    off_t offset_ = 0;
    bool closed_  = false;
};

}  // anonymous namespace

LocalObjectStore::LocalObjectStore(const Config::StorageDefinition& definition)
    : definition_(definition), base_path_(definition.root)
{
    if (base_path_.empty()) {
        throw std::invalid_argument("LocalObjectStore requires a non-empty root.");
    }

    base_path_ = fs::absolute(base_path_).lexically_normal();
    spdlog::debug("LocalObjectStore created for root: {}", base_path_.string());
}

fs::path LocalObjectStore::GetFullPath(const std::string& relative_path) const
{
    auto combined = (base_path_ / StripLeadingSlashes(relative_path)).lexically_normal();

    std::string base_str = base_path_.string();
    if (base_str.back() != fs::path::preferred_separator) {
        base_str += fs::path::preferred_separator;
    }
    if (combined.string().rfind(base_str, 0) != 0 && combined != base_path_ &&
        combined.string() + fs::path::preferred_separator != base_str) {
        spdlog::warn(
            "LocalObjectStore: Potential path traversal detected: relative='{}', combined='{}', "
            "base='{}'",
            relative_path, combined.string(), base_path_.string()
        );
        return {};
    }
    return combined;
}

std::error_code LocalObjectStore::MapFilesystemError(
    const std::error_code& ec, const std::string& operation
) const
{
    if (!ec)
        return {};

    StorageErrc storage_errc = StorageErrc::UnknownError;
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        storage_errc = ErrnoToStorageErrc(ec.value());
    }

    if (storage_errc == StorageErrc::UnknownError) {
        spdlog::warn(
            "LocalObjectStore::MapFilesystemError: Unmapped error during '{}': code={}, "
            "category={}, message='{}'",
            operation.empty() ? "operation" : operation, ec.value(), ec.category().name(),
            ec.message()
        );
    }
    return make_error_code(storage_errc);
}

ObjectMetadata LocalObjectStore::MetadataFromStat(const struct stat& stbuf) const
{
    ObjectMetadata meta;
    meta.is_directory  = S_ISDIR(stbuf.st_mode);
    meta.size          = meta.is_directory ? 0 : static_cast<std::uint64_t>(stbuf.st_size);
    meta.last_modified = stbuf.st_mtime;
    if (!meta.is_directory) {
        meta.content_type = "application/octet-stream";
    }

    if (definition_.synthesize_change_tags && !meta.is_directory) {
        const auto mtime_ns = static_cast<std::uint64_t>(stbuf.st_mtim.tv_sec) * 1000000000ULL +
                              static_cast<std::uint64_t>(stbuf.st_mtim.tv_nsec);
        std::ostringstream tag;
        tag << std::hex << static_cast<std::uint64_t>(stbuf.st_ino) << '-' << mtime_ns << '-'
            << static_cast<std::uint64_t>(stbuf.st_size);
        meta.change_tag = tag.str();
    }
    return meta;
}

std::string LocalObjectStore::ToRelative(const fs::path& full_path, bool is_directory) const
{
    std::string rel = full_path.lexically_relative(base_path_).generic_string();
    if (is_directory && (rel.empty() || rel.back() != '/')) {
        rel += '/';
    }
    return rel;
}

StorageResult<void> LocalObjectStore::Initialize()
{
    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        spdlog::error("LocalObjectStore: root '{}' does not exist.", base_path_.string());
        return std::unexpected(MapFilesystemError(
            ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory),
            "initialize_check_exists"
        ));
    }
    if (!fs::is_directory(base_path_, ec)) {
        spdlog::error("LocalObjectStore: root '{}' is not a directory.", base_path_.string());
        return std::unexpected(MapFilesystemError(
            ec ? ec : std::make_error_code(std::errc::not_a_directory), "initialize_check_isdir"
        ));
    }

    spdlog::debug("LocalObjectStore initialized using root: {}", base_path_.string());
    return {};
}

StorageResult<ObjectMetadata> LocalObjectStore::Stat(const std::string& path)
{
    auto full_path = GetFullPath(path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    struct stat stbuf{};
    if (::stat(full_path.c_str(), &stbuf) == -1) {
        int stat_errno = errno;
        spdlog::trace(
            "LocalObjectStore::Stat failed for '{}': {}", full_path.string(),
            std::strerror(stat_errno)
        );
        if (stat_errno == ENOTDIR) {
            return std::unexpected(make_error_code(StorageErrc::NotFound));
        }
        return std::unexpected(make_error_code(ErrnoToStorageErrc(stat_errno)));
    }
    if (!path.empty() && path.back() == '/' && !S_ISDIR(stbuf.st_mode)) {
        return std::unexpected(make_error_code(StorageErrc::NotFound));
    }
    return MetadataFromStat(stbuf);
}

StorageResult<std::vector<std::byte>> LocalObjectStore::ReadRange(
    const std::string& path, std::uint64_t start, std::uint64_t end
)
{
    auto full_path = GetFullPath(path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    int fd = ::open(full_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int open_errno = errno;
        spdlog::trace(
            "LocalObjectStore::ReadRange open failed for '{}': {}", full_path.string(),
            std::strerror(open_errno)
        );
        return std::unexpected(make_error_code(ErrnoToStorageErrc(open_errno)));
    }
    FileDescriptorGuard fd_guard(fd);

    struct stat stbuf{};
    if (::fstat(fd, &stbuf) == -1) {
        return std::unexpected(make_error_code(ErrnoToStorageErrc(errno)));
    }
    if (S_ISDIR(stbuf.st_mode)) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }

    std::vector<std::byte> data;
    if (end <= start) {
        return data;
    }
    const auto file_size = static_cast<std::uint64_t>(stbuf.st_size);
    if (start >= file_size) {
        return data;
    }
    const std::uint64_t clamped_end = std::min(end, file_size);
    data.resize(static_cast<std::size_t>(clamped_end - start));

    std::size_t filled = 0;
    while (filled < data.size()) {
        ssize_t bytes_read = ::pread(
            fd, data.data() + filled, data.size() - filled,
            static_cast<off_t>(start + filled)
        );
        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(make_error_code(ErrnoToStorageErrc(errno)));
        }
        if (bytes_read == 0) {
            break;  // file shrank underneath us
        }
        filled += static_cast<std::size_t>(bytes_read);
    }
    data.resize(filled);
    spdlog::trace(
        "LocalObjectStore::ReadRange '{}' [{}, {}) -> {} bytes", path, start, end, data.size()
    );
    return data;
}

StorageResult<void> LocalObjectStore::Write(
    const std::string& path, std::span<const std::byte> data
)
{
    auto full_path = GetFullPath(path);
    if (full_path.empty() || full_path == base_path_)
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    constexpr mode_t default_mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
    const int fd = ::open(full_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, default_mode);
    if (fd < 0) {
        const int open_errno = errno;
        spdlog::trace(
            "LocalObjectStore::Write open failed for '{}': {}", full_path.string(),
            std::strerror(open_errno)
        );
        return std::unexpected(make_error_code(ErrnoToStorageErrc(open_errno)));
    }
    FileDescriptorGuard fd_guard(fd);

    if (auto res = WriteFully(fd, data, 0); !res) {
        return res;
    }
    spdlog::trace("LocalObjectStore::Write '{}' -> {} bytes", path, data.size());
    return {};
}

StorageResult<std::unique_ptr<IObjectWriter>> LocalObjectStore::OpenWriter(const std::string& path)
{
    auto full_path = GetFullPath(path);
    if (full_path.empty() || full_path == base_path_)
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    std::error_code ec;
    if (fs::is_directory(full_path, ec)) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }

    fs::path partial = full_path.parent_path() /
                       ("." + full_path.filename().string() + ".part-" + RandomHexSuffix());

    constexpr mode_t default_mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
    const int fd =
        ::open(partial.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, default_mode);
    if (fd < 0) {
        return std::unexpected(make_error_code(ErrnoToStorageErrc(errno)));
    }
    return std::make_unique<LocalObjectWriter>(full_path, partial, fd);
}

StorageResult<void> LocalObjectStore::Delete(const std::string& path)
{
    auto full_path = GetFullPath(path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    if (full_path == base_path_) {
        return {};
    }

    std::error_code ec;
    if (!fs::remove(full_path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(MapFilesystemError(ec, "delete"));
        }
    }
    return {};
}

StorageResult<void> LocalObjectStore::CreateParent(const std::string& path)
{
    auto full_path = GetFullPath(path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    std::error_code ec;
    auto parent = full_path.parent_path();
    if (parent.empty() || fs::is_directory(parent, ec)) {
        return {};
    }
    fs::create_directories(parent, ec);
    if (ec)
        return std::unexpected(MapFilesystemError(ec, "create_parent"));
    return {};
}

StorageResult<void> LocalObjectStore::Move(const std::string& from, const std::string& to)
{
    auto from_full = GetFullPath(from);
    if (from_full.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    auto to_full = GetFullPath(to);
    if (to_full.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    std::error_code ec;
    fs::rename(from_full, to_full, ec);
    if (ec)
        return std::unexpected(MapFilesystemError(ec, "move"));
    return {};
}

StorageResult<std::vector<ObjectEntry>> LocalObjectStore::List(
    const std::string& path, bool recursive
)
{
    auto full_path = GetFullPath(path);
    if (full_path.empty())
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));

    std::error_code ec;
    if (!fs::exists(full_path, ec)) {
        return std::unexpected(make_error_code(StorageErrc::NotFound));
    }
    if (!fs::is_directory(full_path, ec)) {
        return std::unexpected(make_error_code(StorageErrc::NotADirectory));
    }

    std::vector<ObjectEntry> entries;
    auto add_entry = [&](const fs::directory_entry& entry) -> StorageResult<void> {
        struct stat stbuf{};
        if (::stat(entry.path().c_str(), &stbuf) == -1) {
            spdlog::warn(
                "LocalObjectStore::List: stat failed for '{}': {}", entry.path().string(),
                std::strerror(errno)
            );
            return {};
        }
        auto meta = MetadataFromStat(stbuf);
        entries.push_back({ToRelative(entry.path(), meta.is_directory), std::move(meta)});
        return {};
    };

    try {
        if (recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(
                     full_path, fs::directory_options::skip_permission_denied
                 )) {
                if (auto res = add_entry(entry); !res) {
                    return std::unexpected(res.error());
                }
            }
        } else {
            for (const auto& entry : fs::directory_iterator(
                     full_path, fs::directory_options::skip_permission_denied
                 )) {
                if (auto res = add_entry(entry); !res) {
                    return std::unexpected(res.error());
                }
            }
        }
    } catch (const fs::filesystem_error& fs_err) {
        spdlog::error(
            "LocalObjectStore::List: Exception iterating directory '{}': {}", full_path.string(),
            fs_err.what()
        );
        return std::unexpected(MapFilesystemError(fs_err.code(), "list_iterate"));
    }

    std::ranges::sort(entries, {}, &ObjectEntry::path);
    return entries;
}

}  // namespace Storify::Storage
