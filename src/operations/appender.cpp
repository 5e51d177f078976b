#include "operations/appender.hpp"

#include "operations/object_io.hpp"
#include "operations/witness.hpp"
#include "scanner/chunked_scanner.hpp"

#include <spdlog/spdlog.h>
#include <fstream>
#include <system_error>

namespace Storify::Operations
{

using Storage::ObjectMetadata;
using Storage::StorageErrc;
using Storage::StorageResult;

namespace
{

StorageResult<void> CheckPreconditions(
    const std::optional<ObjectMetadata>& meta, const AppendOptions& options
)
{
    if (options.if_size.has_value()) {
        const std::uint64_t actual = meta ? meta->size : 0;
        if (actual != *options.if_size) {
            spdlog::debug(
                "Append precondition failed: expected size={}, actual={}", *options.if_size, actual
            );
            return std::unexpected(make_error_code(StorageErrc::PreconditionFailed));
        }
    }
    if (options.if_etag.has_value()) {
        if (!meta || !meta->change_tag.has_value() || meta->change_tag->empty()) {
            spdlog::debug("Append precondition failed: backend does not provide a change tag");
            return std::unexpected(make_error_code(StorageErrc::PreconditionFailed));
        }
        if (*meta->change_tag != *options.if_etag) {
            spdlog::debug(
                "Append precondition failed: expected etag={}, actual={}", *options.if_etag,
                *meta->change_tag
            );
            return std::unexpected(make_error_code(StorageErrc::PreconditionFailed));
        }
    }
    return {};
}

std::optional<Witness> WitnessOf(const std::optional<ObjectMetadata>& meta)
{
    if (!meta) {
        return std::nullopt;
    }
    return Witness::From(*meta);
}

}  // namespace

Appender::Appender(Storage::IObjectStore& store, std::size_t chunk_size)
    : store_(store), chunk_size_(chunk_size)
{
}

StorageResult<std::optional<ObjectMetadata>> Appender::StatTarget(const std::string& remote)
{
    auto meta = store_.Stat(remote);
    if (!meta) {
        if (Storage::IsErrc(meta.error(), StorageErrc::NotFound)) {
            return std::optional<ObjectMetadata>{};
        }
        return std::unexpected(meta.error());
    }
    if (meta->is_directory) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }
    return std::optional<ObjectMetadata>{std::move(*meta)};
}

StorageResult<std::optional<ObjectMetadata>> Appender::BeginAppend(
    const std::string& remote, std::uint64_t added, const AppendOptions& options
)
{
    auto initial = StatTarget(remote);
    if (!initial) {
        return initial;
    }
    if (!initial->has_value() && options.no_create) {
        return std::unexpected(make_error_code(StorageErrc::NotFound));
    }
    if (auto res = CheckPreconditions(*initial, options); !res) {
        return std::unexpected(res.error());
    }
    const std::uint64_t existing = initial->has_value() ? initial->value().size : 0;
    if (auto res = EnforceSizeLimit(existing + added, options.size_limit_mb, options.force); !res) {
        return std::unexpected(res.error());
    }
    return initial;
}

StorageResult<std::vector<std::byte>> Appender::ReadExisting(
    const std::string& remote, const ObjectMetadata& initial
)
{
    std::vector<std::byte> content;
    if (initial.HasKnownSize()) {
        content.reserve(initial.size);
    }

    Scanner::ChunkedScanner scanner(
        store_, remote, chunk_size_, Scanner::Direction::Forward, initial.size
    );
    while (true) {
        auto window = scanner.Next();
        if (!window) {
            if (Storage::IsErrc(window.error(), StorageErrc::NotFound)) {
                // Vanished between the first stat and the read.
                return std::unexpected(make_error_code(StorageErrc::ConcurrentModification));
            }
            return std::unexpected(window.error());
        }
        if (!window->has_value()) {
            break;
        }
        const auto& bytes = window->value().bytes;
        content.insert(content.end(), bytes.begin(), bytes.end());
    }

    if (initial.HasKnownSize() && content.size() != initial.size) {
        spdlog::debug(
            "Appender: '{}' read {} bytes but stat reported {}", remote, content.size(),
            initial.size
        );
        return std::unexpected(make_error_code(StorageErrc::ConcurrentModification));
    }
    return content;
}

StorageResult<void> Appender::WriteTarget(
    const std::string& remote, std::span<const std::byte> data, bool parents
)
{
    auto res = store_.Write(remote, data);
    if (res || !parents || !Storage::IsErrc(res.error(), StorageErrc::NotFound)) {
        return res;
    }

    spdlog::debug("Appender: parent of '{}' missing, creating it and retrying", remote);
    if (auto parent_res = store_.CreateParent(remote); !parent_res) {
        spdlog::warn(
            "Appender: failed to create parent of '{}': {}", remote, parent_res.error().message()
        );
    }
    return store_.Write(remote, data);
}

StorageResult<void> Appender::FinishAppend(
    const std::string& remote, const std::optional<ObjectMetadata>& initial,
    std::span<const std::byte> added, const AppendOptions& options
)
{
    std::vector<std::byte> merged;
    if (initial.has_value()) {
        auto existing = ReadExisting(remote, *initial);
        if (!existing) {
            return std::unexpected(existing.error());
        }
        merged = std::move(*existing);
    }
    merged.insert(merged.end(), added.begin(), added.end());

    auto now = StatTarget(remote);
    if (!now) {
        return std::unexpected(now.error());
    }
    if (!Unmodified(WitnessOf(initial), WitnessOf(*now))) {
        spdlog::debug("Appender: '{}' changed since the first checkpoint", remote);
        return std::unexpected(make_error_code(StorageErrc::ConcurrentModification));
    }
    if (auto res = CheckPreconditions(*now, options); !res) {
        return res;
    }
    const std::uint64_t existing_now = now->has_value() ? now->value().size : 0;
    if (auto res =
            EnforceSizeLimit(existing_now + added.size(), options.size_limit_mb, options.force);
        !res) {
        return res;
    }

    if (auto res = WriteTarget(remote, merged, options.parents); !res) {
        return res;
    }
    spdlog::info("Appended {} bytes to '{}' (now {} bytes)", added.size(), remote, merged.size());
    return {};
}

StorageResult<void> Appender::AppendBytes(
    const std::string& remote, std::span<const std::byte> data, const AppendOptions& options
)
{
    spdlog::debug("Appender::AppendBytes remote={} bytes={}", remote, data.size());
    auto initial = BeginAppend(remote, data.size(), options);
    if (!initial) {
        return std::unexpected(initial.error());
    }
    return FinishAppend(remote, *initial, data, options);
}

StorageResult<void> Appender::AppendFromLocal(
    const std::filesystem::path& local, const std::string& remote, const AppendOptions& options
)
{
    spdlog::debug("Appender::AppendFromLocal local={} remote={}", local.string(), remote);

    std::error_code ec;
    const auto local_size = std::filesystem::file_size(local, ec);
    if (ec) {
        spdlog::debug("Appender: cannot stat local source '{}': {}", local.string(), ec.message());
        return std::unexpected(make_error_code(Storage::ErrnoToStorageErrc(ec.value())));
    }

    auto initial = BeginAppend(remote, local_size, options);
    if (!initial) {
        return std::unexpected(initial.error());
    }

    std::ifstream source(local, std::ios::binary);
    if (!source.is_open()) {
        return std::unexpected(make_error_code(StorageErrc::PermissionDenied));
    }
    std::vector<std::byte> added(local_size);
    source.read(reinterpret_cast<char*>(added.data()), static_cast<std::streamsize>(added.size()));
    if (static_cast<std::uint64_t>(source.gcount()) != local_size) {
        return std::unexpected(make_error_code(StorageErrc::IOError));
    }
    return FinishAppend(remote, *initial, added, options);
}

StorageResult<void> Appender::AppendFromStream(
    std::istream& in, const std::string& remote, const AppendOptions& options
)
{
    spdlog::debug("Appender::AppendFromStream remote={}", remote);
    auto initial = BeginAppend(remote, 0, options);
    if (!initial) {
        return std::unexpected(initial.error());
    }
    const std::uint64_t existing = initial->has_value() ? initial->value().size : 0;

    std::vector<std::byte> added;
    std::vector<char> buffer(Constants::DEFAULT_BUFFER_SIZE);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0) {
            break;
        }
        auto* first = reinterpret_cast<const std::byte*>(buffer.data());
        added.insert(added.end(), first, first + got);
        if (auto res = EnforceSizeLimit(existing + added.size(), options.size_limit_mb, options.force);
            !res) {
            return res;
        }
    }
    if (in.bad()) {
        return std::unexpected(make_error_code(StorageErrc::IOError));
    }
    return FinishAppend(remote, *initial, added, options);
}

}  // namespace Storify::Operations
