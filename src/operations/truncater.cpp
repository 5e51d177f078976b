#include "operations/truncater.hpp"

#include "scanner/chunked_scanner.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace Storify::Operations
{

using Storage::StorageErrc;
using Storage::StorageResult;

const char* TruncateOutcomeToString(TruncateOutcome outcome)
{
    switch (outcome) {
        case TruncateOutcome::Unchanged:
            return "Unchanged";
        case TruncateOutcome::Resized:
            return "Truncated";
        case TruncateOutcome::Created:
            return "Created";
        case TruncateOutcome::Skipped:
            return "Skipped";
        default:
            return "Unknown";
    }
}

Truncater::Truncater(Storage::IObjectStore& store, std::size_t block_size)
    : store_(store), block_size_(block_size), zero_block_(block_size, std::byte{0})
{
}

std::string Truncater::TempPathFor(const std::string& path)
{
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << path << Constants::TRUNCATE_TEMP_INFIX << std::hex << std::setw(16)
        << std::setfill('0') << rng();
    return oss.str();
}

StorageResult<TruncateOutcome> Truncater::Truncate(
    const std::string& path, std::uint64_t size, const TruncateOptions& options
)
{
    spdlog::debug(
        "Truncater::Truncate path={} size={} no_create={} parents={}", path, size,
        options.no_create, options.parents
    );
    if (path.empty() || path.back() == '/') {
        return std::unexpected(make_error_code(StorageErrc::InvalidArgument));
    }

    auto meta = store_.Stat(path);
    if (!meta) {
        if (Storage::IsErrc(meta.error(), StorageErrc::NotFound)) {
            return CreateSized(path, size, options);
        }
        return std::unexpected(meta.error());
    }
    if (meta->is_directory) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }

    // A zero size may only mean the backend does not report one.
    const bool size_known = meta->HasKnownSize();
    if (size_known && meta->size == size) {
        return TruncateOutcome::Unchanged;
    }

    if (size == 0) {
        auto writer = store_.OpenWriter(path);
        if (!writer) {
            return std::unexpected(writer.error());
        }
        if (auto res = (*writer)->Close(); !res) {
            return std::unexpected(res.error());
        }
        spdlog::info("Truncated '{}' -> 0", path);
        return TruncateOutcome::Resized;
    }

    auto copy_len = size_known ? std::min(size, meta->size) : size;
    if (auto res = Resize(path, copy_len, size, size_known); !res) {
        return std::unexpected(res.error());
    }
    spdlog::info(
        "Truncated '{}' {} -> {}", path, size_known ? std::to_string(meta->size) : "?", size
    );
    return TruncateOutcome::Resized;
}

StorageResult<TruncateOutcome> Truncater::CreateSized(
    const std::string& path, std::uint64_t size, const TruncateOptions& options
)
{
    if (options.no_create) {
        spdlog::debug("Truncater: '{}' missing and no_create set, nothing to do", path);
        return TruncateOutcome::Skipped;
    }
    if (options.parents) {
        if (auto res = store_.CreateParent(path); !res) {
            spdlog::warn(
                "Truncater: failed to create parent of '{}': {}", path, res.error().message()
            );
        }
    }

    auto writer = store_.OpenWriter(path);
    if (!writer) {
        return std::unexpected(writer.error());
    }
    if (auto res = WriteZeros(**writer, size); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = (*writer)->Close(); !res) {
        return std::unexpected(res.error());
    }
    spdlog::info("Created '{}' (size {})", path, size);
    return TruncateOutcome::Created;
}

StorageResult<void> Truncater::Resize(
    const std::string& path, std::uint64_t copy_len, std::uint64_t size, bool size_known
)
{
    const std::string temp_path = TempPathFor(path);
    spdlog::trace("Truncater: staging '{}' in '{}'", path, temp_path);

    auto discard_temp = [&](const std::error_code& ec) -> StorageResult<void> {
        if (auto del = store_.Delete(temp_path); !del) {
            spdlog::warn(
                "Truncater: failed to remove temporary object '{}': {}", temp_path,
                del.error().message()
            );
        }
        return std::unexpected(ec);
    };

    auto writer = store_.OpenWriter(temp_path);
    if (!writer) {
        return std::unexpected(writer.error());
    }

    auto copied = CopyPrefix(path, copy_len, size_known, **writer);
    if (!copied) {
        writer->reset();
        return discard_temp(copied.error());
    }
    if (*copied < size) {
        if (auto res = WriteZeros(**writer, size - *copied); !res) {
            writer->reset();
            return discard_temp(res.error());
        }
    }
    if (auto res = (*writer)->Close(); !res) {
        writer->reset();
        return discard_temp(res.error());
    }
    writer->reset();

    if (auto res = store_.Move(temp_path, path); !res) {
        return discard_temp(res.error());
    }
    return {};
}

StorageResult<std::uint64_t> Truncater::CopyPrefix(
    const std::string& path, std::uint64_t length, bool size_known, Storage::IObjectWriter& writer
)
{
    if (length == 0) {
        return 0;
    }

    // The scanner clamps every window to `length` and stops early at a short read.
    Scanner::ChunkedScanner scanner(store_, path, block_size_, Scanner::Direction::Forward, length);
    std::uint64_t copied = 0;
    while (true) {
        auto window = scanner.Next();
        if (!window) {
            return std::unexpected(window.error());
        }
        if (!window->has_value()) {
            break;
        }
        const auto& bytes = window->value().bytes;
        if (auto res = writer.Write(bytes); !res) {
            return std::unexpected(res.error());
        }
        copied += bytes.size();
    }
    if (size_known && copied < length) {
        spdlog::warn(
            "Truncater: '{}' shrank while copying ({} of {} bytes), padding with zeros", path,
            copied, length
        );
    }
    return copied;
}

StorageResult<void> Truncater::WriteZeros(Storage::IObjectWriter& writer, std::uint64_t count)
{
    while (count > 0) {
        const auto block = static_cast<std::size_t>(std::min<std::uint64_t>(count, block_size_));
        if (auto res = writer.Write(std::span<const std::byte>(zero_block_.data(), block)); !res) {
            return res;
        }
        count -= block;
    }
    return {};
}

}  // namespace Storify::Operations
