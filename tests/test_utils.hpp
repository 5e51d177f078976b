#ifndef STORIFY_TESTS_TEST_UTILS_HPP_
#define STORIFY_TESTS_TEST_UTILS_HPP_

#include "storage/i_object_store.hpp"

#include <spdlog/spdlog.h>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Storify::Testing
{

inline std::span<const std::byte> Bytes(std::string_view text)
{
    return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

inline std::string ToString(const std::vector<std::byte>& bytes)
{
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

// "line-1\nline-2\n...line-N\n"
inline std::string NumberedLines(int first, int last)
{
    std::string text;
    for (int i = first; i <= last; ++i) {
        text += "line-" + std::to_string(i) + "\n";
    }
    return text;
}

inline void QuietLogs() { spdlog::set_level(spdlog::level::off); }

// Scratch directory removed again when the test ends.
class TempDir
{
    public:
    TempDir()
    {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("storify-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

    std::filesystem::path WriteFile(const std::string& relative, std::string_view content) const
    {
        auto full = path_ / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return full;
    }

    std::string ReadFile(const std::string& relative) const
    {
        std::ifstream in(path_ / relative, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    private:
    std::filesystem::path path_;
};

// Forwards to another store and runs a callback right after the N-th Stat
// (1-based) returns from the inner store. Used to mutate an object between
// an operation's checkpoints.
class InterferingObjectStore : public Storage::IObjectStore
{
    public:
    explicit InterferingObjectStore(Storage::IObjectStore& inner) : inner_(inner) {}

    void AfterStat(std::size_t nth, std::function<void()> hook)
    {
        hook_stat_ = nth;
        hook_      = std::move(hook);
    }

    // Makes every CreateParent call fail with `ec` without touching the inner store.
    void FailCreateParent(std::error_code ec) { create_parent_error_ = ec; }

    std::size_t StatCalls() const { return stat_calls_; }
    std::size_t WriteCalls() const { return write_calls_; }

    Config::ProviderType GetProvider() const override { return inner_.GetProvider(); }

    Storage::StorageResult<Storage::ObjectMetadata> Stat(const std::string& path) override
    {
        auto res = inner_.Stat(path);
        if (++stat_calls_ == hook_stat_ && hook_) {
            hook_();
        }
        return res;
    }
    Storage::StorageResult<std::vector<std::byte>> ReadRange(
        const std::string& path, std::uint64_t start, std::uint64_t end
    ) override
    {
        return inner_.ReadRange(path, start, end);
    }
    Storage::StorageResult<void> Write(const std::string& path, std::span<const std::byte> data)
        override
    {
        ++write_calls_;
        return inner_.Write(path, data);
    }
    Storage::StorageResult<std::unique_ptr<Storage::IObjectWriter>> OpenWriter(
        const std::string& path
    ) override
    {
        return inner_.OpenWriter(path);
    }
    Storage::StorageResult<void> Delete(const std::string& path) override
    {
        return inner_.Delete(path);
    }
    Storage::StorageResult<void> CreateParent(const std::string& path) override
    {
        if (create_parent_error_) {
            return std::unexpected(create_parent_error_);
        }
        return inner_.CreateParent(path);
    }
    Storage::StorageResult<void> Move(const std::string& from, const std::string& to) override
    {
        return inner_.Move(from, to);
    }
    Storage::StorageResult<std::vector<Storage::ObjectEntry>> List(
        const std::string& path, bool recursive
    ) override
    {
        return inner_.List(path, recursive);
    }

    private:
    Storage::IObjectStore& inner_;
    std::size_t hook_stat_   = 0;
    std::size_t stat_calls_  = 0;
    std::size_t write_calls_ = 0;
    std::function<void()> hook_;
    std::error_code create_parent_error_;
};

}  // namespace Storify::Testing

#endif  // STORIFY_TESTS_TEST_UTILS_HPP_
