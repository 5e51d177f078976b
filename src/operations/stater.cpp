#include "operations/stater.hpp"

#include <spdlog/spdlog.h>
#include <ctime>

namespace Storify::Operations
{

namespace
{

std::string FormatUtc(std::time_t t)
{
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return std::string(buf, n);
}

}  // namespace

void to_json(nlohmann::json& j, const ObjectReport& report)
{
    j = nlohmann::json{
        {"path", report.path},
        {"type", report.entry_type},
        {"size", report.size},
    };
    auto optional_field = [](const std::optional<std::string>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    };
    j["last_modified"] = optional_field(report.last_modified);
    j["etag"]          = optional_field(report.etag);
    j["content_type"]  = optional_field(report.content_type);
}

Storage::StorageResult<ObjectReport> Stater::Stat(const std::string& path)
{
    spdlog::debug("Stater::Stat path={}", path);
    auto meta = store_.Stat(path);
    if (!meta) {
        return std::unexpected(meta.error());
    }

    ObjectReport report;
    report.path       = path;
    report.entry_type = meta->is_directory ? "dir" : "file";
    report.size       = meta->size;
    if (meta->last_modified) {
        report.last_modified = FormatUtc(*meta->last_modified);
    }
    report.etag         = meta->change_tag;
    report.content_type = meta->content_type;
    return report;
}

void Stater::PrintHuman(const ObjectReport& report, std::ostream& out)
{
    auto or_dash = [](const std::optional<std::string>& v) { return v ? *v : std::string("-"); };
    out << "path=" << report.path << '\n'
        << "type=" << report.entry_type << '\n'
        << "size=" << report.size << '\n'
        << "last_modified=" << or_dash(report.last_modified) << '\n'
        << "etag=" << or_dash(report.etag) << '\n'
        << "content_type=" << or_dash(report.content_type) << '\n';
}

void Stater::PrintJson(const ObjectReport& report, std::ostream& out)
{
    out << nlohmann::json(report).dump() << '\n';
}

}  // namespace Storify::Operations
