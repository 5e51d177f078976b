#include "operations/multi_path.hpp"

#include "app_constants.hpp"

#include <spdlog/spdlog.h>

namespace Storify::Operations
{

std::string FormatErrorLine(
    std::string_view command, std::string_view path, const std::error_code& ec,
    std::string_view hint
)
{
    std::string line;
    line.append(Constants::APP_NAME).append(": ").append(command);
    if (!path.empty()) {
        line.append(" '").append(path).append("'");
    }
    line.append(": ").append(ec.message());
    if (!hint.empty()) {
        line.append("; ").append(hint);
    }
    return line;
}

Storage::StorageResult<MultiPathReport> RunForEachPath(
    std::string_view command, const std::vector<std::string>& paths,
    const HeaderOptions& options, std::ostream& out, std::ostream& err,
    const std::function<Storage::StorageResult<void>(const std::string&)>& per_path
)
{
    if (options.quiet && options.verbose) {
        return std::unexpected(make_error_code(Storage::StorageErrc::InvalidArgument));
    }
    const bool show_headers = options.verbose || (!options.quiet && paths.size() > 1);

    MultiPathReport report;
    for (std::size_t idx = 0; idx < paths.size(); ++idx) {
        const auto& path = paths[idx];
        if (show_headers) {
            if (idx > 0) {
                out << '\n';
            }
            out << "==> " << path << " <==\n";
        }

        auto res = per_path(path);
        if (res) {
            ++report.succeeded;
            continue;
        }
        ++report.failed;
        report.last_error = res.error();
        out.flush();
        err << FormatErrorLine(command, path, res.error()) << '\n';
        spdlog::debug("{}: '{}' failed, continuing with remaining paths", command, path);
    }
    out.flush();
    return report;
}

}  // namespace Storify::Operations
