#ifndef STORIFY_SRC_OPERATIONS_MULTI_PATH_HPP_
#define STORIFY_SRC_OPERATIONS_MULTI_PATH_HPP_

#include "storage/storage_error.hpp"

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace Storify::Operations
{

struct HeaderOptions {
    bool quiet   = false;  ///< never print "==> path <==" headers
    bool verbose = false;  ///< always print them, even for a single path
};

struct MultiPathReport {
    std::size_t succeeded = 0;
    std::size_t failed    = 0;
    std::error_code last_error;

    // The invocation fails only when no path succeeded.
    bool AllFailed() const { return failed > 0 && succeeded == 0; }
};

// One line per failure: "storify: <command> '<path>': <message>[; <hint>]".
std::string FormatErrorLine(
    std::string_view command, std::string_view path, const std::error_code& ec,
    std::string_view hint = {}
);

// Runs `per_path` for each path in order, writing GNU-style headers to `out`
// and per-path failures to `err`. Processing continues after a failure.
// Returns InvalidArgument when quiet and verbose are both set.
Storage::StorageResult<MultiPathReport> RunForEachPath(
    std::string_view command, const std::vector<std::string>& paths,
    const HeaderOptions& options, std::ostream& out, std::ostream& err,
    const std::function<Storage::StorageResult<void>(const std::string&)>& per_path
);

}  // namespace Storify::Operations

#endif  // STORIFY_SRC_OPERATIONS_MULTI_PATH_HPP_
