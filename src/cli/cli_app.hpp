#ifndef STORIFY_SRC_CLI_CLI_APP_HPP_
#define STORIFY_SRC_CLI_CLI_APP_HPP_

#include "config/config_types.hpp"
#include "storage/i_object_store.hpp"
#include "storage/store_factory.hpp"

#include <CLI/CLI.hpp>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Storify::Cli
{

struct Streams {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

// Command-line front end: parses arguments, resolves configuration, opens
// the object store and dispatches to exactly one operation.
class CliApp
{
    private:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//
    struct GlobalArgs {
        std::optional<std::string> config_path;
        std::optional<std::string> provider;
        std::optional<std::string> root;
        std::optional<std::string> log_level;
    };

    struct HeadTailArgs {
        std::vector<std::string> paths;
        std::optional<std::uint64_t> lines;
        std::optional<std::uint64_t> bytes;
        bool quiet   = false;
        bool verbose = false;
    };

    struct GrepArgs {
        std::string pattern;
        std::string path;
        bool ignore_case = false;
        bool line_number = false;
        bool recursive   = false;
    };

    struct AppendArgs {
        std::string path;
        std::optional<std::string> src;
        bool from_stdin = false;
        bool no_create  = false;
        bool parents    = false;
        std::optional<std::uint64_t> if_size;
        std::optional<std::string> if_etag;
        std::optional<std::uint64_t> size_limit_mb;
        bool force = false;
    };

    struct TruncateArgs {
        std::string path;
        std::uint64_t size = 0;
        bool no_create     = false;
        bool parents       = false;
    };

    struct CatArgs {
        std::string path;
        bool force = false;
    };

    struct StatArgs {
        std::string path;
        bool json = false;
    };

    struct TouchArgs {
        std::string path;
        bool no_create = false;
        bool truncate  = false;
        bool parents   = false;
    };

    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit CliApp(Storage::StoreFactory factory = Storage::StoreFactory());
    ~CliApp() = default;

    CliApp(const CliApp&)            = delete;
    CliApp& operator=(const CliApp&) = delete;
    CliApp(CliApp&&)                 = delete;
    CliApp& operator=(CliApp&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // Returns the process exit code.
    int Run(int argc, const char* const* argv, Streams streams);

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    void AddGlobalOptions();
    void AddHeadTailCommand(CLI::App* cmd, HeadTailArgs& args, std::uint64_t default_lines);
    void AddGrepCommand();
    void AddAppendCommand();
    void AddTruncateCommand();
    void AddCatCommand();
    void AddStatCommand();
    void AddTouchCommand();

    // Resolves configuration, applies overrides and the log level.
    std::optional<Config::AppConfig> ResolveConfig(std::ostream& err);
    Storage::StorageResult<std::unique_ptr<Storage::IObjectStore>> OpenStore(
        const Config::AppConfig& config
    );

    int Dispatch(const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams);
    int RunHead(const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams);
    int RunTail(const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams);
    int RunGrep(const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams);
    int RunAppend(const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams);
    int RunTruncate(const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams);
    int RunCat(const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams);
    int RunStat(Storage::IObjectStore& store, Streams streams);
    int RunTouch(Storage::IObjectStore& store, Streams streams);

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    Storage::StoreFactory factory_;
    CLI::App app_;

    CLI::App* head_cmd_     = nullptr;
    CLI::App* tail_cmd_     = nullptr;
    CLI::App* grep_cmd_     = nullptr;
    CLI::App* append_cmd_   = nullptr;
    CLI::App* truncate_cmd_ = nullptr;
    CLI::App* cat_cmd_      = nullptr;
    CLI::App* stat_cmd_     = nullptr;
    CLI::App* touch_cmd_    = nullptr;

    GlobalArgs global_;
    HeadTailArgs head_;
    HeadTailArgs tail_;
    GrepArgs grep_;
    AppendArgs append_;
    TruncateArgs truncate_;
    CatArgs cat_;
    StatArgs stat_;
    TouchArgs touch_;
};

}  // namespace Storify::Cli

#endif  // STORIFY_SRC_CLI_CLI_APP_HPP_
