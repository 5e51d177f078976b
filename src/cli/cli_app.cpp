#include "cli/cli_app.hpp"

#include "app_constants.hpp"
#include "config/config_loader.hpp"
#include "operations/appender.hpp"
#include "operations/cater.hpp"
#include "operations/greper.hpp"
#include "operations/header.hpp"
#include "operations/multi_path.hpp"
#include "operations/stater.hpp"
#include "operations/tailer.hpp"
#include "operations/toucher.hpp"
#include "operations/truncater.hpp"

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <utility>

namespace Storify::Cli
{

using Operations::FormatErrorLine;
using Storage::StorageErrc;

namespace
{

void PrintError(
    std::ostream& err, std::string_view command, std::string_view path, const std::error_code& ec,
    std::string_view hint = {}
)
{
    err << FormatErrorLine(command, path, ec, hint) << '\n';
}

std::string_view HeadTailHint(
    std::optional<std::uint64_t> lines, std::optional<std::uint64_t> bytes, bool quiet,
    bool verbose
)
{
    if (lines.has_value() && bytes.has_value()) {
        return "cannot specify both --lines and --bytes";
    }
    if (quiet && verbose) {
        return "cannot specify both --quiet and --verbose";
    }
    return {};
}

}  // namespace

CliApp::CliApp(Storage::StoreFactory factory)
    : factory_(std::move(factory)), app_(std::string(Constants::APP_NAME))
{
    app_.description("File-like operations on object storage");
    app_.require_subcommand(1);
    app_.set_version_flag("--version", std::string(Constants::APP_VERSION_STRING));

    AddGlobalOptions();

    head_cmd_ = app_.add_subcommand("head", "Print the first lines or bytes of objects");
    AddHeadTailCommand(head_cmd_, head_, Constants::DEFAULT_HEAD_LINES);
    tail_cmd_ = app_.add_subcommand("tail", "Print the last lines or bytes of objects");
    AddHeadTailCommand(tail_cmd_, tail_, Constants::DEFAULT_TAIL_LINES);

    AddGrepCommand();
    AddAppendCommand();
    AddTruncateCommand();
    AddCatCommand();
    AddStatCommand();
    AddTouchCommand();
}

//------------------------------------------------------------------------------//
// Argument Definitions
//------------------------------------------------------------------------------//

void CliApp::AddGlobalOptions()
{
    app_.add_option("--config", global_.config_path, "Path to the configuration JSON file")
        ->check(CLI::ExistingFile);
    app_.add_option("--provider", global_.provider, "Override the storage provider")
        ->check(CLI::IsMember({"fs", "memory", "s3", "oss", "cos", "minio", "hdfs", "azblob"}));
    app_.add_option("--root", global_.root, "Override the storage root");
    app_.add_option("--log-level", global_.log_level, "Log level (overrides the config file)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
}

void CliApp::AddHeadTailCommand(CLI::App* cmd, HeadTailArgs& args, std::uint64_t default_lines)
{
    cmd->add_option("paths", args.paths, "Object paths")->required();
    cmd->add_option(
        "-n,--lines", args.lines,
        "Number of lines (default " + std::to_string(default_lines) + ")"
    );
    cmd->add_option("-c,--bytes", args.bytes, "Number of bytes");
    cmd->add_flag("-q,--quiet", args.quiet, "Never print headers");
    cmd->add_flag("-v,--verbose", args.verbose, "Always print headers");
}

void CliApp::AddGrepCommand()
{
    grep_cmd_ = app_.add_subcommand("grep", "Print lines of an object containing a pattern");
    grep_cmd_->add_option("pattern", grep_.pattern, "Substring to search for")->required();
    grep_cmd_->add_option("path", grep_.path, "Object or directory path")->required();
    grep_cmd_->add_flag("-i,--ignore-case", grep_.ignore_case, "Case-insensitive match");
    grep_cmd_->add_flag("-n,--line-number", grep_.line_number, "Prefix lines with line numbers");
    grep_cmd_->add_flag(
        "-R,--recursive", grep_.recursive, "Search every object below a directory"
    );
}

void CliApp::AddAppendCommand()
{
    append_cmd_ = app_.add_subcommand("append", "Append local data to an object");
    append_cmd_->add_option("path", append_.path, "Destination object")->required();
    auto* src = append_cmd_->add_option("--src", append_.src, "Local file to append")
                    ->check(CLI::ExistingFile);
    auto* from_stdin =
        append_cmd_->add_flag("--stdin", append_.from_stdin, "Append standard input");
    src->excludes(from_stdin);
    append_cmd_->add_flag("--no-create", append_.no_create, "Fail if the object does not exist");
    append_cmd_->add_flag("--parents", append_.parents, "Create missing parent directories");
    append_cmd_->add_option("--if-size", append_.if_size, "Only append if the size matches");
    append_cmd_->add_option("--if-etag", append_.if_etag, "Only append if the ETag matches");
    append_cmd_->add_option(
        "--size-limit", append_.size_limit_mb, "Refuse results larger than this many MB"
    );
    append_cmd_->add_flag("--force", append_.force, "Ignore the size limit");
}

void CliApp::AddTruncateCommand()
{
    truncate_cmd_ = app_.add_subcommand("truncate", "Shrink or extend an object");
    truncate_cmd_->add_option("path", truncate_.path, "Object path")->required();
    truncate_cmd_->add_option("-s,--size", truncate_.size, "Target size in bytes (default 0)");
    truncate_cmd_->add_flag("--no-create", truncate_.no_create, "Do not create missing objects");
    truncate_cmd_->add_flag("-p,--parents", truncate_.parents, "Create missing parent directories");
}

void CliApp::AddCatCommand()
{
    cat_cmd_ = app_.add_subcommand("cat", "Print a whole object");
    cat_cmd_->add_option("path", cat_.path, "Object path")->required();
    cat_cmd_->add_flag("--force", cat_.force, "Ignore the size limit");
}

void CliApp::AddStatCommand()
{
    stat_cmd_ = app_.add_subcommand("stat", "Show object metadata");
    stat_cmd_->add_option("path", stat_.path, "Object path")->required();
    stat_cmd_->add_flag("--json", stat_.json, "Print a JSON object");
}

void CliApp::AddTouchCommand()
{
    touch_cmd_ = app_.add_subcommand("touch", "Create an empty object or empty an existing one");
    touch_cmd_->add_option("path", touch_.path, "Object path")->required();
    touch_cmd_->add_flag("-c,--no-create", touch_.no_create, "Do not create missing objects");
    touch_cmd_->add_flag("-t,--truncate", touch_.truncate, "Empty existing objects");
    touch_cmd_->add_flag("-p,--parents", touch_.parents, "Create missing parent directories");
}

//------------------------------------------------------------------------------//
// Execution
//------------------------------------------------------------------------------//

int CliApp::Run(int argc, const char* const* argv, Streams streams)
{
    try {
        app_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_.exit(e, streams.out, streams.err);
    }

    auto config = ResolveConfig(streams.err);
    if (!config) {
        return EXIT_FAILURE;
    }

    auto store = OpenStore(*config);
    if (!store) {
        std::string root = config->storage.root.string();
        PrintError(streams.err, "open", root, store.error());
        return EXIT_FAILURE;
    }
    return Dispatch(*config, **store, streams);
}

std::optional<Config::AppConfig> CliApp::ResolveConfig(std::ostream& err)
{
    std::optional<std::filesystem::path> config_path;
    if (global_.config_path) {
        config_path = *global_.config_path;
    }

    auto resolved = Config::resolveConfig(config_path);
    if (!resolved) {
        err << Constants::APP_NAME << ": config: " << resolved.error() << '\n';
        return std::nullopt;
    }
    Config::AppConfig config = std::move(resolved.value());

    if (global_.provider) {
        auto provider = Config::StringToProviderType(*global_.provider);
        if (!provider) {
            err << Constants::APP_NAME << ": config: unsupported provider '" << *global_.provider
                << "'\n";
            return std::nullopt;
        }
        config.storage.provider = *provider;
    }
    if (global_.root) {
        config.storage.root = *global_.root;
    }
    if (!config.IsValid()) {
        err << Constants::APP_NAME << ": config: invalid storage configuration for provider '"
            << Config::ProviderTypeToString(config.storage.provider) << "'\n";
        return std::nullopt;
    }

    spdlog::set_level(config.global_settings.log_level);
    if (global_.log_level) {
        if (auto level = Config::StringToLogLevel(*global_.log_level)) {
            spdlog::set_level(*level);
        }
    }
    spdlog::debug(
        "Using provider '{}' rooted at '{}'", Config::ProviderTypeToString(config.storage.provider),
        config.storage.root.string()
    );
    return config;
}

Storage::StorageResult<std::unique_ptr<Storage::IObjectStore>> CliApp::OpenStore(
    const Config::AppConfig& config
)
{
    return factory_.Create(config.storage);
}

int CliApp::Dispatch(
    const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams
)
{
    if (head_cmd_->parsed()) {
        return RunHead(config, store, streams);
    }
    if (tail_cmd_->parsed()) {
        return RunTail(config, store, streams);
    }
    if (grep_cmd_->parsed()) {
        return RunGrep(config, store, streams);
    }
    if (append_cmd_->parsed()) {
        return RunAppend(config, store, streams);
    }
    if (truncate_cmd_->parsed()) {
        return RunTruncate(config, store, streams);
    }
    if (cat_cmd_->parsed()) {
        return RunCat(config, store, streams);
    }
    if (stat_cmd_->parsed()) {
        return RunStat(store, streams);
    }
    if (touch_cmd_->parsed()) {
        return RunTouch(store, streams);
    }
    spdlog::error("No subcommand was selected.");
    return EXIT_FAILURE;
}

int CliApp::RunHead(const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams)
{
    Operations::Header header(store, config.global_settings.chunk_size);
    auto report = header.HeadMany(
        head_.paths, head_.lines, head_.bytes, {head_.quiet, head_.verbose}, streams.out,
        streams.err
    );
    if (!report) {
        PrintError(
            streams.err, "head", {}, report.error(),
            HeadTailHint(head_.lines, head_.bytes, head_.quiet, head_.verbose)
        );
        return EXIT_FAILURE;
    }
    return report->AllFailed() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int CliApp::RunTail(const Config::AppConfig&, Storage::IObjectStore& store, Streams streams)
{
    Operations::Tailer tailer(store);
    auto report = tailer.TailMany(
        tail_.paths, tail_.lines, tail_.bytes, {tail_.quiet, tail_.verbose}, streams.out,
        streams.err
    );
    if (!report) {
        PrintError(
            streams.err, "tail", {}, report.error(),
            HeadTailHint(tail_.lines, tail_.bytes, tail_.quiet, tail_.verbose)
        );
        return EXIT_FAILURE;
    }
    return report->AllFailed() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int CliApp::RunGrep(const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams)
{
    Operations::Greper greper(store, config.global_settings.chunk_size);
    Operations::GrepOptions options;
    options.ignore_case = grep_.ignore_case;
    options.line_number = grep_.line_number;
    options.recursive   = grep_.recursive;

    auto matches = greper.GrepPath(grep_.path, grep_.pattern, options, streams.out);
    if (!matches) {
        std::string_view hint;
        if (Storage::IsErrc(matches.error(), StorageErrc::IsADirectory) && !grep_.recursive) {
            hint = "use -R to grep recursively";
        }
        PrintError(streams.err, "grep", grep_.path, matches.error(), hint);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int CliApp::RunAppend(
    const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams
)
{
    if (!append_.src && !append_.from_stdin) {
        PrintError(
            streams.err, "append", append_.path, make_error_code(StorageErrc::InvalidArgument),
            "one of --src or --stdin is required"
        );
        return EXIT_FAILURE;
    }

    Operations::AppendOptions options;
    options.no_create     = append_.no_create;
    options.parents       = append_.parents;
    options.size_limit_mb = append_.size_limit_mb.value_or(config.global_settings.size_limit_mb);
    options.force         = append_.force;
    options.if_size       = append_.if_size;
    options.if_etag       = append_.if_etag;

    Operations::Appender appender(store, config.global_settings.chunk_size);
    auto res = append_.src ? appender.AppendFromLocal(*append_.src, append_.path, options)
                           : appender.AppendFromStream(streams.in, append_.path, options);
    if (!res) {
        PrintError(streams.err, "append", append_.path, res.error());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int CliApp::RunTruncate(
    const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams
)
{
    Operations::Truncater truncater(store, config.global_settings.chunk_size);
    auto outcome = truncater.Truncate(
        truncate_.path, truncate_.size, {truncate_.no_create, truncate_.parents}
    );
    if (!outcome) {
        PrintError(streams.err, "truncate", truncate_.path, outcome.error());
        return EXIT_FAILURE;
    }

    switch (*outcome) {
        case Operations::TruncateOutcome::Resized:
            streams.out << Operations::TruncateOutcomeToString(*outcome) << ": " << truncate_.path
                        << " -> " << truncate_.size << '\n';
            break;
        case Operations::TruncateOutcome::Created:
            streams.out << Operations::TruncateOutcomeToString(*outcome) << ": " << truncate_.path
                        << " (size " << truncate_.size << ")\n";
            break;
        default:
            break;
    }
    return EXIT_SUCCESS;
}

int CliApp::RunCat(const Config::AppConfig& config, Storage::IObjectStore& store, Streams streams)
{
    Operations::Cater cater(store, config.global_settings.chunk_size);
    auto written =
        cater.Cat(cat_.path, {config.global_settings.size_limit_mb, cat_.force}, streams.out);
    if (!written) {
        PrintError(streams.err, "cat", cat_.path, written.error());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int CliApp::RunStat(Storage::IObjectStore& store, Streams streams)
{
    Operations::Stater stater(store);
    auto report = stater.Stat(stat_.path);
    if (!report) {
        PrintError(streams.err, "stat", stat_.path, report.error());
        return EXIT_FAILURE;
    }
    if (stat_.json) {
        Operations::Stater::PrintJson(*report, streams.out);
    } else {
        Operations::Stater::PrintHuman(*report, streams.out);
    }
    return EXIT_SUCCESS;
}

int CliApp::RunTouch(Storage::IObjectStore& store, Streams streams)
{
    Operations::Toucher toucher(store);
    auto outcome =
        toucher.Touch(touch_.path, {touch_.no_create, touch_.truncate, touch_.parents});
    if (!outcome) {
        PrintError(streams.err, "touch", touch_.path, outcome.error());
        return EXIT_FAILURE;
    }
    switch (*outcome) {
        case Operations::TouchOutcome::Created:
            streams.out << "Created: " << touch_.path << '\n';
            break;
        case Operations::TouchOutcome::Truncated:
            streams.out << "Truncated: " << touch_.path << '\n';
            break;
        default:
            break;
    }
    return EXIT_SUCCESS;
}

}  // namespace Storify::Cli
