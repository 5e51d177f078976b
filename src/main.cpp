#include "app_constants.hpp"
#include "cli/cli_app.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char *argv[])
{
    // Object data goes to stdout, so diagnostics use stderr.
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern(std::string(Storify::Constants::DEFAULT_CONSOLE_LOG_PATTERN));
        auto main_logger =
            std::make_shared<spdlog::logger>(std::string(Storify::Constants::APP_NAME), console_sink);
        spdlog::set_default_logger(main_logger);
        spdlog::set_level(Storify::Constants::DEFAULT_LOG_LEVEL);
        spdlog::flush_on(Storify::Constants::DEFAULT_FLUSH_LEVEL);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    Storify::Cli::CliApp app;
    int exit_code = app.Run(argc, argv, {std::cin, std::cout, std::cerr});
    std::cout.flush();
    spdlog::shutdown();
    return exit_code;
}
