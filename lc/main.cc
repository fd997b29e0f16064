#include <iostream>

#include "compiler.hh"
#include "compiler_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace lumata::driver;

    try {
        // Parse command-line options (handles --help, --version, --list-targets automatically)
        CompilerOptions opts = parse_command_line(argc, argv);

        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose) log_level = LogLevel::Verbose;

        Logger logger(log_level, opts.color);

        Compiler compiler(opts, logger);
        return compiler.compile();

    } catch (const std::exception& e) {
        Logger fallback(LogLevel::Normal, ColorMode::Auto);
        fallback.error(e.what());
        return 1;
    }
}
