#pragma once

#include "logger.hh"
#include <filesystem>
#include <string>

namespace lumata::driver {

/// What the input document holds
enum class InputKind {
    Module,      // module: / functions: (default)
    Expression   // a single expression node (--expression)
};

/// Compiler options (driver configuration only)
struct CompilerOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::filesystem::path input_file;
    std::filesystem::path output_file;               // Empty: write to stdout
    InputKind input_kind = InputKind::Module;

    // ========================================================================
    // Target Selection
    // ========================================================================

    std::string target = "assemblyscript";           // Dialect name from registry

    // ========================================================================
    // Rendering Options
    // ========================================================================

    int indent_size = 4;                             // --indent=<n>
    std::string scrutinee_name = "valueToMatch";     // --scrutinee-name=<id>
    std::string catch_name = "e";                    // --catch-name=<id>

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool quiet = false;                              // -q, --quiet
    ColorMode color = ColorMode::Auto;               // --color=auto|always|never
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
CompilerOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

/// Print available target dialects
void print_targets();

}  // namespace lumata::driver
