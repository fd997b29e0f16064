#include "compiler_options.hh"
#include <lumata/dialect_registry.hh>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace lumata::driver {

using namespace lumata::codegen;

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

// Value of "-x<value>" or "-x <value>"
static std::string take_short_value(int argc, char** argv, int& i, const char* prefix) {
    std::string value = get_option_value(argv[i], prefix);
    if (value.empty() && i + 1 < argc) {
        value = argv[++i];
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + prefix + " requires argument");
    }
    return value;
}

static std::string require_value(const char* arg, const char* prefix) {
    std::string value = get_option_value(arg, prefix);
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + prefix + "<value> requires a value");
    }
    return value;
}

static bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && name[0] != '_' && name[0] != '$') return false;
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '$') return false;
    }
    return true;
}

static int parse_indent(const std::string& value) {
    int result = 0;
    try {
        size_t consumed = 0;
        result = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid integer value for --indent: " + value);
    }
    if (result < 0 || result > 16) {
        throw std::runtime_error("--indent must be between 0 and 16, got " + value);
    }
    return result;
}

// ============================================================================
// Main Parser
// ============================================================================

CompilerOptions parse_command_line(int argc, char** argv) {
    CompilerOptions opts;
    bool have_input = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        // Version
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        // List targets
        if (std::strcmp(arg, "--list-targets") == 0) {
            print_targets();
            std::exit(0);
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (starts_with(arg, "--color=")) {
            opts.color = parse_color_mode(require_value(arg, "--color="));
            continue;
        }

        // Input kind
        if (std::strcmp(arg, "--expression") == 0) {
            opts.input_kind = InputKind::Expression;
            continue;
        }

        // Target dialect
        if (std::strcmp(arg, "--target") == 0) {
            if (i + 1 >= argc) {
                throw std::runtime_error("Option --target requires argument");
            }
            opts.target = argv[++i];
            continue;
        }

        if (starts_with(arg, "--target=")) {
            opts.target = require_value(arg, "--target=");
            continue;
        }

        // Rendering options
        if (starts_with(arg, "--indent=")) {
            opts.indent_size = parse_indent(require_value(arg, "--indent="));
            continue;
        }

        if (starts_with(arg, "--scrutinee-name=")) {
            opts.scrutinee_name = require_value(arg, "--scrutinee-name=");
            if (!is_identifier(opts.scrutinee_name)) {
                throw std::runtime_error("Invalid identifier for --scrutinee-name: " + opts.scrutinee_name);
            }
            continue;
        }

        if (starts_with(arg, "--catch-name=")) {
            opts.catch_name = require_value(arg, "--catch-name=");
            if (!is_identifier(opts.catch_name)) {
                throw std::runtime_error("Invalid identifier for --catch-name: " + opts.catch_name);
            }
            continue;
        }

        // Output file
        if (starts_with(arg, "-o")) {
            opts.output_file = take_short_value(argc, argv, i, "-o");
            continue;
        }

        if (starts_with(arg, "-t")) {
            opts.target = take_short_value(argc, argv, i, "-t");
            continue;
        }

        // Unknown option starting with dash ("-" alone means stdin)
        if (arg[0] == '-' && arg[1] != '\0') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        if (have_input) {
            throw std::runtime_error(std::string("Only one input file may be given, got extra: ") + arg);
        }
        opts.input_file = arg;
        have_input = true;
    }

    // Validation
    if (!have_input) {
        throw std::runtime_error("No input file specified");
    }

    if (opts.quiet && opts.verbose) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    if (opts.scrutinee_name == opts.catch_name) {
        throw std::runtime_error("--scrutinee-name and --catch-name must differ");
    }

    // Validate target dialect exists
    auto& registry = DialectRegistry::instance();
    if (!registry.has_dialect(opts.target)) {
        std::string error_msg = "Unknown target dialect: " + opts.target;

        auto available = registry.get_available_dialects();
        if (!available.empty()) {
            error_msg += "\n\nAvailable targets:";
            for (const auto& name : available) {
                error_msg += "\n  - " + name;
            }
        }

        error_msg += "\n\nUse --list-targets for more details.";
        throw std::runtime_error(error_msg);
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <input-file>\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "  --version                 Show version information\n";
    std::cout << "  --list-targets            List available target dialects\n";
    std::cout << "\n";

    std::cout << "Input:\n";
    std::cout << "  <input-file>              YAML/JSON tree document (\"-\" for stdin)\n";
    std::cout << "  --expression              Input holds one expression, not a module\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  -o <file>                 Output file (default: stdout)\n";
    std::cout << "  -t, --target <dialect>    Target dialect (default: assemblyscript)\n";
    std::cout << "  --indent=<n>              Spaces per indentation level (default: 4)\n";
    std::cout << "  --scrutinee-name=<id>     Case temporary name (default: valueToMatch)\n";
    std::cout << "  --catch-name=<id>         Caught value name (default: e)\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose             Verbose output\n";
    std::cout << "  -q, --quiet               Quiet mode (errors only)\n";
    std::cout << "  --color=<mode>            auto, always or never (default: auto)\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " demo.yaml\n";
    std::cout << "  " << program_name << " -t typescript -o demo.ts demo.yaml\n";
    std::cout << "  " << program_name << " --expression --indent=2 expr.json\n";
}

void print_version() {
    std::cout << "Lumata Compiler v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

void print_targets() {
    auto& registry = DialectRegistry::instance();

    std::cout << "Available target dialects:\n\n";

    for (const auto& name : registry.get_available_dialects()) {
        const dialect* target = registry.get_dialect(name);
        if (!target) continue;

        std::cout << "  " << name << "\n";
        std::cout << "    " << target->description << "\n";
        std::cout << "    Extension: " << target->file_extension << "\n";
        std::cout << "\n";
    }
}

}  // namespace lumata::driver
