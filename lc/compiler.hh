#pragma once

#include "compiler_options.hh"
#include "logger.hh"
#include <lumata/ast.hh>
#include <lumata/codegen.hh>
#include <string>

namespace lumata::driver {

/// Main compiler driver
class Compiler {
public:
    explicit Compiler(const CompilerOptions& options, Logger& logger);

    /// Compile the input document to target-language source
    /// Returns 0 on success, non-zero on error
    int compile();

private:
    // ========================================================================
    // Compilation Pipeline Stages
    // ========================================================================

    /// Stage 1: Read the input document ("-" reads stdin)
    std::string read_input();

    /// Stage 2: Load the tree and render it with the selected dialect
    std::string generate_code(const std::string& document);

    /// Stage 3: Write to the output file, or stdout when none was given
    void write_output(const std::string& code);

    codegen::render_options make_render_options() const;

    // ========================================================================
    // State
    // ========================================================================

    const CompilerOptions& options_;
    Logger& logger_;
};

}  // namespace lumata::driver
