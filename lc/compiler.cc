#include "compiler.hh"
#include <lumata/loader/tree_loader.hh>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace lumata::driver {

using namespace lumata::codegen;

Compiler::Compiler(const CompilerOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Compiler::compile() {
    try {
        // Generated code owns stdout; keep chatter on stderr
        if (options_.output_file.empty()) {
            logger_.redirect_messages(std::cerr);
        }

        logger_.verbose("Compiling: " + options_.input_file.string());

        std::string document = read_input();
        std::string code = generate_code(document);
        write_output(code);

        return 0;

    } catch (const loader::tree_load_error& e) {
        logger_.error(std::string("Load error: ") + e.what());
        return 1;
    } catch (const codegen_error& e) {
        logger_.error(std::string("Code generation error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

std::string Compiler::read_input() {
    if (options_.input_file == "-") {
        logger_.verbose("Reading document from stdin");
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream file(options_.input_file);
    if (!file.is_open()) {
        throw loader::tree_load_error("", "Failed to open file: " + options_.input_file.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string Compiler::generate_code(const std::string& document) {
    loader::TreeLoader loader;
    render_options render_opts = make_render_options();

    logger_.verbose("Generating code for target: " + render_opts.target);

    if (options_.input_kind == InputKind::Expression) {
        ast::expr root = loader.load_expression(document);
        logger_.debug("Loaded expression tree");
        return render_expression(root, render_opts) + "\n";
    }

    ast::module_def module = loader.load_module(document);
    logger_.debug("Loaded module " + module.name + " with " +
                  std::to_string(module.functions.size()) + " function(s)");
    return render_module(module, render_opts);
}

void Compiler::write_output(const std::string& code) {
    if (options_.output_file.empty()) {
        std::cout << code;
        std::cout.flush();
        if (!std::cout) {
            throw std::runtime_error("Failed to write to stdout");
        }
        return;
    }

    logger_.verbose("Writing: " + options_.output_file.string());

    auto parent = options_.output_file.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::ofstream ofs(options_.output_file);
    if (!ofs) {
        throw std::runtime_error("Failed to open file for writing: " + options_.output_file.string());
    }

    ofs << code;

    if (!ofs) {
        throw std::runtime_error("Failed to write file: " + options_.output_file.string());
    }

    logger_.success("Generated: " + options_.output_file.string());
}

render_options Compiler::make_render_options() const {
    render_options opts;
    opts.target = options_.target;
    opts.indent_size = options_.indent_size;
    opts.scrutinee_name = options_.scrutinee_name;
    opts.catch_name = options_.catch_name;
    return opts;
}

}  // namespace lumata::driver
