//
// Code Writer - RAII-Based Code Generation
//
// Line writer with automatic indentation management. Block guards open a
// block on construction and close it on destruction, so braces always match
// even when rendering aborts with an exception.
//

#pragma once

#include <ostream>
#include <string>

namespace lumata::codegen {

// Forward declarations for RAII block classes
class IfBlock;
class ElseBlock;
class TryBlock;
class CatchBlock;
class BracedBlock;

// ============================================================================
// CodeWriter - Base class for indentation-managed output
// ============================================================================

class CodeWriter {
public:
    explicit CodeWriter(std::ostream& output);
    virtual ~CodeWriter() = default;

    // Non-copyable (output stream reference)
    CodeWriter(const CodeWriter&) = delete;
    CodeWriter& operator=(const CodeWriter&) = delete;

    // ========================================================================
    // Basic Output Methods
    // ========================================================================

    // Write a line with current indentation. Embedded newlines are written
    // verbatim: only the first line receives indentation.
    virtual void write_line(const std::string& line);

    // Write raw text without indentation or newline
    virtual void write_raw(const std::string& text);

    // Write a blank line
    virtual void write_blank_line();

    // ========================================================================
    // RAII Block Generators - Return guard objects
    // ========================================================================

    // if (condition) { ... }
    IfBlock write_if(const std::string& condition);

    // try { ... }
    TryBlock write_try();

    // header ... footer, with the body indented one level
    BracedBlock write_braced(const std::string& header, const std::string& footer);

    // ========================================================================
    // Indentation Management (for RAII blocks)
    // ========================================================================

    void indent();
    void unindent();
    size_t current_indent_level() const { return indent_level_; }

    // ========================================================================
    // Streaming Operators
    // ========================================================================

    // Stream text (accumulated until endl or write_line)
    CodeWriter& operator<<(const std::string& text);
    CodeWriter& operator<<(const char* text);
    CodeWriter& operator<<(char c);
    CodeWriter& operator<<(int value);
    CodeWriter& operator<<(size_t value);

    // Stream manipulator support
    CodeWriter& operator<<(CodeWriter& (*manip)(CodeWriter&));

    // ========================================================================
    // Configuration
    // ========================================================================

    void set_indent_string(const std::string& indent);
    const std::string& get_indent_string() const { return indent_string_; }

    friend CodeWriter& endl(CodeWriter& writer);
    friend CodeWriter& blank(CodeWriter& writer);

protected:
    std::ostream& output_;

    // Indentation state
    size_t indent_level_;
    std::string indent_string_;  // e.g., "    " (4 spaces)
    std::string cached_indent_;  // Cached string of current indentation

    // Line buffer for streaming operator
    std::string line_buffer_;

    void update_cached_indent();
};

// ============================================================================
// Custom Stream Manipulators
// ============================================================================

// Write buffered line with indentation and newline (like std::endl)
CodeWriter& endl(CodeWriter& writer);

// Write a blank line
CodeWriter& blank(CodeWriter& writer);

// ============================================================================
// IfBlock - RAII guard for if / else if chains
// ============================================================================

class IfBlock {
public:
    IfBlock(CodeWriter* writer, const std::string& condition);
    ~IfBlock();

    // Non-copyable, movable
    IfBlock(const IfBlock&) = delete;
    IfBlock& operator=(const IfBlock&) = delete;
    IfBlock(IfBlock&& other) noexcept;
    IfBlock& operator=(IfBlock&& other) noexcept;

    // Chain an else-if block; this block hands closing over to the result
    IfBlock write_else_if(const std::string& condition);

    // Chain an else block; this block hands closing over to the result
    ElseBlock write_else();

private:
    // Used by write_else_if: header already written
    explicit IfBlock(CodeWriter* writer);

    CodeWriter* writer_;
    bool has_successor_;
};

// ============================================================================
// ElseBlock - RAII guard for else-statements
// ============================================================================

class ElseBlock {
public:
    explicit ElseBlock(CodeWriter* writer);
    ~ElseBlock();

    ElseBlock(const ElseBlock&) = delete;
    ElseBlock& operator=(const ElseBlock&) = delete;
    ElseBlock(ElseBlock&& other) noexcept;
    ElseBlock& operator=(ElseBlock&& other) = delete;

private:
    CodeWriter* writer_;
};

// ============================================================================
// TryBlock - RAII guard for try-catch blocks
// ============================================================================

class TryBlock {
public:
    explicit TryBlock(CodeWriter* writer);
    ~TryBlock();

    TryBlock(const TryBlock&) = delete;
    TryBlock& operator=(const TryBlock&) = delete;
    TryBlock(TryBlock&& other) noexcept;
    TryBlock& operator=(TryBlock&& other) = delete;

    // Add the catch block; clause is the full "catch (...)" text
    CatchBlock write_catch(const std::string& clause);

private:
    CodeWriter* writer_;
    bool has_catch_;
};

// ============================================================================
// CatchBlock - RAII guard for catch statements
// ============================================================================

class CatchBlock {
public:
    explicit CatchBlock(CodeWriter* writer);
    ~CatchBlock();

    CatchBlock(const CatchBlock&) = delete;
    CatchBlock& operator=(const CatchBlock&) = delete;
    CatchBlock(CatchBlock&& other) noexcept;
    CatchBlock& operator=(CatchBlock&& other) = delete;

private:
    CodeWriter* writer_;
};

// ============================================================================
// BracedBlock - RAII guard for closures, functions and other braced bodies
// ============================================================================

class BracedBlock {
public:
    BracedBlock(CodeWriter* writer, const std::string& header, std::string footer);
    ~BracedBlock();

    BracedBlock(const BracedBlock&) = delete;
    BracedBlock& operator=(const BracedBlock&) = delete;
    BracedBlock(BracedBlock&& other) noexcept;
    BracedBlock& operator=(BracedBlock&& other) = delete;

private:
    CodeWriter* writer_;
    std::string footer_;
};

}  // namespace lumata::codegen
