//
// Code Writer Implementation
//

#include <lumata/codegen/code_writer.hh>
#include <utility>

namespace lumata::codegen {

// ============================================================================
// CodeWriter Implementation
// ============================================================================

CodeWriter::CodeWriter(std::ostream& output)
    : output_(output),
      indent_level_(0),
      indent_string_("    "),  // 4 spaces default
      cached_indent_(),
      line_buffer_()
{
}

void CodeWriter::write_line(const std::string& line) {
    if (!line.empty()) {
        output_ << cached_indent_ << line;
    }
    output_ << '\n';
}

void CodeWriter::write_raw(const std::string& text) {
    output_ << text;
}

void CodeWriter::write_blank_line() {
    output_ << '\n';
}

void CodeWriter::indent() {
    indent_level_++;
    update_cached_indent();
}

void CodeWriter::unindent() {
    if (indent_level_ > 0) {
        indent_level_--;
        update_cached_indent();
    }
}

void CodeWriter::set_indent_string(const std::string& indent) {
    indent_string_ = indent;
    update_cached_indent();
}

void CodeWriter::update_cached_indent() {
    cached_indent_.clear();
    for (size_t i = 0; i < indent_level_; ++i) {
        cached_indent_ += indent_string_;
    }
}

// RAII Block factory methods
IfBlock CodeWriter::write_if(const std::string& condition) {
    return IfBlock(this, condition);
}

TryBlock CodeWriter::write_try() {
    return TryBlock(this);
}

BracedBlock CodeWriter::write_braced(const std::string& header, const std::string& footer) {
    return BracedBlock(this, header, footer);
}

// ============================================================================
// Streaming Operators Implementation
// ============================================================================

CodeWriter& CodeWriter::operator<<(const std::string& text) {
    line_buffer_ += text;
    return *this;
}

CodeWriter& CodeWriter::operator<<(const char* text) {
    if (text) {
        line_buffer_ += text;
    }
    return *this;
}

CodeWriter& CodeWriter::operator<<(char c) {
    line_buffer_ += c;
    return *this;
}

CodeWriter& CodeWriter::operator<<(int value) {
    line_buffer_ += std::to_string(value);
    return *this;
}

CodeWriter& CodeWriter::operator<<(size_t value) {
    line_buffer_ += std::to_string(value);
    return *this;
}

CodeWriter& CodeWriter::operator<<(CodeWriter& (*manip)(CodeWriter&)) {
    return manip(*this);
}

// ============================================================================
// Custom Manipulators Implementation
// ============================================================================

CodeWriter& endl(CodeWriter& writer) {
    writer.write_line(writer.line_buffer_);
    writer.line_buffer_.clear();
    return writer;
}

CodeWriter& blank(CodeWriter& writer) {
    writer.write_blank_line();
    return writer;
}

// ============================================================================
// IfBlock Implementation
// ============================================================================

IfBlock::IfBlock(CodeWriter* writer, const std::string& condition)
    : writer_(writer),
      has_successor_(false)
{
    writer_->write_line("if (" + condition + ") {");
    writer_->indent();
}

IfBlock::IfBlock(CodeWriter* writer)
    : writer_(writer),
      has_successor_(false)
{
}

IfBlock::~IfBlock() {
    if (writer_ && !has_successor_) {
        writer_->unindent();
        writer_->write_line("}");
    }
}

IfBlock::IfBlock(IfBlock&& other) noexcept
    : writer_(other.writer_),
      has_successor_(other.has_successor_)
{
    other.writer_ = nullptr;
}

IfBlock& IfBlock::operator=(IfBlock&& other) noexcept {
    if (this != &other) {
        // Close current block if nothing took it over
        if (writer_ && !has_successor_) {
            writer_->unindent();
            writer_->write_line("}");
        }
        writer_ = other.writer_;
        has_successor_ = other.has_successor_;
        other.writer_ = nullptr;
    }
    return *this;
}

IfBlock IfBlock::write_else_if(const std::string& condition) {
    writer_->unindent();
    writer_->write_line("} else if (" + condition + ") {");
    writer_->indent();
    has_successor_ = true;
    return IfBlock(writer_);
}

ElseBlock IfBlock::write_else() {
    writer_->unindent();
    writer_->write_line("} else {");
    writer_->indent();
    has_successor_ = true;
    return ElseBlock(writer_);
}

// ============================================================================
// ElseBlock Implementation
// ============================================================================

ElseBlock::ElseBlock(CodeWriter* writer)
    : writer_(writer)
{
}

ElseBlock::~ElseBlock() {
    if (writer_) {
        writer_->unindent();
        writer_->write_line("}");
    }
}

ElseBlock::ElseBlock(ElseBlock&& other) noexcept
    : writer_(other.writer_)
{
    other.writer_ = nullptr;
}

// ============================================================================
// TryBlock Implementation
// ============================================================================

TryBlock::TryBlock(CodeWriter* writer)
    : writer_(writer),
      has_catch_(false)
{
    writer_->write_line("try {");
    writer_->indent();
}

TryBlock::~TryBlock() {
    if (writer_ && !has_catch_) {
        writer_->unindent();
        writer_->write_line("}");
    }
}

TryBlock::TryBlock(TryBlock&& other) noexcept
    : writer_(other.writer_),
      has_catch_(other.has_catch_)
{
    other.writer_ = nullptr;
}

CatchBlock TryBlock::write_catch(const std::string& clause) {
    writer_->unindent();
    writer_->write_line("} " + clause + " {");
    writer_->indent();
    has_catch_ = true;
    return CatchBlock(writer_);
}

// ============================================================================
// CatchBlock Implementation
// ============================================================================

CatchBlock::CatchBlock(CodeWriter* writer)
    : writer_(writer)
{
}

CatchBlock::~CatchBlock() {
    if (writer_) {
        writer_->unindent();
        writer_->write_line("}");
    }
}

CatchBlock::CatchBlock(CatchBlock&& other) noexcept
    : writer_(other.writer_)
{
    other.writer_ = nullptr;
}

// ============================================================================
// BracedBlock Implementation
// ============================================================================

BracedBlock::BracedBlock(CodeWriter* writer, const std::string& header, std::string footer)
    : writer_(writer),
      footer_(std::move(footer))
{
    writer_->write_line(header);
    writer_->indent();
}

BracedBlock::~BracedBlock() {
    if (writer_) {
        writer_->unindent();
        writer_->write_line(footer_);
    }
}

BracedBlock::BracedBlock(BracedBlock&& other) noexcept
    : writer_(other.writer_),
      footer_(std::move(other.footer_))
{
    other.writer_ = nullptr;
}

}  // namespace lumata::codegen
