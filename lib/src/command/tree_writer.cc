//
// Tree Writer Implementation
//

#include "command/tree_writer.hh"

namespace promptgen::dump {

// ============================================================================
// TreeWriter Implementation
// ============================================================================

TreeWriter::TreeWriter(std::ostream& output)
    : output_(output),
      indent_level_(0),
      indent_string_("  "),
      cached_indent_()
{
}

void TreeWriter::write_line(const std::string& line) {
    output_ << cached_indent_ << line << '\n';
}

NodeBlock TreeWriter::write_node(const std::string& line) {
    return NodeBlock(this, line);
}

void TreeWriter::indent() {
    indent_level_++;
    update_cached_indent();
}

void TreeWriter::unindent() {
    if (indent_level_ > 0) {
        indent_level_--;
        update_cached_indent();
    }
}

void TreeWriter::update_cached_indent() {
    cached_indent_.clear();
    for (size_t i = 0; i < indent_level_; ++i) {
        cached_indent_ += indent_string_;
    }
}

// ============================================================================
// NodeBlock Implementation
// ============================================================================

NodeBlock::NodeBlock(TreeWriter* writer, const std::string& line)
    : writer_(writer)
{
    writer_->write_line(line);
    writer_->indent();
}

NodeBlock::~NodeBlock() {
    if (writer_) {
        writer_->unindent();
    }
}

NodeBlock::NodeBlock(NodeBlock&& other) noexcept
    : writer_(other.writer_)
{
    other.writer_ = nullptr;
}

NodeBlock& NodeBlock::operator=(NodeBlock&& other) noexcept {
    if (this != &other) {
        if (writer_) {
            writer_->unindent();
        }
        writer_ = other.writer_;
        other.writer_ = nullptr;
    }
    return *this;
}

// ============================================================================
// Helpers
// ============================================================================

std::string quote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            default: out += c; break;
        }
    }
    out += '"';
    return out;
}

}  // namespace promptgen::dump
