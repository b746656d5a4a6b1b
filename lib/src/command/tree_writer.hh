//
// Tree Writer - indented line output with RAII-managed nesting
//

#pragma once

#include <ostream>
#include <string>

namespace promptgen::dump {

class NodeBlock;

// ============================================================================
// TreeWriter - one node per line, children indented below their parent
// ============================================================================

class TreeWriter {
public:
    explicit TreeWriter(std::ostream& output);

    // Non-copyable (output stream reference)
    TreeWriter(const TreeWriter&) = delete;
    TreeWriter& operator=(const TreeWriter&) = delete;

    // Write a line with current indentation
    void write_line(const std::string& line);

    // Write the node's line, children written inside the returned block are nested
    NodeBlock write_node(const std::string& line);

    void indent();
    void unindent();

private:
    std::ostream& output_;
    size_t indent_level_;
    std::string indent_string_;
    std::string cached_indent_;

    void update_cached_indent();
};

// ============================================================================
// NodeBlock - RAII guard that closes one nesting level
// ============================================================================

class NodeBlock {
public:
    NodeBlock(TreeWriter* writer, const std::string& line);
    ~NodeBlock();

    // Non-copyable, movable
    NodeBlock(const NodeBlock&) = delete;
    NodeBlock& operator=(const NodeBlock&) = delete;
    NodeBlock(NodeBlock&& other) noexcept;
    NodeBlock& operator=(NodeBlock&& other) noexcept;

private:
    TreeWriter* writer_;
};

// Quotes text for display: "..." with \n, \t, \" and \\ escaped
std::string quote(const std::string& text);

}  // namespace promptgen::dump
