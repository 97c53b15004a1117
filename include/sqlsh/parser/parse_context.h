#pragma once

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "sqlsh/parser/parser.h"
#include "sqlsh/proto/proto_generated.h"
#include "sqlsh/script.h"

namespace sqlsh {
namespace parser {

class ParseContext {
    friend class ::sqlsh::ParsedScript;
    friend class ::sqlsh::parser::Parser;

   protected:
    /// The scanned script
    const ScannedScript& program;
    /// The first symbol of the current statement
    size_t symbol_begin = 0;
    /// The next symbol of the current statement
    size_t symbol_iterator = 0;
    /// The end of the current statement
    size_t symbol_end = 0;
    /// The text offset where the current statement ends
    uint32_t statement_end_offset = 0;

    /// The nodes
    std::vector<proto::Node> nodes;
    /// The statement nodes, materialized as children of the root
    std::vector<proto::Node> statements;
    /// The errors
    std::vector<std::pair<proto::Location, std::string>> errors;
    /// The node of the current statement
    proto::Node current_statement;

    /// Parse the symbols [begin, end) as a single statement
    void ParseStatement(size_t begin, size_t end);
    /// Add the root node spanning the text
    NodeID AddRoot();

   public:
    /// Constructor
    explicit ParseContext(const ScannedScript& scan);

    /// Get the program
    auto& GetProgram() const { return program; };
    /// Get next symbol
    inline Parser::symbol_type NextSymbol() {
        if (symbol_iterator >= symbol_end) {
            return Parser::make_EOF(proto::Location(statement_end_offset, 0));
        }
        return program.symbols[symbol_iterator++];
    }

    /// Create a null node
    proto::Node Null() const { return proto::Node(); }
    /// Create a leaf node
    proto::Node Leaf(proto::Location loc, proto::NodeType type) const {
        return proto::Node(loc, type, NO_PARENT, 0, 0);
    }
    /// Add an object, the location is widened to its children
    proto::Node Object(proto::Location loc, proto::NodeType type, std::vector<proto::Node>&& children,
                       bool null_if_empty = false);
    /// Add an object
    inline proto::Node Object(proto::Location loc, proto::NodeType type, std::initializer_list<proto::Node> children,
                              bool null_if_empty = false) {
        return Object(loc, type, std::vector<proto::Node>{children}, null_if_empty);
    }
    /// Concatenate node lists
    std::vector<proto::Node> Concat(std::initializer_list<proto::Node> head, std::vector<proto::Node>&& body,
                                    std::initializer_list<proto::Node> tail) const;
    /// Create a zero-width identifier in a container where a name was expected.
    /// The identifier sits at the start of the next token.
    proto::Node MissingName(proto::Location after, proto::NodeType container);

    /// Add a node
    NodeID AddNode(proto::Node node);
    /// Add an error
    void AddError(proto::Location loc, const std::string& message);
    /// Add a statement
    void AddStatement(proto::Node node);
};

}  // namespace parser
}  // namespace sqlsh
