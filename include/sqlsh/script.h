#pragma once

#include <flatbuffers/flatbuffers.h>

#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sqlsh/parser/parser.h"
#include "sqlsh/proto/proto_generated.h"

namespace sqlsh {
namespace parser {
class ParseContext;
}  // namespace parser

class Catalog;
class Completion;
class SyntaxNode;

using Location = proto::Location;
using NodeID = uint32_t;

/// Parent id of the root node
constexpr NodeID NO_PARENT = std::numeric_limits<NodeID>::max();

class ScannedScript {
   public:
    /// The copied text buffer
    std::string text_buffer;

    /// The scanner errors
    std::vector<std::pair<proto::Location, std::string>> errors;
    /// The line breaks
    std::vector<proto::Location> line_breaks;
    /// The comments
    std::vector<proto::Location> comments;
    /// All symbols, terminated by EOF
    std::vector<parser::Parser::symbol_type> symbols;

   public:
    /// Constructor
    explicit ScannedScript(std::string text);

    /// Get the input
    auto& GetInput() const { return text_buffer; }
    /// Get the tokens
    auto& GetSymbols() const { return symbols; }
    /// Read a text at a location
    std::string_view ReadTextAtLocation(proto::Location loc) const {
        return std::string_view{text_buffer}.substr(loc.offset(), loc.length());
    }
    /// Build the highlighting of all tokens and comments
    std::unique_ptr<proto::HighlightingT> BuildHighlighting() const;
};

class ParsedScript {
   public:
    /// The scanned script
    std::shared_ptr<ScannedScript> scanned_script;
    /// The nodes
    std::vector<proto::Node> nodes;
    /// The statement nodes
    std::vector<NodeID> statements;
    /// The root node
    NodeID root_node_id = NO_PARENT;
    /// The errors
    std::vector<std::pair<proto::Location, std::string>> errors;

   public:
    /// Constructor
    ParsedScript(std::shared_ptr<ScannedScript> scan, parser::ParseContext&& context);

    /// Get the nodes
    auto& GetNodes() const { return nodes; }
    /// Get the text
    std::string_view GetText() const { return scanned_script->text_buffer; }
    /// Get the root node
    SyntaxNode GetRootNode() const;
    /// Find the deepest node covering a text offset
    std::optional<NodeID> FindNodeAtOffset(size_t text_offset, NodeID from) const;
};

/// A lightweight view on a node of a parsed script
class SyntaxNode {
   protected:
    /// The parsed script
    const ParsedScript* script;
    /// The node id
    NodeID node_id;

   public:
    /// Constructor
    SyntaxNode(const ParsedScript& script, NodeID node_id) : script(&script), node_id(node_id) {}

    /// Get the node id
    NodeID GetNodeID() const { return node_id; }
    /// Get the script
    const ParsedScript& GetScript() const { return *script; }
    /// Get the raw node
    const proto::Node& GetNode() const { return script->nodes[node_id]; }
    /// Get the node type
    proto::NodeType GetNodeType() const { return GetNode().node_type(); }
    /// Get the lower-case kind name
    std::string_view GetKind() const { return GetKindName(GetNodeType()); }
    /// Get the location
    proto::Location GetLocation() const { return GetNode().location(); }
    /// Get the byte range as [begin, end)
    std::pair<size_t, size_t> GetByteRange() const {
        auto loc = GetLocation();
        return {loc.offset(), loc.offset() + loc.length()};
    }
    /// Get the covered text
    std::string_view GetText() const { return script->scanned_script->ReadTextAtLocation(GetLocation()); }
    /// Get the parent
    std::optional<SyntaxNode> GetParent() const;
    /// Get the previous sibling
    std::optional<SyntaxNode> GetPreviousSibling() const;
    /// Get the next sibling
    std::optional<SyntaxNode> GetNextSibling() const;
    /// Get the number of children
    size_t GetChildCount() const { return GetNode().children_count(); }
    /// Get a child
    SyntaxNode GetChild(size_t i) const { return SyntaxNode{*script, GetNode().children_begin() + static_cast<NodeID>(i)}; }
    /// Find the smallest descendant covering a text offset
    SyntaxNode FindSmallestCovering(size_t text_offset) const;

    /// Compare two views
    bool operator==(const SyntaxNode& other) const { return script == other.script && node_id == other.node_id; }

    /// Get the kind name of a node type
    static std::string_view GetKindName(proto::NodeType type);
    /// Resolve a kind name
    static std::optional<proto::NodeType> FindNodeType(std::string_view kind);
};

class Script {
   protected:
    /// The catalog
    Catalog& catalog;
    /// The text
    std::string text;
    /// The last scanned script
    std::shared_ptr<ScannedScript> scanned_script;
    /// The last parsed script
    std::shared_ptr<ParsedScript> parsed_script;

   public:
    /// Constructor
    explicit Script(Catalog& catalog);

    /// Get the text
    auto& GetText() const { return text; }
    /// Get the scanned script
    auto& GetScannedScript() const { return scanned_script; }
    /// Get the parsed script
    auto& GetParsedScript() const { return parsed_script; }

    /// Replace the text, invalidates previous results
    void ReplaceText(std::string_view text);
    /// Scan the text
    std::pair<ScannedScript*, proto::StatusCode> Scan();
    /// Parse the latest scanned script
    std::pair<ParsedScript*, proto::StatusCode> Parse();
    /// Complete at a text offset, rescans and reparses the text
    std::pair<std::unique_ptr<Completion>, proto::StatusCode> CompleteAt(size_t text_offset);
    /// Get the inline hint at a text offset
    std::optional<std::string> HintAt(size_t text_offset);
};

}  // namespace sqlsh
