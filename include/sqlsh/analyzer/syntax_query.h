#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sqlsh/proto/proto_generated.h"
#include "sqlsh/script.h"

namespace sqlsh {

/// A match of a syntax query
struct QueryMatch {
    /// The matched node
    NodeID node_id;
    /// The captured nodes
    std::vector<std::pair<std::string, NodeID>> captures;

    /// Get the first capture with a name
    std::optional<NodeID> GetCapture(std::string_view name) const;
};

/// A structural pattern over syntax nodes.
///
/// Patterns are S-expressions: `(kind child*)` optionally followed by `@capture`.
/// The kind `_` matches any node. Child patterns match an ordered subsequence of the children.
///
/// Example:
///   (table_reference (identifier) @table (table_alias (identifier) @alias))
class SyntaxQuery {
   public:
    /// A compiled pattern node
    struct Pattern {
        /// The node type, nullopt for the wildcard
        std::optional<proto::NodeType> node_type;
        /// The capture name, empty if not captured
        std::string capture;
        /// The child patterns
        std::vector<Pattern> children;
    };

   protected:
    /// The root pattern
    Pattern root;

    /// Constructor
    explicit SyntaxQuery(Pattern root) : root(std::move(root)) {}

   public:
    /// Compile a pattern
    static std::pair<std::unique_ptr<SyntaxQuery>, proto::StatusCode> Compile(std::string_view text);
    /// Match all nodes below and including a root
    std::vector<QueryMatch> Match(const SyntaxNode& node) const;
};

}  // namespace sqlsh
