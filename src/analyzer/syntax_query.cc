#include "sqlsh/analyzer/syntax_query.h"

#include <cctype>

#include "spdlog/spdlog.h"

namespace sqlsh {

namespace {

using Pattern = SyntaxQuery::Pattern;
using Captures = std::vector<std::pair<std::string, NodeID>>;

/// Reads a pattern text
struct PatternReader {
    /// The text
    std::string_view text;
    /// The position
    size_t pos = 0;

    void SkipSpace() {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    }
    bool Peek(char c) {
        SkipSpace();
        return pos < text.size() && text[pos] == c;
    }
    bool Consume(char c) {
        if (!Peek(c)) return false;
        ++pos;
        return true;
    }
    std::string_view ReadWord() {
        SkipSpace();
        auto begin = pos;
        while (pos < text.size() && (std::isalnum(static_cast<unsigned char>(text[pos])) || text[pos] == '_')) ++pos;
        return text.substr(begin, pos - begin);
    }
    bool ReadPattern(Pattern& out) {
        if (!Consume('(')) return false;
        auto kind = ReadWord();
        if (kind.empty()) return false;
        if (kind != "_") {
            auto type = SyntaxNode::FindNodeType(kind);
            if (!type) {
                spdlog::debug("[query] unknown node kind '{}'", kind);
                return false;
            }
            out.node_type = type;
        }
        while (!Consume(')')) {
            if (!Peek('(')) return false;
            Pattern child;
            if (!ReadPattern(child)) return false;
            out.children.push_back(std::move(child));
        }
        if (Consume('@')) {
            auto capture = ReadWord();
            if (capture.empty()) return false;
            out.capture = capture;
        }
        return true;
    }
};

void MatchNode(const ParsedScript& script, const Pattern& pattern, NodeID node_id, Captures& captures,
               std::vector<Captures>& out);

/// Match the child patterns from a pattern index against the children from a child id
void MatchChildren(const ParsedScript& script, const Pattern& pattern, size_t pattern_idx, const proto::Node& node,
                   NodeID next_child, Captures& captures, std::vector<Captures>& out) {
    if (pattern_idx == pattern.children.size()) {
        out.push_back(captures);
        return;
    }
    auto children_end = node.children_begin() + node.children_count();
    for (auto c = next_child; c < children_end; ++c) {
        Captures child_captures;
        std::vector<Captures> child_matches;
        MatchNode(script, pattern.children[pattern_idx], c, child_captures, child_matches);
        for (auto& match : child_matches) {
            auto mark = captures.size();
            captures.insert(captures.end(), match.begin(), match.end());
            MatchChildren(script, pattern, pattern_idx + 1, node, c + 1, captures, out);
            captures.resize(mark);
        }
    }
}

/// Match a pattern against a node, collects every assignment
void MatchNode(const ParsedScript& script, const Pattern& pattern, NodeID node_id, Captures& captures,
               std::vector<Captures>& out) {
    auto& node = script.nodes[node_id];
    if (pattern.node_type.has_value() && *pattern.node_type != node.node_type()) {
        return;
    }
    auto mark = captures.size();
    if (!pattern.capture.empty()) {
        captures.push_back({pattern.capture, node_id});
    }
    MatchChildren(script, pattern, 0, node, node.children_begin(), captures, out);
    captures.resize(mark);
}

}  // namespace

/// Get a capture
std::optional<NodeID> QueryMatch::GetCapture(std::string_view name) const {
    for (auto& [capture, node] : captures) {
        if (capture == name) return node;
    }
    return std::nullopt;
}

/// Compile a pattern
std::pair<std::unique_ptr<SyntaxQuery>, proto::StatusCode> SyntaxQuery::Compile(std::string_view text) {
    PatternReader reader{text};
    Pattern root;
    if (!reader.ReadPattern(root)) {
        return {nullptr, proto::StatusCode::QUERY_INVALID};
    }
    reader.SkipSpace();
    if (reader.pos != text.size()) {
        return {nullptr, proto::StatusCode::QUERY_INVALID};
    }
    return {std::unique_ptr<SyntaxQuery>(new SyntaxQuery(std::move(root))), proto::StatusCode::OK};
}

/// Match all nodes in a subtree
std::vector<QueryMatch> SyntaxQuery::Match(const SyntaxNode& node) const {
    auto& script = node.GetScript();
    std::vector<QueryMatch> matches;
    // Visit nodes in pre-order
    std::vector<NodeID> pending{node.GetNodeID()};
    while (!pending.empty()) {
        auto id = pending.back();
        pending.pop_back();
        Captures captures;
        std::vector<Captures> found;
        MatchNode(script, root, id, captures, found);
        for (auto& match : found) {
            matches.push_back(QueryMatch{id, std::move(match)});
        }
        auto& n = script.nodes[id];
        for (auto i = n.children_count(); i > 0; --i) {
            pending.push_back(n.children_begin() + i - 1);
        }
    }
    return matches;
}

}  // namespace sqlsh
