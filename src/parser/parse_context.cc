#include "sqlsh/parser/parse_context.h"

#include <algorithm>

#include "spdlog/spdlog.h"
#include "sqlsh/parser/grammar/location.h"

namespace sqlsh {
namespace parser {

/// Constructor
ParseContext::ParseContext(const ScannedScript& scan) : program(scan) {}

/// Add a node
NodeID ParseContext::AddNode(proto::Node node) {
    auto node_id = static_cast<NodeID>(nodes.size());
    nodes.push_back(node);
    // Set parent reference
    for (size_t i = 0; i < node.children_count(); ++i) {
        auto& child = nodes[node.children_begin() + i];
        child = proto::Node(child.location(), child.node_type(), node_id, child.children_begin(),
                            child.children_count());
    }
    return node_id;
}

/// Add an object
proto::Node ParseContext::Object(proto::Location loc, proto::NodeType type, std::vector<proto::Node>&& children,
                                 bool null_if_empty) {
    // Children are stored contiguously, grandchildren were added before
    auto begin = static_cast<uint32_t>(nodes.size());
    uint32_t loc_begin = loc.offset();
    uint32_t loc_end = loc.offset() + loc.length();
    bool empty_loc = loc.length() == 0;
    for (auto& child : children) {
        if (child.node_type() == proto::NodeType::NONE) continue;
        AddNode(child);
        auto child_loc = child.location();
        if (empty_loc) {
            loc_begin = child_loc.offset();
            loc_end = child_loc.offset() + child_loc.length();
            empty_loc = false;
            continue;
        }
        loc_begin = std::min(loc_begin, child_loc.offset());
        loc_end = std::max(loc_end, child_loc.offset() + child_loc.length());
    }
    auto n = static_cast<uint32_t>(nodes.size()) - begin;
    if (n == 0 && null_if_empty) {
        return Null();
    }
    return proto::Node(proto::Location(loc_begin, loc_end - loc_begin), type, NO_PARENT, begin, n);
}

/// Concatenate node lists
std::vector<proto::Node> ParseContext::Concat(std::initializer_list<proto::Node> head,
                                              std::vector<proto::Node>&& body,
                                              std::initializer_list<proto::Node> tail) const {
    std::vector<proto::Node> out;
    out.reserve(head.size() + body.size() + tail.size());
    out.insert(out.end(), head.begin(), head.end());
    out.insert(out.end(), body.begin(), body.end());
    out.insert(out.end(), tail.begin(), tail.end());
    return out;
}

/// Create a placeholder name
proto::Node ParseContext::MissingName(proto::Location after, proto::NodeType container) {
    auto after_offset = after.offset() + after.length();
    auto begin = program.symbols.begin() + symbol_begin;
    auto end = program.symbols.begin() + symbol_end;
    auto iter = std::find_if(begin, end, [&](auto& sym) { return sym.location.offset() >= after_offset; });
    auto offset = (iter == end) ? statement_end_offset : iter->location.offset();
    auto name = Leaf(proto::Location(offset, 0), proto::NodeType::IDENTIFIER);
    return Object(proto::Location(offset, 0), container, {name});
}

/// Add an error
void ParseContext::AddError(proto::Location loc, const std::string& message) { errors.push_back({loc, message}); }

/// Add a statement
void ParseContext::AddStatement(proto::Node node) { current_statement = node; }

/// Parse a single statement
void ParseContext::ParseStatement(size_t begin, size_t end) {
    auto nodes_begin = nodes.size();
    symbol_begin = begin;
    symbol_iterator = begin;
    symbol_end = end;
    statement_end_offset = program.symbols[end].location.offset();
    current_statement = Null();

    Parser parser(*this);
    if (parser.parse() == 0 && current_statement.node_type() != proto::NodeType::NONE) {
        statements.push_back(Object(current_statement.location(), proto::NodeType::STATEMENT, {current_statement}));
        return;
    }

    // Discard the partial tree and cover the tokens with an error node
    nodes.resize(nodes_begin);
    auto first = program.symbols[begin].location;
    auto last = program.symbols[end - 1].location;
    auto loc = proto::Location(first.offset(), last.offset() + last.length() - first.offset());
    spdlog::debug("[parser] statement at offset {} does not parse", first.offset());
    statements.push_back(Leaf(loc, proto::NodeType::ERROR));
}

/// Add the root node
NodeID ParseContext::AddRoot() {
    auto root_loc = proto::Location(0, static_cast<uint32_t>(program.text_buffer.size()));
    auto root = Object(root_loc, proto::NodeType::STATEMENT_LIST, std::move(statements));
    statements.clear();
    return AddNode(root);
}

}  // namespace parser
}  // namespace sqlsh
