#include "sqlsh/script.h"

#include <array>
#include <cctype>

#include "ankerl/unordered_dense.h"
#include "spdlog/spdlog.h"
#include "sqlsh/analyzer/completion.h"
#include "sqlsh/catalog.h"
#include "sqlsh/parser/parse_context.h"
#include "sqlsh/parser/parser.h"
#include "sqlsh/parser/scanner.h"

namespace sqlsh {

using Parser = parser::Parser;

static proto::HighlightingTokenType MapToken(Parser::symbol_kind_type symbol) {
    switch (symbol) {
#define X(CATEGORY, NAME, TOKEN) case Parser::symbol_kind_type::S_##TOKEN:
#include "../grammar/lists/sql_reserved_keywords.list"
#include "../grammar/lists/sql_unreserved_keywords.list"
#undef X
        case Parser::symbol_kind_type::S_NOT_LA:
        case Parser::symbol_kind_type::S_IS_NOT:
            return proto::HighlightingTokenType::KEYWORD;
        case Parser::symbol_kind_type::S_SCONST:
            return proto::HighlightingTokenType::LITERAL_STRING;
        case Parser::symbol_kind_type::S_ICONST:
        case Parser::symbol_kind_type::S_FCONST:
            return proto::HighlightingTokenType::LITERAL_NUMBER;
        case Parser::symbol_kind_type::S_XCONST:
            return proto::HighlightingTokenType::LITERAL_BLOB;
        case Parser::symbol_kind_type::S_PARAM:
            return proto::HighlightingTokenType::PARAMETER;
        case Parser::symbol_kind_type::S_IDENT:
            return proto::HighlightingTokenType::IDENTIFIER;
        case Parser::symbol_kind_type::S_STAR:
        case Parser::symbol_kind_type::S_PLUS:
        case Parser::symbol_kind_type::S_MINUS:
        case Parser::symbol_kind_type::S_SLASH:
        case Parser::symbol_kind_type::S_PERCENT:
        case Parser::symbol_kind_type::S_TILDE:
        case Parser::symbol_kind_type::S_EQUALS:
        case Parser::symbol_kind_type::S_EQUALS_EQUALS:
        case Parser::symbol_kind_type::S_NOT_EQUALS:
        case Parser::symbol_kind_type::S_LESS:
        case Parser::symbol_kind_type::S_GREATER:
        case Parser::symbol_kind_type::S_LESS_EQUALS:
        case Parser::symbol_kind_type::S_GREATER_EQUALS:
        case Parser::symbol_kind_type::S_CONCAT:
        case Parser::symbol_kind_type::S_SHIFT_LEFT:
        case Parser::symbol_kind_type::S_SHIFT_RIGHT:
        case Parser::symbol_kind_type::S_AMPERSAND:
        case Parser::symbol_kind_type::S_PIPE:
            return proto::HighlightingTokenType::OPERATOR;
        default:
            return proto::HighlightingTokenType::NONE;
    }
}

/// Constructor
ScannedScript::ScannedScript(std::string text) : text_buffer(std::move(text)) {}

/// Collect syntax highlighting information
std::unique_ptr<proto::HighlightingT> ScannedScript::BuildHighlighting() const {
    std::vector<uint32_t> offsets;
    std::vector<proto::HighlightingTokenType> types;
    offsets.reserve(symbols.size() * 3 / 2);
    types.reserve(symbols.size() * 3 / 2);

    // Emit highlighting tokens at a location.
    // We emit 2 tokens at the begin and the end of every location and overwrite types if the offsets equal.
    auto emit = [&](proto::Location loc, proto::HighlightingTokenType type) {
        if (!offsets.empty() && offsets.back() == loc.offset()) {
            types.back() = type;
        } else {
            offsets.push_back(loc.offset());
            types.push_back(type);
        }
        offsets.push_back(loc.offset() + loc.length());
        types.push_back(proto::HighlightingTokenType::NONE);
    };

    size_t ci = 0;
    for (auto& symbol : symbols) {
        // Emit all comments in between
        while (ci < comments.size() && comments[ci].offset() < symbol.location.offset()) {
            emit(comments[ci++], proto::HighlightingTokenType::COMMENT);
        }
        if (symbol.kind() == Parser::symbol_kind_type::S_EOF) break;
        emit(symbol.location, MapToken(symbol.kind()));
    }
    for (; ci < comments.size(); ++ci) {
        emit(comments[ci], proto::HighlightingTokenType::COMMENT);
    }

    // Build the line breaks
    std::vector<uint32_t> breaks;
    breaks.reserve(line_breaks.size());
    size_t oi = 0;
    for (auto& lb : line_breaks) {
        while (oi < offsets.size() && offsets[oi] < lb.offset()) ++oi;
        breaks.push_back(oi);
    }

    auto hl = std::make_unique<proto::HighlightingT>();
    hl->token_offsets = std::move(offsets);
    hl->token_types = std::move(types);
    hl->token_breaks = std::move(breaks);
    return hl;
}

/// Constructor
ParsedScript::ParsedScript(std::shared_ptr<ScannedScript> scan, parser::ParseContext&& ctx)
    : scanned_script(std::move(scan)), nodes(std::move(ctx.nodes)), errors(std::move(ctx.errors)) {
    root_node_id = static_cast<NodeID>(nodes.size() - 1);
    auto& root = nodes[root_node_id];
    statements.reserve(root.children_count());
    for (uint32_t i = 0; i < root.children_count(); ++i) {
        statements.push_back(root.children_begin() + i);
    }
}

/// Get the root node
SyntaxNode ParsedScript::GetRootNode() const { return SyntaxNode{*this, root_node_id}; }

/// Find the deepest node covering a text offset
std::optional<NodeID> ParsedScript::FindNodeAtOffset(size_t text_offset, NodeID from) const {
    auto& start = nodes[from];
    auto start_begin = start.location().offset();
    if (text_offset < start_begin || text_offset > start_begin + start.location().length()) {
        return std::nullopt;
    }
    auto iter = from;
    while (true) {
        auto& node = nodes[iter];
        if (node.children_count() == 0) {
            break;
        }
        // A child containing the offset wins over a child ending at it.
        // Children may leave holes, a keyword does not have to be materialized.
        std::optional<NodeID> child_exact;
        std::optional<NodeID> child_end_plus_1;
        for (uint32_t i = 0; i < node.children_count(); ++i) {
            auto ci = node.children_begin() + i;
            auto node_begin = nodes[ci].location().offset();
            auto node_end = node_begin + nodes[ci].location().length();
            if (node_begin <= text_offset) {
                if (node_end > text_offset) {
                    child_exact = ci;
                } else if (node_end == text_offset) {
                    child_end_plus_1 = ci;
                }
            }
        }
        auto child = child_exact.has_value() ? child_exact : child_end_plus_1;
        if (!child.has_value()) {
            break;
        }
        iter = *child;
    }
    return iter;
}

/// Get the parent
std::optional<SyntaxNode> SyntaxNode::GetParent() const {
    auto parent = GetNode().parent();
    if (parent == NO_PARENT) return std::nullopt;
    return SyntaxNode{*script, parent};
}

/// Get the previous sibling
std::optional<SyntaxNode> SyntaxNode::GetPreviousSibling() const {
    auto parent = GetParent();
    if (!parent || parent->GetNode().children_begin() == node_id) return std::nullopt;
    return SyntaxNode{*script, node_id - 1};
}

/// Get the next sibling
std::optional<SyntaxNode> SyntaxNode::GetNextSibling() const {
    auto parent = GetParent();
    if (!parent) return std::nullopt;
    auto& p = parent->GetNode();
    if (node_id + 1 >= p.children_begin() + p.children_count()) return std::nullopt;
    return SyntaxNode{*script, node_id + 1};
}

/// Find the smallest covering node
SyntaxNode SyntaxNode::FindSmallestCovering(size_t text_offset) const {
    auto id = script->FindNodeAtOffset(text_offset, node_id);
    return SyntaxNode{*script, id.value_or(node_id)};
}

namespace {

struct NodeKindNames {
    /// The names, indexed by node type
    std::vector<std::string> names;
    /// The types by name
    ankerl::unordered_dense::map<std::string_view, proto::NodeType> types;

    NodeKindNames() {
        auto min = static_cast<size_t>(proto::NodeType::MIN);
        auto max = static_cast<size_t>(proto::NodeType::MAX);
        names.resize(max + 1);
        for (auto i = min; i <= max; ++i) {
            std::string name{proto::EnumNameNodeType(static_cast<proto::NodeType>(i))};
            for (auto& c : name) c = static_cast<char>(::tolower(c));
            names[i] = std::move(name);
        }
        for (auto i = min; i <= max; ++i) {
            types.insert({names[i], static_cast<proto::NodeType>(i)});
        }
    }
};

const NodeKindNames& GetNodeKindNames() {
    static const NodeKindNames kinds;
    return kinds;
}

}  // namespace

/// Get the kind name of a node type
std::string_view SyntaxNode::GetKindName(proto::NodeType type) {
    auto& names = GetNodeKindNames().names;
    auto i = static_cast<size_t>(type);
    return i < names.size() ? std::string_view{names[i]} : std::string_view{};
}

/// Resolve a kind name
std::optional<proto::NodeType> SyntaxNode::FindNodeType(std::string_view kind) {
    auto& types = GetNodeKindNames().types;
    if (auto iter = types.find(kind); iter != types.end()) {
        return iter->second;
    }
    return std::nullopt;
}

/// Constructor
Script::Script(Catalog& catalog) : catalog(catalog) {}

/// Replace the text
void Script::ReplaceText(std::string_view new_text) {
    text = new_text;
    scanned_script.reset();
    parsed_script.reset();
}

/// Scan the text
std::pair<ScannedScript*, proto::StatusCode> Script::Scan() {
    auto [scanned, status] = parser::Scanner::Scan(text);
    if (status != proto::StatusCode::OK) {
        return {nullptr, status};
    }
    scanned_script = std::move(scanned);
    return {scanned_script.get(), status};
}

/// Parse the latest scanned script
std::pair<ParsedScript*, proto::StatusCode> Script::Parse() {
    if (!scanned_script) {
        return {nullptr, proto::StatusCode::PARSER_INPUT_NOT_SCANNED};
    }
    auto [parsed, status] = parser::Parser::Parse(scanned_script);
    if (status != proto::StatusCode::OK) {
        return {nullptr, status};
    }
    parsed_script = std::move(parsed);
    return {parsed_script.get(), status};
}

/// Complete at a text offset
std::pair<std::unique_ptr<Completion>, proto::StatusCode> Script::CompleteAt(size_t text_offset) {
    // Text that cannot be scanned or parsed has no candidates
    if (auto [scanned, status] = Scan(); status != proto::StatusCode::OK) {
        spdlog::debug("[completion] scanner failed: {}", proto::EnumNameStatusCode(status));
        return {std::make_unique<Completion>(text_offset), proto::StatusCode::OK};
    }
    if (auto [parsed, status] = Parse(); status != proto::StatusCode::OK) {
        spdlog::debug("[completion] parser failed: {}", proto::EnumNameStatusCode(status));
        return {std::make_unique<Completion>(text_offset), proto::StatusCode::OK};
    }
    return Completion::Compute(*parsed_script, text_offset, catalog);
}

/// Get the inline hint
std::optional<std::string> Script::HintAt(size_t text_offset) {
    auto [completion, status] = CompleteAt(text_offset);
    if (status != proto::StatusCode::OK || !completion) {
        return std::nullopt;
    }
    return completion->GetHint();
}

}  // namespace sqlsh
