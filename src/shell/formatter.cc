#include "sqlsh/shell/formatter.h"

#include <vector>

#include "sqlsh/parser/parser.h"
#include "sqlsh/parser/scanner.h"
#include "sqlsh/script.h"

namespace sqlsh {
namespace shell {

namespace {

using SymbolKind = parser::Parser::symbol_kind_type;

struct Token {
    /// The text
    std::string_view text;
    /// The symbol kind
    SymbolKind kind;
    /// Was the token separated from its predecessor?
    bool space_before;
};

}  // namespace

/// Format SQL text
std::string FormatSQL(std::string_view text) {
    auto [scanned, status] = parser::Scanner::Scan(text);
    if (status != proto::StatusCode::OK || !scanned->errors.empty() || !scanned->comments.empty()) {
        return std::string{text};
    }

    // Collect the tokens and the inline width up to every token
    std::vector<Token> tokens;
    std::vector<size_t> widths{0};
    size_t prev_end = 0;
    for (auto& symbol : scanned->GetSymbols()) {
        if (symbol.kind() == SymbolKind::S_EOF) break;
        auto loc = symbol.location;
        Token token{scanned->ReadTextAtLocation(loc), symbol.kind(), !tokens.empty() && loc.offset() > prev_end};
        widths.push_back(widths.back() + token.text.size() + (token.space_before ? 1 : 0));
        tokens.push_back(token);
        prev_end = loc.offset() + loc.length();
    }

    // Mark the parentheses of groups that are too long for a single line
    std::vector<bool> broken(tokens.size(), false);
    std::vector<size_t> open;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind == SymbolKind::S_LPAREN) {
            open.push_back(i);
        } else if (tokens[i].kind == SymbolKind::S_RPAREN && !open.empty()) {
            auto begin = open.back();
            open.pop_back();
            auto width = widths[i + 1] - widths[begin] - (tokens[begin].space_before ? 1 : 0);
            if (width > FORMAT_INLINE_MAX_LENGTH) {
                broken[begin] = true;
                broken[i] = true;
            }
        }
    }

    std::string out;
    out.reserve(text.size());
    size_t depth = 0;
    std::vector<bool> groups;
    bool line_start = true;
    auto new_line = [&]() {
        while (!out.empty() && out.back() == ' ') out.pop_back();
        out += '\n';
        for (size_t d = 0; d < depth; ++d) out += FORMAT_INDENT;
        line_start = true;
    };
    for (size_t i = 0; i < tokens.size(); ++i) {
        auto& token = tokens[i];
        if (token.kind == SymbolKind::S_RPAREN && broken[i]) {
            --depth;
            new_line();
        }
        if (!line_start && token.space_before) {
            out += ' ';
        }
        out += token.text;
        line_start = false;

        switch (token.kind) {
            case SymbolKind::S_LPAREN:
                groups.push_back(broken[i]);
                if (broken[i]) {
                    ++depth;
                    new_line();
                }
                break;
            case SymbolKind::S_RPAREN:
                if (!groups.empty()) groups.pop_back();
                break;
            case SymbolKind::S_COMMA:
                if (!groups.empty() && groups.back()) new_line();
                break;
            default:
                break;
        }
    }
    return out;
}

}  // namespace shell
}  // namespace sqlsh
