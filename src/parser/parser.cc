#include "sqlsh/parser/parser.h"

#include "sqlsh/parser/parse_context.h"
#include "sqlsh/script.h"

namespace sqlsh {
namespace parser {

/// Report a syntax error
void ParserBase::error(const location_type& loc, const std::string& message) { ctx.AddError(loc, message); }

/// Parse a scanned script
std::pair<std::shared_ptr<ParsedScript>, proto::StatusCode> Parser::Parse(std::shared_ptr<ScannedScript> in) {
    if (!in) {
        return {nullptr, proto::StatusCode::PARSER_INPUT_NOT_SCANNED};
    }
    ParseContext ctx{*in};

    // Every semicolon ends a statement, empty statements are skipped
    auto& symbols = in->symbols;
    size_t begin = 0;
    for (size_t i = 0; i < symbols.size(); ++i) {
        auto kind = symbols[i].kind();
        if (kind != symbol_kind::S_SEMICOLON && kind != symbol_kind::S_EOF) {
            continue;
        }
        if (i > begin) {
            ctx.ParseStatement(begin, i);
        }
        begin = i + 1;
    }
    ctx.AddRoot();
    return {std::make_shared<ParsedScript>(std::move(in), std::move(ctx)), proto::StatusCode::OK};
}

}  // namespace parser
}  // namespace sqlsh
