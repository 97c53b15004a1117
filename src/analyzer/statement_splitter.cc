#include "sqlsh/analyzer/statement_splitter.h"

#include "sqlsh/analyzer/syntax_query.h"

namespace sqlsh {

static const SyntaxQuery& GetStatementQuery() {
    static const auto query = SyntaxQuery::Compile("(statement_list (_) @statement)").first;
    return *query;
}

/// Split a script into statements
std::vector<SyntaxNode> StatementSplitter::Split(const ParsedScript& parsed) {
    std::vector<SyntaxNode> statements;
    for (auto& match : GetStatementQuery().Match(parsed.GetRootNode())) {
        if (auto node = match.GetCapture("statement"); node.has_value()) {
            statements.emplace_back(parsed, *node);
        }
    }
    return statements;
}

}  // namespace sqlsh
