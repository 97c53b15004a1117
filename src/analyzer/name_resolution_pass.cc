#include "sqlsh/analyzer/name_resolution_pass.h"

#include <optional>

#include "spdlog/spdlog.h"
#include "sqlsh/analyzer/syntax_query.h"
#include "sqlsh/catalog.h"

namespace sqlsh {

namespace {

const SyntaxQuery& GetCTEQuery() {
    static const auto query =
        SyntaxQuery::Compile("(with_clause (common_table_expression (identifier) @name (select_statement) @body) @cte)")
            .first;
    return *query;
}

const SyntaxQuery& GetAliasQuery() {
    static const auto query =
        SyntaxQuery::Compile("(table_reference (identifier) @table (table_alias (identifier) @alias))").first;
    return *query;
}

/// Get the explicit column names of a CTE, if any
std::optional<std::vector<std::string>> ReadColumnNameList(const SyntaxNode& cte) {
    for (size_t i = 0; i < cte.GetChildCount(); ++i) {
        auto child = cte.GetChild(i);
        if (child.GetNodeType() != proto::NodeType::COLUMN_NAME_LIST) continue;
        std::vector<std::string> columns;
        columns.reserve(child.GetChildCount());
        for (size_t j = 0; j < child.GetChildCount(); ++j) {
            columns.emplace_back(child.GetChild(j).GetText());
        }
        return columns;
    }
    return std::nullopt;
}

}  // namespace

/// Constructor
NameResolutionPass::NameResolutionPass(Catalog& catalog) : catalog(catalog) {}

/// Resolve the CTE columns.
/// Every CTE body is planned together with the definitions before it in the same WITH clause.
void NameResolutionPass::ResolveCTEs(const SyntaxNode& statement, QueryNames& names) {
    auto& script = statement.GetScript();
    std::optional<NodeID> current_with;
    std::vector<std::string_view> definitions;
    std::string fragment;

    for (auto& match : GetCTEQuery().Match(statement)) {
        auto name_id = match.GetCapture("name");
        auto body_id = match.GetCapture("body");
        auto cte_id = match.GetCapture("cte");
        if (!name_id || !body_id || !cte_id) continue;

        // Start over for every WITH clause
        if (current_with != match.node_id) {
            current_with = match.node_id;
            definitions.clear();
        }
        SyntaxNode with_clause{script, match.node_id};
        SyntaxNode name{script, *name_id};
        SyntaxNode body{script, *body_id};
        SyntaxNode cte{script, *cte_id};

        std::vector<std::string> columns;
        if (auto explicit_columns = ReadColumnNameList(cte); explicit_columns.has_value()) {
            columns = std::move(*explicit_columns);
        } else {
            fragment.clear();
            if (!definitions.empty()) {
                fragment += "WITH ";
                if (with_clause.GetChildCount() > 0 &&
                    with_clause.GetChild(0).GetNodeType() == proto::NodeType::RECURSIVE_MODIFIER) {
                    fragment += "RECURSIVE ";
                }
                for (size_t i = 0; i < definitions.size(); ++i) {
                    if (i > 0) fragment += ", ";
                    fragment += definitions[i];
                }
                fragment += " ";
            }
            fragment += body.GetText();

            auto [planned, status] = catalog.PlanColumns(fragment);
            if (status == proto::StatusCode::OK) {
                columns = std::move(planned);
            } else {
                spdlog::debug("[names] cte '{}' has no columns: {}", name.GetText(), proto::EnumNameStatusCode(status));
            }
        }
        definitions.push_back(cte.GetText());

        // The first definition of a name wins
        std::string cte_name{name.GetText()};
        if (names.ctes.find(cte_name) == names.ctes.end()) {
            names.ctes.insert({std::move(cte_name), std::move(columns)});
        }
    }
}

/// Resolve the table aliases
void NameResolutionPass::ResolveAliases(const SyntaxNode& statement, QueryNames& names) {
    auto& script = statement.GetScript();
    for (auto& match : GetAliasQuery().Match(statement)) {
        auto table_id = match.GetCapture("table");
        auto alias_id = match.GetCapture("alias");
        if (!table_id || !alias_id) continue;
        SyntaxNode table{script, *table_id};
        SyntaxNode alias{script, *alias_id};
        // Missing names have no text
        if (table.GetLocation().length() == 0 || alias.GetLocation().length() == 0) continue;
        // Qualified names keep their schema
        auto [table_begin, table_end] = table.GetByteRange();
        if (auto schema = table.GetPreviousSibling();
            schema.has_value() && schema->GetNodeType() == proto::NodeType::SCHEMA_NAME) {
            table_begin = schema->GetByteRange().first;
        }
        auto table_text = script.GetText().substr(table_begin, table_end - table_begin);
        // The last target of an alias wins
        names.aliases[std::string{alias.GetText()}] = std::string{table_text};
    }
}

/// Resolve the names of a statement
QueryNames NameResolutionPass::Resolve(const SyntaxNode& statement) {
    QueryNames names;
    ResolveCTEs(statement, names);
    ResolveAliases(statement, names);
    return names;
}

}  // namespace sqlsh
