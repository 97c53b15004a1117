#include "sqlsh/parser/parser.h"

#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "gtest/gtest.h"
#include "sqlsh/parser/scanner.h"
#include "sqlsh/proto/proto_generated.h"
#include "sqlsh/script.h"

using namespace sqlsh;

namespace {

std::shared_ptr<ParsedScript> parse(std::string_view text) {
    auto [scanned, scan_status] = parser::Scanner::Scan(text);
    EXPECT_EQ(scan_status, proto::StatusCode::OK);
    auto [parsed, parse_status] = parser::Parser::Parse(scanned);
    EXPECT_EQ(parse_status, proto::StatusCode::OK);
    return parsed;
}

/// Find the first node of a type in pre-order
std::optional<SyntaxNode> find_first(const SyntaxNode& node, proto::NodeType type) {
    if (node.GetNodeType() == type) return node;
    for (size_t i = 0; i < node.GetChildCount(); ++i) {
        if (auto found = find_first(node.GetChild(i), type); found.has_value()) return found;
    }
    return std::nullopt;
}

std::vector<proto::NodeType> child_types(const SyntaxNode& node) {
    std::vector<proto::NodeType> types;
    for (size_t i = 0; i < node.GetChildCount(); ++i) {
        types.push_back(node.GetChild(i).GetNodeType());
    }
    return types;
}

TEST(ParserTest, NotScanned) {
    auto [parsed, status] = parser::Parser::Parse(nullptr);
    EXPECT_EQ(parsed, nullptr);
    EXPECT_EQ(status, proto::StatusCode::PARSER_INPUT_NOT_SCANNED);
}

TEST(ParserTest, Empty) {
    auto parsed = parse("");
    auto root = parsed->GetRootNode();
    EXPECT_EQ(root.GetNodeType(), proto::NodeType::STATEMENT_LIST);
    EXPECT_EQ(root.GetChildCount(), 0);
    EXPECT_EQ(root.GetLocation().length(), 0);
    EXPECT_TRUE(parsed->statements.empty());
}

TEST(ParserTest, EmptyStatementsAreSkipped) {
    auto parsed = parse(" ; ;");
    EXPECT_EQ(parsed->GetRootNode().GetChildCount(), 0);
    EXPECT_EQ(parsed->GetRootNode().GetLocation().length(), 4);
}

TEST(ParserTest, SelectWithAlias) {
    auto parsed = parse("SELECT * FROM users AS u");
    auto root = parsed->GetRootNode();
    ASSERT_EQ(root.GetChildCount(), 1);
    auto statement = root.GetChild(0);
    EXPECT_EQ(statement.GetNodeType(), proto::NodeType::STATEMENT);
    EXPECT_EQ(statement.GetText(), "SELECT * FROM users AS u");
    ASSERT_EQ(statement.GetChildCount(), 1);
    EXPECT_EQ(statement.GetChild(0).GetNodeType(), proto::NodeType::SELECT_STATEMENT);

    auto core = find_first(root, proto::NodeType::SELECT_CORE);
    ASSERT_TRUE(core.has_value());
    std::vector<proto::NodeType> core_children{proto::NodeType::RESULT_COLUMN_LIST, proto::NodeType::FROM_CLAUSE};
    EXPECT_EQ(child_types(*core), core_children);

    auto table_ref = find_first(root, proto::NodeType::TABLE_REFERENCE);
    ASSERT_TRUE(table_ref.has_value());
    std::vector<proto::NodeType> ref_children{proto::NodeType::IDENTIFIER, proto::NodeType::TABLE_ALIAS};
    EXPECT_EQ(child_types(*table_ref), ref_children);
    EXPECT_EQ(table_ref->GetChild(0).GetText(), "users");
    EXPECT_EQ(table_ref->GetChild(1).GetText(), "AS u");
    EXPECT_EQ(table_ref->GetChild(1).GetChild(0).GetText(), "u");
    EXPECT_TRUE(parsed->errors.empty());
}

TEST(ParserTest, Navigation) {
    auto parsed = parse("SELECT * FROM users AS u");
    auto root = parsed->GetRootNode();
    EXPECT_EQ(root.GetKind(), "statement_list");
    EXPECT_FALSE(root.GetParent().has_value());

    auto name = root.FindSmallestCovering(16);
    EXPECT_EQ(name.GetKind(), "identifier");
    EXPECT_EQ(name.GetByteRange(), (std::pair<size_t, size_t>{14, 19}));
    EXPECT_FALSE(name.GetPreviousSibling().has_value());
    auto alias = name.GetNextSibling();
    ASSERT_TRUE(alias.has_value());
    EXPECT_EQ(alias->GetKind(), "table_alias");
    EXPECT_FALSE(alias->GetNextSibling().has_value());
    EXPECT_EQ(alias->GetPreviousSibling(), name);
    EXPECT_EQ(name.GetParent()->GetKind(), "table_reference");

    // A node ending at the offset is found when no node contains it
    EXPECT_EQ(root.FindSmallestCovering(19), name);
    EXPECT_EQ(root.FindSmallestCovering(24).GetText(), "u");
}

TEST(ParserTest, QualifiedTableName) {
    auto parsed = parse("SELECT 1 FROM main.users");
    auto table_ref = find_first(parsed->GetRootNode(), proto::NodeType::TABLE_REFERENCE);
    ASSERT_TRUE(table_ref.has_value());
    std::vector<proto::NodeType> ref_children{proto::NodeType::SCHEMA_NAME, proto::NodeType::IDENTIFIER};
    EXPECT_EQ(child_types(*table_ref), ref_children);
    EXPECT_EQ(table_ref->GetChild(0).GetText(), "main");
    EXPECT_EQ(table_ref->GetChild(1).GetText(), "users");
}

TEST(ParserTest, CommonTableExpressions) {
    auto parsed = parse("WITH RECURSIVE a(x) AS (SELECT 1) SELECT * FROM a");
    auto with = find_first(parsed->GetRootNode(), proto::NodeType::WITH_CLAUSE);
    ASSERT_TRUE(with.has_value());
    std::vector<proto::NodeType> with_children{proto::NodeType::RECURSIVE_MODIFIER,
                                               proto::NodeType::COMMON_TABLE_EXPRESSION};
    EXPECT_EQ(child_types(*with), with_children);
    auto cte = with->GetChild(1);
    std::vector<proto::NodeType> cte_children{proto::NodeType::IDENTIFIER, proto::NodeType::COLUMN_NAME_LIST,
                                              proto::NodeType::SELECT_STATEMENT};
    EXPECT_EQ(child_types(cte), cte_children);
    EXPECT_EQ(cte.GetText(), "a(x) AS (SELECT 1)");
    EXPECT_EQ(cte.GetChild(2).GetText(), "SELECT 1");
}

TEST(ParserTest, MultipleStatements) {
    auto parsed = parse("SELECT 1; SELECT 2;");
    auto root = parsed->GetRootNode();
    ASSERT_EQ(root.GetChildCount(), 2);
    EXPECT_EQ(root.GetChild(0).GetText(), "SELECT 1");
    EXPECT_EQ(root.GetChild(1).GetText(), "SELECT 2");
    EXPECT_EQ(parsed->statements.size(), 2);
    EXPECT_EQ(root.GetLocation().offset(), 0);
    EXPECT_EQ(root.GetLocation().length(), 19);
}

TEST(ParserTest, ErrorsCoverTheStatement) {
    auto parsed = parse("SELECT 1; FOO BAR; SELECT 2");
    auto root = parsed->GetRootNode();
    std::vector<proto::NodeType> statements{proto::NodeType::STATEMENT, proto::NodeType::ERROR,
                                            proto::NodeType::STATEMENT};
    ASSERT_EQ(child_types(root), statements);
    EXPECT_EQ(root.GetChild(1).GetText(), "FOO BAR");
    EXPECT_EQ(root.GetChild(1).GetChildCount(), 0);
    EXPECT_FALSE(parsed->errors.empty());
}

TEST(ParserTest, IncompleteKeyword) {
    auto parsed = parse("SEL");
    auto root = parsed->GetRootNode();
    ASSERT_EQ(root.GetChildCount(), 1);
    EXPECT_EQ(root.GetChild(0).GetNodeType(), proto::NodeType::ERROR);
    EXPECT_EQ(root.GetChild(0).GetText(), "SEL");
}

TEST(ParserTest, MissingTableAtEnd) {
    auto parsed = parse("SELECT * FROM ");
    auto table_ref = find_first(parsed->GetRootNode(), proto::NodeType::TABLE_REFERENCE);
    ASSERT_TRUE(table_ref.has_value());
    ASSERT_EQ(table_ref->GetChildCount(), 1);
    auto name = table_ref->GetChild(0);
    EXPECT_EQ(name.GetNodeType(), proto::NodeType::IDENTIFIER);
    EXPECT_EQ(name.GetLocation().offset(), 14);
    EXPECT_EQ(name.GetLocation().length(), 0);
}

TEST(ParserTest, MissingTableBeforeNextToken) {
    auto parsed = parse("SELECT * FROM  WHERE a = 1");
    auto table_ref = find_first(parsed->GetRootNode(), proto::NodeType::TABLE_REFERENCE);
    ASSERT_TRUE(table_ref.has_value());
    auto name = table_ref->GetChild(0);
    EXPECT_EQ(name.GetLocation().offset(), 15);
    EXPECT_EQ(name.GetLocation().length(), 0);
    EXPECT_TRUE(find_first(parsed->GetRootNode(), proto::NodeType::WHERE_CLAUSE).has_value());
}

TEST(ParserTest, MissingWhereExpression) {
    auto parsed = parse("SELECT * FROM t WHERE ");
    auto where = find_first(parsed->GetRootNode(), proto::NodeType::WHERE_CLAUSE);
    ASSERT_TRUE(where.has_value());
    ASSERT_EQ(where->GetChildCount(), 1);
    auto column = where->GetChild(0);
    EXPECT_EQ(column.GetNodeType(), proto::NodeType::COLUMN_REFERENCE);
    ASSERT_EQ(column.GetChildCount(), 1);
    EXPECT_EQ(column.GetChild(0).GetLocation().offset(), 22);
    EXPECT_EQ(column.GetChild(0).GetLocation().length(), 0);
}

TEST(ParserTest, UnreservedKeywordsAsNames) {
    auto parsed = parse("SELECT key FROM plan");
    auto table_ref = find_first(parsed->GetRootNode(), proto::NodeType::TABLE_REFERENCE);
    ASSERT_TRUE(table_ref.has_value());
    EXPECT_EQ(table_ref->GetChild(0).GetText(), "plan");
}

TEST(ParserTest, OtherStatements) {
    std::vector<std::pair<std::string_view, proto::NodeType>> cases{
        {"INSERT INTO t VALUES (1, 'a')", proto::NodeType::INSERT_STATEMENT},
        {"UPDATE t SET a = 1 WHERE b = 2", proto::NodeType::UPDATE_STATEMENT},
        {"DELETE FROM t WHERE a IS NOT NULL", proto::NodeType::DELETE_STATEMENT},
        {"CREATE TABLE t (a INTEGER PRIMARY KEY, b TEXT NOT NULL)", proto::NodeType::CREATE_TABLE_STATEMENT},
        {"DROP TABLE IF EXISTS t", proto::NodeType::DROP_STATEMENT},
        {"PRAGMA table_info(t)", proto::NodeType::PRAGMA_STATEMENT},
        {"BEGIN", proto::NodeType::TRANSACTION_STATEMENT},
        {"EXPLAIN QUERY PLAN SELECT 1", proto::NodeType::EXPLAIN_STATEMENT},
    };
    for (auto& [text, type] : cases) {
        auto parsed = parse(text);
        auto root = parsed->GetRootNode();
        ASSERT_EQ(root.GetChildCount(), 1) << text;
        auto statement = root.GetChild(0);
        ASSERT_EQ(statement.GetNodeType(), proto::NodeType::STATEMENT) << text;
        EXPECT_EQ(statement.GetChild(0).GetNodeType(), type) << text;
    }
}

}  // namespace
