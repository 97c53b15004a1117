#include "sqlsh/shell/output.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

#include "fmt/color.h"
#include "gtest/gtest.h"
#include "sqlsh/engine/connection.h"
#include "sqlsh/proto/proto_generated.h"

using namespace sqlsh;
using namespace sqlsh::shell;

namespace {

struct OutputTest : public ::testing::Test {
    std::unique_ptr<engine::Connection> connection;

    void SetUp() override {
        auto [conn, status] = engine::Connection::Open(":memory:");
        ASSERT_EQ(status, proto::StatusCode::OK);
        connection = std::move(conn);
    }

    /// Run a query through an output
    std::string Render(OutputMode mode, std::string_view query, Pager pager = {}) {
        std::stringstream out;
        auto [stmt, status] = connection->Prepare(query);
        EXPECT_EQ(status, proto::StatusCode::OK);
        auto output = RowOutput::Create(mode, *stmt, out, false, std::move(pager));
        while (true) {
            auto [has_row, step_status] = stmt->Step();
            EXPECT_EQ(step_status, proto::StatusCode::OK);
            if (!has_row || step_status != proto::StatusCode::OK) break;
            output->AddRow(*stmt);
        }
        output->Finish();
        return out.str();
    }
};

TEST_F(OutputTest, ModeNames) {
    EXPECT_EQ(ParseOutputMode("null"), OutputMode::Null);
    EXPECT_EQ(ParseOutputMode("table"), OutputMode::Table);
    EXPECT_EQ(ParseOutputMode("sql"), OutputMode::SQL);
    EXPECT_EQ(ParseOutputMode("csv"), std::nullopt);
    EXPECT_EQ(ParseOutputMode("TABLE"), std::nullopt);
    EXPECT_EQ(GetOutputModeName(OutputMode::SQL), "sql");
}

TEST_F(OutputTest, Table) {
    auto have = Render(OutputMode::Table, "SELECT 1 AS id, 'alice' AS name, NULL AS n");
    auto expected = "┌───────────────────┐\n"
                    "│ id │ name  │ n    │\n"
                    "╞═══════════════════╡\n"
                    "│ 1  │ alice │ NULL │\n"
                    "└───────────────────┘\n";
    EXPECT_EQ(have, expected);
}

TEST_F(OutputTest, TableBlobsAndFloats) {
    auto have = Render(OutputMode::Table, "SELECT x'00ff' AS b, 2.5 AS f");
    auto expected = "┌─────────────┐\n"
                    "│ b     │ f   │\n"
                    "╞═════════════╡\n"
                    "│ 00 ff │ 2.5 │\n"
                    "└─────────────┘\n";
    EXPECT_EQ(have, expected);
}

TEST_F(OutputTest, TableCountsCodePoints) {
    auto have = Render(OutputMode::Table, "SELECT 'héllo' AS w");
    auto expected = "┌───────┐\n"
                    "│ w     │\n"
                    "╞═══════╡\n"
                    "│ héllo │\n"
                    "└───────┘\n";
    EXPECT_EQ(have, expected);
}

TEST_F(OutputTest, TableWithoutRows) {
    auto have = Render(OutputMode::Table, "SELECT 1 AS a WHERE 0");
    auto expected = "┌───┐\n"
                    "│ a │\n"
                    "╞═══╡\n"
                    "└───┘\n";
    EXPECT_EQ(have, expected);
}

TEST_F(OutputTest, TableWithoutColumns) {
    EXPECT_EQ(Render(OutputMode::Table, "CREATE TABLE t (a INTEGER)"), "");
}

TEST_F(OutputTest, LongTablesArePaged) {
    auto paged_file = std::filesystem::path{::testing::TempDir()} / "sqlsh_pager_output.txt";
    std::filesystem::remove(paged_file);
    Pager pager{"cat > '" + paged_file.string() + "'", 2};
    auto query = "SELECT 1 AS a UNION ALL SELECT 2 UNION ALL SELECT 3";
    auto expected = "┌───┐\n"
                    "│ a │\n"
                    "╞═══╡\n"
                    "│ 1 │\n"
                    "│ 2 │\n"
                    "│ 3 │\n"
                    "└───┘\n";

    EXPECT_EQ(Render(OutputMode::Table, query, pager), "");
    std::ifstream in{paged_file};
    std::string paged{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    EXPECT_EQ(paged, expected);
    std::filesystem::remove(paged_file);

    // Up to the threshold the table is printed directly
    pager.row_threshold = 3;
    EXPECT_EQ(Render(OutputMode::Table, query, pager), expected);
    EXPECT_FALSE(std::filesystem::exists(paged_file));
}

TEST_F(OutputTest, EmptyPagerPrintsDirectly) {
    Pager pager{"", 0};
    auto have = Render(OutputMode::Table, "SELECT 1 AS a", pager);
    EXPECT_EQ(have, "┌───┐\n│ a │\n╞═══╡\n│ 1 │\n└───┘\n");
}

TEST_F(OutputTest, SQL) {
    auto have = Render(OutputMode::SQL, "SELECT 1, 'it''s', NULL, x'00ff', 2.5 UNION ALL SELECT 2, 'b', 3, x'', 0.5");
    auto expected = "INSERT INTO tbl VALUES(1, 'it''s', NULL, X'00ff', 2.5);\n"
                    "INSERT INTO tbl VALUES(2, 'b', 3, X'', 0.5);\n";
    EXPECT_EQ(have, expected);
}

TEST_F(OutputTest, Null) {
    EXPECT_EQ(Render(OutputMode::Null, "SELECT 1 UNION ALL SELECT 2"), "");
}

TEST_F(OutputTest, ColoredTable) {
    std::stringstream out;
    auto [stmt, status] = connection->Prepare("SELECT NULL AS n");
    ASSERT_EQ(status, proto::StatusCode::OK);
    TableOutput output{*stmt, out, true};
    ASSERT_TRUE(stmt->Step().first);
    output.AddRow(*stmt);
    output.Finish();
    auto grey = fmt::fg(fmt::terminal_color::bright_black);
    auto grey_null = fmt::format("{}", fmt::styled(std::string_view{"NULL"}, grey));
    EXPECT_NE(out.str().find("│ " + grey_null + " │"), std::string::npos) << out.str();
}

}  // namespace
