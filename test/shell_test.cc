#include "sqlsh/shell/shell.h"

#include <memory>
#include <sstream>
#include <string>

#include "gtest/gtest.h"
#include "sqlsh/engine/connection.h"
#include "sqlsh/proto/proto_generated.h"
#include "sqlsh/shell/functions.h"

using namespace sqlsh;
using namespace sqlsh::shell;

namespace {

struct ShellTest : public ::testing::Test {
    std::unique_ptr<engine::Connection> connection;
    std::stringstream out;
    std::unique_ptr<Shell> shell;

    void SetUp() override {
        auto [conn, status] = engine::Connection::Open(":memory:");
        ASSERT_EQ(status, proto::StatusCode::OK);
        connection = std::move(conn);
        ASSERT_EQ(RegisterFunctions(*connection), proto::StatusCode::OK);
        ASSERT_EQ(connection->Execute("CREATE TABLE users (id INTEGER, name TEXT);"
                                      "CREATE TABLE accounts (id INTEGER, user_id INTEGER);"
                                      "INSERT INTO users VALUES (1, 'alice'), (2, 'bob');"),
                  proto::StatusCode::OK);
        ShellOptions options;
        options.mode = OutputMode::SQL;
        options.color = false;
        shell = std::make_unique<Shell>(*connection, out, options);
    }

    /// Execute a line and return what was printed
    std::string Run(std::string_view line, proto::StatusCode expected_status = proto::StatusCode::OK) {
        out.str("");
        EXPECT_EQ(shell->Execute(line), expected_status) << line;
        return out.str();
    }
};

TEST_F(ShellTest, Tables) { EXPECT_EQ(Run(".tables"), "accounts\nusers\n"); }

TEST_F(ShellTest, Schema) {
    EXPECT_EQ(Run(".schema users"), "CREATE TABLE users (id INTEGER, name TEXT)\n");
    EXPECT_EQ(Run("  .schema   users  "), "CREATE TABLE users (id INTEGER, name TEXT)\n");
    EXPECT_EQ(Run("CREATE TABLE events (id INTEGER PRIMARY KEY, user_id INTEGER REFERENCES users(id), payload TEXT)"),
              "");
    EXPECT_EQ(Run(".schema events"),
              "CREATE TABLE events (\n"
              "  id INTEGER PRIMARY KEY,\n"
              "  user_id INTEGER REFERENCES users(id),\n"
              "  payload TEXT\n"
              ")\n");
    EXPECT_EQ(Run(".schema", proto::StatusCode::SHELL_COMMAND_INVALID), "Error: provide a table name\n");
    EXPECT_EQ(Run(".schema missing", proto::StatusCode::SHELL_COMMAND_INVALID),
              "Error: table missing does not exist\n");
}

TEST_F(ShellTest, Mode) {
    EXPECT_EQ(Run(".mode"), "sql\n");
    EXPECT_EQ(Run(".mode table"), "");
    EXPECT_EQ(shell->GetOutputMode(), OutputMode::Table);
    EXPECT_EQ(Run(".mode"), "table\n");
    EXPECT_EQ(Run(".mode csv", proto::StatusCode::SHELL_COMMAND_INVALID), "Error: unknown output mode csv\n");
    EXPECT_EQ(shell->GetOutputMode(), OutputMode::Table);
    EXPECT_EQ(Run(".mode null"), "");
    EXPECT_EQ(Run("SELECT * FROM users"), "");
}

TEST_F(ShellTest, UnknownCommand) {
    EXPECT_EQ(Run(".frobnicate now", proto::StatusCode::SHELL_COMMAND_INVALID), "Error: unknown command .frobnicate\n");
}

TEST_F(ShellTest, Help) {
    auto help = Run(".help");
    for (auto command : {".exit", ".help", ".mode", ".quit", ".schema", ".tables"}) {
        EXPECT_NE(help.find(command), std::string::npos) << command;
    }
}

TEST_F(ShellTest, Exit) {
    EXPECT_FALSE(shell->IsExitRequested());
    Run(".quit");
    EXPECT_TRUE(shell->IsExitRequested());
}

TEST_F(ShellTest, EmptyLine) {
    EXPECT_EQ(Run(""), "");
    EXPECT_EQ(Run("   \t"), "");
    EXPECT_EQ(Run(";;"), "");
    EXPECT_EQ(Run("-- just a comment"), "");
}

TEST_F(ShellTest, MultipleStatements) {
    auto have = Run("INSERT INTO users VALUES (3, 'carol'); SELECT name FROM users WHERE id = 3; SELECT 1 AS x");
    EXPECT_EQ(have, "INSERT INTO tbl VALUES('carol');\nINSERT INTO tbl VALUES(1);\n");
}

TEST_F(ShellTest, StatementsTheParserRejectsStillRun) {
    EXPECT_EQ(Run("REINDEX; SELECT 2 AS y"), "INSERT INTO tbl VALUES(2);\n");
}

TEST_F(ShellTest, FirstErrorStops) {
    auto have = Run("SELECT * FROM missing; SELECT 1", proto::StatusCode::ENGINE_PREPARE_FAILED);
    EXPECT_EQ(have, "Error: no such table: missing\n");
}

TEST_F(ShellTest, StepErrors) {
    auto have = Run("SELECT fmt_byte_size(id) FROM users; SELECT fmt_byte_size('x')",
                    proto::StatusCode::ENGINE_STEP_FAILED);
    EXPECT_EQ(have, "INSERT INTO tbl VALUES('1 B');\nINSERT INTO tbl VALUES('2 B');\n"
                    "Error: fmt_byte_size expects an integer\n");
}

TEST_F(ShellTest, BindParameters) {
    auto have = Run("SELECT ?", proto::StatusCode::ENGINE_BIND_PARAMETERS_REQUIRED);
    EXPECT_EQ(have, "Error: cannot run queries that require bind parameters\n");
    EXPECT_EQ(Run("SELECT 1 AS a; SELECT :name", proto::StatusCode::ENGINE_BIND_PARAMETERS_REQUIRED),
              "INSERT INTO tbl VALUES(1);\nError: cannot run queries that require bind parameters\n");
}

TEST_F(ShellTest, TableOutput) {
    Run(".mode table");
    auto have = Run("SELECT id, name FROM users ORDER BY id");
    auto expected = "┌────────────┐\n"
                    "│ id │ name  │\n"
                    "╞════════════╡\n"
                    "│ 1  │ alice │\n"
                    "│ 2  │ bob   │\n"
                    "└────────────┘\n";
    EXPECT_EQ(have, expected);
}

TEST_F(ShellTest, Complete) {
    auto [replace_from, candidates] = shell->Complete("SELECT * FROM u", 15);
    EXPECT_EQ(replace_from, 14);
    EXPECT_EQ(candidates, std::vector<std::string>{"users "});

    auto [none_from, none] = shell->Complete("SELECT * FROM users WHERE ", 26);
    EXPECT_TRUE(none.empty());
}

TEST_F(ShellTest, Hint) {
    EXPECT_EQ(shell->Hint("sel", 3), "ect ");
    EXPECT_EQ(shell->Hint("SELECT * FROM acc", 17), "ounts ");
    EXPECT_EQ(shell->Hint("xyz", 3), std::nullopt);
}

TEST_F(ShellTest, CompletionAfterExecution) {
    Run("CREATE TABLE orders (id INTEGER)");
    auto [replace_from, candidates] = shell->Complete("SELECT * FROM o", 15);
    EXPECT_EQ(candidates, std::vector<std::string>{"orders "});
}

}  // namespace
