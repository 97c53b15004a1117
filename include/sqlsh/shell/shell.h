#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sqlsh/catalog.h"
#include "sqlsh/proto/proto_generated.h"
#include "sqlsh/script.h"
#include "sqlsh/shell/output.h"

namespace sqlsh {
namespace engine {
class Connection;
}  // namespace engine

namespace shell {

struct ShellOptions {
    /// The initial output mode
    OutputMode mode = OutputMode::Table;
    /// Use terminal colors?
    bool color = true;
    /// The pager command for long tables, empty prints everything directly
    std::string pager;
};

class Shell {
   public:
    /// The prompt
    static constexpr std::string_view PROMPT = ">> ";

   protected:
    /// The connection
    engine::Connection& connection;
    /// The catalog of the connection
    SQLiteCatalog catalog;
    /// The script used for completion and execution
    Script script;
    /// The output stream
    std::ostream& out;
    /// The output mode
    OutputMode mode;
    /// Use terminal colors?
    bool color;
    /// The pager for long tables
    Pager pager;
    /// Did the user ask to leave?
    bool exit_requested = false;

    /// Print an error and return the status
    proto::StatusCode ReportError(proto::StatusCode status, std::string_view message);
    /// Run a dot command
    proto::StatusCode ExecuteCommand(std::string_view command, std::string_view argument);
    /// List the tables
    proto::StatusCode ExecuteTables();
    /// Print the schema of a table
    proto::StatusCode ExecuteSchema(std::string_view table_name);
    /// Switch the output mode
    proto::StatusCode ExecuteMode(std::string_view mode_name);
    /// Print the commands
    proto::StatusCode ExecuteHelp();
    /// Run all statements of a SQL text
    proto::StatusCode ExecuteSQL(std::string_view text);

   public:
    /// Constructor
    Shell(engine::Connection& connection, std::ostream& out, ShellOptions options = {});

    /// Get the output mode
    OutputMode GetOutputMode() const { return mode; }
    /// Did the user ask to leave?
    bool IsExitRequested() const { return exit_requested; }

    /// Execute an input line, either a dot command or SQL
    proto::StatusCode Execute(std::string_view line);
    /// Complete a line at a cursor, returns the replacement start and the candidates
    std::pair<size_t, std::vector<std::string>> Complete(std::string_view line, size_t cursor);
    /// Get the inline hint for a line at a cursor
    std::optional<std::string> Hint(std::string_view line, size_t cursor);
    /// Read lines with readline until the input ends, the history is loaded from and saved to a file
    void Run(const std::string& history_file);
};

}  // namespace shell
}  // namespace sqlsh
