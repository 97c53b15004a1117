#include "sqlsh/shell/shell.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <readline/history.h>
#include <readline/readline.h>

#include "fmt/color.h"
#include "fmt/format.h"
#include "fmt/ostream.h"
#include "spdlog/spdlog.h"
#include "sqlsh/analyzer/completion.h"
#include "sqlsh/analyzer/statement_splitter.h"
#include "sqlsh/engine/connection.h"
#include "sqlsh/shell/formatter.h"
#include "sqlsh/shell/highlighter.h"

namespace sqlsh {
namespace shell {

namespace {

constexpr std::string_view SCHEMA_QUERY = "SELECT sql FROM sqlite_schema WHERE type = 'table' AND name = ?";

constexpr std::string_view HELP_TEXT =
    ".exit                  Leave the shell\n"
    ".help                  Show this message\n"
    ".mode [null|table|sql] Show or set the output mode\n"
    ".quit                  Leave the shell\n"
    ".schema TABLE          Show the CREATE statement of a table\n"
    ".tables                List the tables\n";

std::string_view Trim(std::string_view text) {
    constexpr std::string_view SPACE = " \t\r\n\f\v";
    auto begin = text.find_first_not_of(SPACE);
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(SPACE);
    return text.substr(begin, end - begin + 1);
}

/// The shell that receives the readline callbacks
Shell* ACTIVE_SHELL = nullptr;
/// The matches of the running completion
std::vector<std::string> PENDING_MATCHES;

char* CompletionGenerator(const char*, int state) {
    auto idx = static_cast<size_t>(state);
    if (idx >= PENDING_MATCHES.size()) return nullptr;
    return strdup(PENDING_MATCHES[idx].c_str());
}

char** AttemptCompletion(const char*, int start, int end) {
    rl_attempted_completion_over = 1;
    rl_completion_suppress_append = 1;
    PENDING_MATCHES.clear();
    if (!ACTIVE_SHELL) return nullptr;

    std::string_view line{rl_line_buffer, static_cast<size_t>(rl_end)};
    auto [replace_from, candidates] = ACTIVE_SHELL->Complete(line, static_cast<size_t>(end));
    if (candidates.empty()) return nullptr;

    // Readline replaces the word [start, end), the candidates replace [replace_from, cursor)
    auto word_start = static_cast<size_t>(start);
    for (auto& candidate : candidates) {
        if (replace_from <= word_start) {
            auto skip = word_start - replace_from;
            if (skip <= candidate.size()) PENDING_MATCHES.push_back(candidate.substr(skip));
        } else {
            PENDING_MATCHES.push_back(std::string{line.substr(word_start, replace_from - word_start)} + candidate);
        }
    }
    return rl_completion_matches("", CompletionGenerator);
}

/// Redraw the line and show the hint after the cursor
void RedisplayWithHint() {
    rl_redisplay();
    if (!ACTIVE_SHELL || rl_point != rl_end) return;
    // Clear a stale hint
    std::fputs("\033[K", rl_outstream);
    if (rl_end == 0) return;
    std::string_view line{rl_line_buffer, static_cast<size_t>(rl_end)};
    auto hint = ACTIVE_SHELL->Hint(line, static_cast<size_t>(rl_point));
    if (hint.has_value() && !hint->empty()) {
        fmt::print(rl_outstream, "{}\033[{}D", fmt::styled(*hint, fmt::emphasis::faint), hint->size());
    }
    std::fflush(rl_outstream);
}

/// Accept the line without leaving the hint behind
int AcceptLine(int count, int key) {
    if (rl_point == rl_end) {
        std::fputs("\033[K", rl_outstream);
    }
    return rl_newline(count, key);
}

}  // namespace

/// Constructor
Shell::Shell(engine::Connection& connection, std::ostream& out, ShellOptions options)
    : connection(connection),
      catalog(connection),
      script(catalog),
      out(out),
      mode(options.mode),
      color(options.color),
      pager{std::move(options.pager)} {}

/// Report an error
proto::StatusCode Shell::ReportError(proto::StatusCode status, std::string_view message) {
    fmt::print(out, "Error: {}\n", message);
    return status;
}

/// List the tables
proto::StatusCode Shell::ExecuteTables() {
    auto [tables, status] = catalog.ListTables();
    if (status != proto::StatusCode::OK) {
        return ReportError(status, connection.GetLastError());
    }
    for (auto& table : tables) {
        fmt::print(out, "{}\n", table);
    }
    return proto::StatusCode::OK;
}

/// Print the schema of a table
proto::StatusCode Shell::ExecuteSchema(std::string_view table_name) {
    if (table_name.empty()) {
        return ReportError(proto::StatusCode::SHELL_COMMAND_INVALID, "provide a table name");
    }
    auto [stmt, status] = connection.Prepare(SCHEMA_QUERY);
    if (status != proto::StatusCode::OK) {
        return ReportError(status, connection.GetLastError());
    }
    if (auto bind_status = stmt->BindText(1, table_name); bind_status != proto::StatusCode::OK) {
        return ReportError(bind_status, connection.GetLastError());
    }
    auto [has_row, step_status] = stmt->Step();
    if (step_status != proto::StatusCode::OK) {
        return ReportError(step_status, connection.GetLastError());
    }
    if (!has_row) {
        return ReportError(proto::StatusCode::SHELL_COMMAND_INVALID, fmt::format("table {} does not exist", table_name));
    }
    auto sql = FormatSQL(stmt->ColumnText(0));
    fmt::print(out, "{}\n", color ? HighlightSQL(sql) : sql);
    return proto::StatusCode::OK;
}

/// Switch the output mode
proto::StatusCode Shell::ExecuteMode(std::string_view mode_name) {
    if (mode_name.empty()) {
        fmt::print(out, "{}\n", GetOutputModeName(mode));
        return proto::StatusCode::OK;
    }
    auto parsed = ParseOutputMode(mode_name);
    if (!parsed.has_value()) {
        return ReportError(proto::StatusCode::SHELL_COMMAND_INVALID, fmt::format("unknown output mode {}", mode_name));
    }
    mode = *parsed;
    return proto::StatusCode::OK;
}

/// Print the commands
proto::StatusCode Shell::ExecuteHelp() {
    fmt::print(out, "{}", HELP_TEXT);
    return proto::StatusCode::OK;
}

/// Run a dot command
proto::StatusCode Shell::ExecuteCommand(std::string_view command, std::string_view argument) {
    if (command == ".tables") return ExecuteTables();
    if (command == ".schema") return ExecuteSchema(argument);
    if (command == ".mode") return ExecuteMode(argument);
    if (command == ".help") return ExecuteHelp();
    if (command == ".quit" || command == ".exit") {
        exit_requested = true;
        return proto::StatusCode::OK;
    }
    return ReportError(proto::StatusCode::SHELL_COMMAND_INVALID, fmt::format("unknown command {}", command));
}

/// Run all statements of a SQL text
proto::StatusCode Shell::ExecuteSQL(std::string_view text) {
    script.ReplaceText(text);
    if (auto [scanned, status] = script.Scan(); status != proto::StatusCode::OK) {
        return ReportError(status, proto::EnumNameStatusCode(status));
    }
    auto [parsed, status] = script.Parse();
    if (status != proto::StatusCode::OK) {
        return ReportError(status, proto::EnumNameStatusCode(status));
    }
    // The engine decides whether a statement is valid, statements that we could not parse are run as well
    for (auto& statement : StatementSplitter::Split(*parsed)) {
        auto [stmt, prepare_status] = connection.Prepare(statement.GetText());
        if (prepare_status != proto::StatusCode::OK) {
            return ReportError(prepare_status, connection.GetLastError());
        }
        if (stmt->Handle() == nullptr) {
            continue;
        }
        if (stmt->BoundParameterCount() > 0) {
            return ReportError(proto::StatusCode::ENGINE_BIND_PARAMETERS_REQUIRED,
                               "cannot run queries that require bind parameters");
        }
        auto output = RowOutput::Create(mode, *stmt, out, color, pager);
        while (true) {
            auto [has_row, step_status] = stmt->Step();
            if (step_status != proto::StatusCode::OK) {
                output->Finish();
                return ReportError(step_status, connection.GetLastError());
            }
            if (!has_row) break;
            output->AddRow(*stmt);
        }
        output->Finish();
    }
    return proto::StatusCode::OK;
}

/// Execute an input line
proto::StatusCode Shell::Execute(std::string_view line) {
    auto trimmed = Trim(line);
    if (trimmed.empty()) {
        return proto::StatusCode::OK;
    }
    if (trimmed.front() == '.') {
        auto space = trimmed.find_first_of(" \t");
        auto command = trimmed.substr(0, space);
        auto argument = space == std::string_view::npos ? std::string_view{} : Trim(trimmed.substr(space));
        return ExecuteCommand(command, argument);
    }
    return ExecuteSQL(line);
}

/// Complete a line
std::pair<size_t, std::vector<std::string>> Shell::Complete(std::string_view line, size_t cursor) {
    script.ReplaceText(line);
    auto [completion, status] = script.CompleteAt(cursor);
    if (status != proto::StatusCode::OK || !completion || completion->GetCandidates().empty()) {
        return {0, {}};
    }
    auto& candidates = completion->GetCandidates();
    std::vector<std::string> texts;
    texts.reserve(candidates.size());
    for (auto& candidate : candidates) {
        texts.push_back(candidate.replacement_text);
    }
    return {candidates.front().replace_from, std::move(texts)};
}

/// Get the inline hint
std::optional<std::string> Shell::Hint(std::string_view line, size_t cursor) {
    script.ReplaceText(line);
    return script.HintAt(cursor);
}

/// Run the read-eval-print loop
void Shell::Run(const std::string& history_file) {
    using_history();
    if (auto rc = read_history(history_file.c_str()); rc != 0) {
        spdlog::debug("[shell] no history loaded from {}: {}", history_file, std::strerror(rc));
    }
    ACTIVE_SHELL = this;
    rl_attempted_completion_function = AttemptCompletion;
    rl_redisplay_function = RedisplayWithHint;
    rl_bind_key('\r', AcceptLine);
    rl_bind_key('\n', AcceptLine);

    std::string prompt{PROMPT};
    while (!exit_requested) {
        std::unique_ptr<char, decltype(&std::free)> input{readline(prompt.c_str()), &std::free};
        if (!input) {
            break;
        }
        if (*input != '\0') {
            add_history(input.get());
        }
        if (auto status = Execute(input.get()); status != proto::StatusCode::OK) {
            spdlog::debug("[shell] line failed: {}", proto::EnumNameStatusCode(status));
        }
        out.flush();
    }

    ACTIVE_SHELL = nullptr;
    if (auto rc = write_history(history_file.c_str()); rc != 0) {
        spdlog::warn("[shell] cannot save history to {}: {}", history_file, std::strerror(rc));
    }
}

}  // namespace shell
}  // namespace sqlsh
