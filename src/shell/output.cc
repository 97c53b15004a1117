#include "sqlsh/shell/output.h"

#include <sqlite3.h>

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <iterator>
#include <utility>

#include "fmt/format.h"
#include "fmt/ostream.h"
#include "spdlog/spdlog.h"
#include "sqlsh/engine/connection.h"
#include "sqlsh/shell/highlighter.h"

namespace sqlsh {
namespace shell {

namespace {

/// Count the code points of an UTF-8 string
size_t DisplayWidth(std::string_view text) {
    size_t width = 0;
    for (auto c : text) {
        width += (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }
    return width;
}

/// Repeat a multi-byte character
std::string Repeat(std::string_view c, size_t n) {
    std::string out;
    out.reserve(c.size() * n);
    for (size_t i = 0; i < n; ++i) out += c;
    return out;
}

/// Format the bytes of a blob as hex
std::string FormatBlobHex(std::string_view blob, std::string_view separator) {
    fmt::memory_buffer buffer;
    auto iter = std::back_inserter(buffer);
    for (size_t i = 0; i < blob.size(); ++i) {
        if (i > 0) fmt::format_to(iter, "{}", separator);
        fmt::format_to(iter, "{:02x}", static_cast<unsigned char>(blob[i]));
    }
    return fmt::to_string(buffer);
}

}  // namespace

/// Parse an output mode
std::optional<OutputMode> ParseOutputMode(std::string_view name) {
    if (name == "null") return OutputMode::Null;
    if (name == "table") return OutputMode::Table;
    if (name == "sql") return OutputMode::SQL;
    return std::nullopt;
}

/// Get the name of an output mode
std::string_view GetOutputModeName(OutputMode mode) {
    switch (mode) {
        case OutputMode::Null:
            return "null";
        case OutputMode::Table:
            return "table";
        case OutputMode::SQL:
            return "sql";
    }
    return "";
}

/// Create the output for a statement
std::unique_ptr<RowOutput> RowOutput::Create(OutputMode mode, const engine::Statement& stmt, std::ostream& out,
                                             bool color, Pager pager) {
    switch (mode) {
        case OutputMode::Table:
            return std::make_unique<TableOutput>(stmt, out, color, std::move(pager));
        case OutputMode::SQL:
            return std::make_unique<SQLOutput>(out, color);
        case OutputMode::Null:
            break;
    }
    return std::make_unique<NullOutput>();
}

/// Constructor
TableOutput::TableOutput(const engine::Statement& stmt, std::ostream& out, bool color, Pager pager)
    : out(out), color(color), pager(std::move(pager)) {
    header.reserve(stmt.ColumnCount());
    for (size_t i = 0; i < stmt.ColumnCount(); ++i) {
        header.emplace_back(stmt.ColumnName(i));
    }
}

/// Add a row
void TableOutput::AddRow(const engine::Statement& stmt) {
    std::vector<Cell> cells;
    cells.reserve(header.size());
    for (size_t i = 0; i < header.size(); ++i) {
        switch (stmt.ColumnType(i)) {
            case SQLITE_NULL:
                cells.push_back({"NULL", fmt::fg(fmt::terminal_color::bright_black)});
                break;
            case SQLITE_INTEGER:
                cells.push_back({fmt::format("{}", stmt.ColumnInt64(i)), fmt::fg(fmt::terminal_color::yellow)});
                break;
            case SQLITE_FLOAT:
                cells.push_back({fmt::format("{}", stmt.ColumnDouble(i)), fmt::fg(fmt::terminal_color::yellow)});
                break;
            case SQLITE_BLOB:
                cells.push_back({FormatBlobHex(stmt.ColumnBlob(i), " "), std::nullopt});
                break;
            default:
                cells.push_back({std::string{stmt.ColumnText(i)}, std::nullopt});
                break;
        }
    }
    rows.push_back(std::move(cells));
}

/// Render a row
void TableOutput::WriteRow(std::string& line, const std::vector<Cell>& cells, const std::vector<size_t>& widths) {
    line += "│";
    for (size_t i = 0; i < cells.size(); ++i) {
        auto& cell = cells[i];
        auto padding = widths[i] - DisplayWidth(cell.text);
        line += " ";
        if (color && cell.style.has_value()) {
            line += fmt::format("{}", fmt::styled(cell.text, *cell.style));
        } else {
            line += cell.text;
        }
        line += std::string(padding, ' ');
        line += " │";
    }
    line += "\n";
}

/// Pipe the table through the pager
bool TableOutput::WriteToPager(std::string_view rendered) {
    out.flush();
    auto command = fmt::format("LESSCHARSET=UTF-8 {}", pager.command);
    FILE* pipe = popen(command.c_str(), "w");
    if (pipe == nullptr) {
        spdlog::warn("[output] cannot start pager: {}", pager.command);
        return false;
    }
    // The pager may quit before reading everything
    auto previous_handler = std::signal(SIGPIPE, SIG_IGN);
    auto written = std::fwrite(rendered.data(), 1, rendered.size(), pipe);
    if (written != rendered.size()) {
        spdlog::debug("[output] pager stopped reading after {} of {} bytes", written, rendered.size());
    }
    if (auto rc = pclose(pipe); rc != 0) {
        spdlog::debug("[output] pager exited with status {}", rc);
    }
    std::signal(SIGPIPE, previous_handler);
    return true;
}

/// Draw the table
void TableOutput::Finish() {
    if (header.empty()) {
        return;
    }
    std::vector<size_t> widths;
    widths.reserve(header.size());
    for (auto& name : header) {
        widths.push_back(DisplayWidth(name));
    }
    for (auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], DisplayWidth(row[i].text));
        }
    }
    size_t inner = widths.size() - 1;
    for (auto w : widths) inner += w + 2;

    std::vector<Cell> header_cells;
    header_cells.reserve(header.size());
    for (auto& name : header) {
        header_cells.push_back({name, std::nullopt});
    }
    std::string header_line = "╞";
    for (size_t i = 0; i < widths.size(); ++i) {
        if (i > 0) header_line += "═";
        header_line += Repeat("═", widths[i] + 2);
    }
    header_line += "╡";

    std::string rendered = fmt::format("┌{}┐\n", Repeat("─", inner));
    WriteRow(rendered, header_cells, widths);
    rendered += header_line;
    rendered += "\n";
    for (auto& row : rows) {
        WriteRow(rendered, row, widths);
    }
    rendered += fmt::format("└{}┘\n", Repeat("─", inner));

    auto paged = !pager.command.empty() && rows.size() > pager.row_threshold && WriteToPager(rendered);
    if (!paged) {
        out << rendered;
    }
    rows.clear();
}

/// Constructor
SQLOutput::SQLOutput(std::ostream& out, bool color, std::string table_name)
    : out(out), color(color), table_name(std::move(table_name)) {}

/// Write a row
void SQLOutput::AddRow(const engine::Statement& stmt) {
    auto sql = fmt::format("INSERT INTO {} VALUES(", table_name);
    for (size_t i = 0; i < stmt.ColumnCount(); ++i) {
        if (i > 0) sql += ", ";
        switch (stmt.ColumnType(i)) {
            case SQLITE_NULL:
                sql += "NULL";
                break;
            case SQLITE_INTEGER:
                sql += fmt::format("{}", stmt.ColumnInt64(i));
                break;
            case SQLITE_FLOAT:
                sql += fmt::format("{}", stmt.ColumnDouble(i));
                break;
            case SQLITE_BLOB:
                sql += fmt::format("X'{}'", FormatBlobHex(stmt.ColumnBlob(i), ""));
                break;
            default: {
                sql += "'";
                for (auto c : stmt.ColumnText(i)) {
                    if (c == '\'') sql += '\'';
                    sql += c;
                }
                sql += "'";
                break;
            }
        }
    }
    sql += ");";
    fmt::print(out, "{}\n", color ? HighlightSQL(sql) : sql);
}

}  // namespace shell
}  // namespace sqlsh
