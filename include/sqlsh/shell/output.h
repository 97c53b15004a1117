#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "fmt/color.h"

namespace sqlsh {
namespace engine {
class Statement;
}  // namespace engine

namespace shell {

enum class OutputMode { Null, Table, SQL };

/// Parse an output mode name, one of null, table or sql
std::optional<OutputMode> ParseOutputMode(std::string_view name);
/// Get the name of an output mode
std::string_view GetOutputModeName(OutputMode mode);

/// A pager for long results
struct Pager {
    /// The shell command that reads the output from stdin, empty disables paging
    std::string command;
    /// Results with more rows are paged
    size_t row_threshold = 100;
};

/// Receives the rows of a statement
class RowOutput {
   public:
    /// Destructor
    virtual ~RowOutput() = default;
    /// Add the current row of a statement
    virtual void AddRow(const engine::Statement& stmt) = 0;
    /// Write everything that is still pending
    virtual void Finish() = 0;

    /// Create the output for a statement
    static std::unique_ptr<RowOutput> Create(OutputMode mode, const engine::Statement& stmt, std::ostream& out,
                                             bool color, Pager pager = {});
};

/// Discards all rows
class NullOutput : public RowOutput {
   public:
    void AddRow(const engine::Statement&) override {}
    void Finish() override {}
};

/// Collects the rows and draws a box table with a header
class TableOutput : public RowOutput {
   protected:
    /// A rendered cell
    struct Cell {
        /// The text
        std::string text;
        /// The style, if any
        std::optional<fmt::text_style> style;
    };

    /// The output stream
    std::ostream& out;
    /// Use colors?
    bool color;
    /// The pager
    Pager pager;
    /// The column names
    std::vector<std::string> header;
    /// The rows
    std::vector<std::vector<Cell>> rows;

    /// Render a row of cells
    void WriteRow(std::string& line, const std::vector<Cell>& cells, const std::vector<size_t>& widths);
    /// Pipe the rendered table through the pager, returns false if the pager could not be started
    bool WriteToPager(std::string_view rendered);

   public:
    /// Constructor
    TableOutput(const engine::Statement& stmt, std::ostream& out, bool color, Pager pager = {});

    /// Add a row
    void AddRow(const engine::Statement& stmt) override;
    /// Draw the table
    void Finish() override;
};

/// Writes every row as INSERT statement
class SQLOutput : public RowOutput {
   protected:
    /// The output stream
    std::ostream& out;
    /// Highlight the statements?
    bool color;
    /// The table name
    std::string table_name;

   public:
    /// Constructor
    SQLOutput(std::ostream& out, bool color, std::string table_name = "tbl");

    /// Write a row
    void AddRow(const engine::Statement& stmt) override;
    void Finish() override {}
};

}  // namespace shell
}  // namespace sqlsh
