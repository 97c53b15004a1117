#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "sqlsh/proto/proto_generated.h"

namespace sqlsh {
namespace engine {

class Connection;

/// Calls a sqlite release function on destruction
template <class T, int (*Func)(T*)> struct SQLiteDeleter {
    void operator()(T* t) const { Func(t); }
};

/// A prepared statement
class Statement {
    friend class Connection;

   protected:
    /// The connection
    Connection& connection;
    /// The statement handle
    std::unique_ptr<sqlite3_stmt, SQLiteDeleter<sqlite3_stmt, sqlite3_finalize>> handle;

    /// Constructor
    Statement(Connection& connection, sqlite3_stmt* handle);

   public:
    /// Get the handle
    sqlite3_stmt* Handle() const { return handle.get(); }
    /// Get the number of result columns
    size_t ColumnCount() const { return static_cast<size_t>(sqlite3_column_count(handle.get())); }
    /// Get a result column name
    std::string_view ColumnName(size_t idx) const;
    /// Get the number of bind parameters
    size_t BoundParameterCount() const { return static_cast<size_t>(sqlite3_bind_parameter_count(handle.get())); }
    /// Bind a text parameter, parameters are numbered from 1
    proto::StatusCode BindText(size_t idx, std::string_view text);

    /// Step to the next row, returns false when done
    std::pair<bool, proto::StatusCode> Step();
    /// Get the storage class of a column in the current row
    int ColumnType(size_t idx) const { return sqlite3_column_type(handle.get(), static_cast<int>(idx)); }
    /// Read an integer
    int64_t ColumnInt64(size_t idx) const { return sqlite3_column_int64(handle.get(), static_cast<int>(idx)); }
    /// Read a double
    double ColumnDouble(size_t idx) const { return sqlite3_column_double(handle.get(), static_cast<int>(idx)); }
    /// Read text
    std::string_view ColumnText(size_t idx) const;
    /// Read a blob
    std::string_view ColumnBlob(size_t idx) const;
};

/// An open database connection
class Connection {
    friend class Statement;

   protected:
    /// The database handle, released once the last statement is finalized
    std::unique_ptr<sqlite3, SQLiteDeleter<sqlite3, sqlite3_close_v2>> handle;
    /// The last error message
    std::string last_error;

    /// Remember the current error of the handle
    void RecordError();

   public:
    /// Constructor
    explicit Connection(sqlite3* handle);

    /// Open a database file, creates it if missing
    static std::pair<std::unique_ptr<Connection>, proto::StatusCode> Open(const std::string& path);

    /// Get the handle
    sqlite3* Handle() const { return handle.get(); }
    /// Is the connection open?
    bool IsOpen() const { return handle != nullptr; }
    /// Get the last error message
    const std::string& GetLastError() const { return last_error; }

    /// Prepare the first statement of a text, the unused remainder is written to tail
    std::pair<std::unique_ptr<Statement>, proto::StatusCode> Prepare(std::string_view text,
                                                                     std::string_view* tail = nullptr);
    /// Run every statement of a text, ignoring the results
    proto::StatusCode Execute(std::string_view text);
    /// Close the connection
    void Close();
};

}  // namespace engine
}  // namespace sqlsh
