#include "sqlsh/engine/connection.h"

#include "spdlog/spdlog.h"

namespace sqlsh {
namespace engine {

/// Constructor
Statement::Statement(Connection& connection, sqlite3_stmt* handle) : connection(connection), handle(handle) {}

/// Get a result column name
std::string_view Statement::ColumnName(size_t idx) const {
    auto name = sqlite3_column_name(handle.get(), static_cast<int>(idx));
    return name ? std::string_view{name} : std::string_view{};
}

/// Read text
std::string_view Statement::ColumnText(size_t idx) const {
    auto data = reinterpret_cast<const char*>(sqlite3_column_text(handle.get(), static_cast<int>(idx)));
    auto size = sqlite3_column_bytes(handle.get(), static_cast<int>(idx));
    return data ? std::string_view{data, static_cast<size_t>(size)} : std::string_view{};
}

/// Read a blob
std::string_view Statement::ColumnBlob(size_t idx) const {
    auto data = reinterpret_cast<const char*>(sqlite3_column_blob(handle.get(), static_cast<int>(idx)));
    auto size = sqlite3_column_bytes(handle.get(), static_cast<int>(idx));
    return data ? std::string_view{data, static_cast<size_t>(size)} : std::string_view{};
}

/// Bind a text parameter
proto::StatusCode Statement::BindText(size_t idx, std::string_view text) {
    auto rc = sqlite3_bind_text(handle.get(), static_cast<int>(idx), text.data(), static_cast<int>(text.size()),
                                SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        connection.RecordError();
        return proto::StatusCode::ENGINE_PREPARE_FAILED;
    }
    return proto::StatusCode::OK;
}

/// Step to the next row
std::pair<bool, proto::StatusCode> Statement::Step() {
    switch (sqlite3_step(handle.get())) {
        case SQLITE_ROW:
            return {true, proto::StatusCode::OK};
        case SQLITE_DONE:
            return {false, proto::StatusCode::OK};
        default:
            connection.RecordError();
            return {false, proto::StatusCode::ENGINE_STEP_FAILED};
    }
}

/// Constructor
Connection::Connection(sqlite3* handle) : handle(handle) {}

/// Remember the current error
void Connection::RecordError() {
    if (handle) {
        last_error = sqlite3_errmsg(handle.get());
    }
}

/// Open a database file
std::pair<std::unique_ptr<Connection>, proto::StatusCode> Connection::Open(const std::string& path) {
    sqlite3* db = nullptr;
    auto rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    auto conn = std::make_unique<Connection>(db);
    if (rc != SQLITE_OK) {
        conn->RecordError();
        spdlog::warn("[engine] cannot open database {}: {}", path, conn->last_error);
        return {nullptr, proto::StatusCode::ENGINE_OPEN_FAILED};
    }
    return {std::move(conn), proto::StatusCode::OK};
}

/// Prepare the first statement of a text
std::pair<std::unique_ptr<Statement>, proto::StatusCode> Connection::Prepare(std::string_view text,
                                                                             std::string_view* tail) {
    if (!handle) {
        last_error = "connection is closed";
        return {nullptr, proto::StatusCode::ENGINE_PREPARE_FAILED};
    }
    sqlite3_stmt* stmt = nullptr;
    const char* rest = nullptr;
    auto rc = sqlite3_prepare_v2(handle.get(), text.data(), static_cast<int>(text.size()), &stmt, &rest);
    if (rc != SQLITE_OK) {
        RecordError();
        sqlite3_finalize(stmt);
        return {nullptr, proto::StatusCode::ENGINE_PREPARE_FAILED};
    }
    if (tail) {
        *tail = rest ? text.substr(static_cast<size_t>(rest - text.data())) : std::string_view{};
    }
    return {std::unique_ptr<Statement>(new Statement(*this, stmt)), proto::StatusCode::OK};
}

/// Run every statement of a text
proto::StatusCode Connection::Execute(std::string_view text) {
    while (!text.empty()) {
        std::string_view rest;
        auto [stmt, status] = Prepare(text, &rest);
        if (status != proto::StatusCode::OK) {
            return status;
        }
        // Whitespace and comments do not produce a statement
        if (stmt->Handle() != nullptr) {
            while (true) {
                auto [has_row, step_status] = stmt->Step();
                if (step_status != proto::StatusCode::OK) return step_status;
                if (!has_row) break;
            }
        }
        text = rest;
    }
    return proto::StatusCode::OK;
}

/// Close the connection
void Connection::Close() { handle.reset(); }

}  // namespace engine
}  // namespace sqlsh
