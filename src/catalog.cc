#include "sqlsh/catalog.h"

#include <cctype>

#include "spdlog/spdlog.h"
#include "sqlsh/engine/connection.h"

namespace sqlsh {

/// The table listing query
constexpr std::string_view LIST_TABLES_QUERY = "SELECT name FROM sqlite_schema WHERE type = 'table' ORDER BY name ASC";

/// Constructor
SQLiteCatalog::SQLiteCatalog(engine::Connection& connection) : connection(connection) {}

/// List all tables
std::pair<std::vector<std::string>, proto::StatusCode> SQLiteCatalog::ListTables() {
    if (!connection.IsOpen()) {
        return {{}, proto::StatusCode::CATALOG_UNAVAILABLE};
    }
    auto [stmt, status] = connection.Prepare(LIST_TABLES_QUERY);
    if (status != proto::StatusCode::OK) {
        spdlog::warn("[catalog] cannot list tables: {}", connection.GetLastError());
        return {{}, proto::StatusCode::CATALOG_UNAVAILABLE};
    }
    std::vector<std::string> tables;
    while (true) {
        auto [has_row, step_status] = stmt->Step();
        if (step_status != proto::StatusCode::OK) {
            spdlog::warn("[catalog] cannot list tables: {}", connection.GetLastError());
            return {{}, proto::StatusCode::CATALOG_UNAVAILABLE};
        }
        if (!has_row) break;
        tables.emplace_back(stmt->ColumnText(0));
    }
    return {std::move(tables), proto::StatusCode::OK};
}

/// Plan the columns of a fragment
std::pair<std::vector<std::string>, proto::StatusCode> SQLiteCatalog::PlanColumns(std::string_view fragment) {
    if (!connection.IsOpen()) {
        return {{}, proto::StatusCode::CATALOG_UNAVAILABLE};
    }
    std::string_view tail;
    auto [stmt, status] = connection.Prepare(fragment, &tail);
    if (status != proto::StatusCode::OK) {
        spdlog::debug("[catalog] cannot plan fragment: {}", connection.GetLastError());
        return {{}, proto::StatusCode::PLAN_FAILED};
    }
    if (stmt->Handle() == nullptr) {
        return {{}, proto::StatusCode::PLAN_FAILED};
    }
    // Only a single statement may be planned
    for (auto c : tail) {
        if (!std::isspace(static_cast<unsigned char>(c)) && c != ';') {
            spdlog::debug("[catalog] fragment contains more than one statement");
            return {{}, proto::StatusCode::PLAN_FAILED};
        }
    }
    std::vector<std::string> columns;
    columns.reserve(stmt->ColumnCount());
    for (size_t i = 0; i < stmt->ColumnCount(); ++i) {
        columns.emplace_back(stmt->ColumnName(i));
    }
    return {std::move(columns), proto::StatusCode::OK};
}

}  // namespace sqlsh
