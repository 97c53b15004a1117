#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sqlsh/proto/proto_generated.h"

namespace sqlsh {
namespace engine {
class Connection;
}  // namespace engine

/// Read access to the schema of the attached database
class Catalog {
   public:
    /// Destructor
    virtual ~Catalog() = default;
    /// List the names of all tables
    virtual std::pair<std::vector<std::string>, proto::StatusCode> ListTables() = 0;
    /// Get the result column names of a query fragment without running it
    virtual std::pair<std::vector<std::string>, proto::StatusCode> PlanColumns(std::string_view fragment) = 0;
};

/// A catalog backed by a sqlite connection
class SQLiteCatalog : public Catalog {
   protected:
    /// The connection
    engine::Connection& connection;

   public:
    /// Constructor
    explicit SQLiteCatalog(engine::Connection& connection);

    /// List the names of all tables, sorted by name
    std::pair<std::vector<std::string>, proto::StatusCode> ListTables() override;
    /// Prepare the fragment and read its result column names
    std::pair<std::vector<std::string>, proto::StatusCode> PlanColumns(std::string_view fragment) override;
};

}  // namespace sqlsh
