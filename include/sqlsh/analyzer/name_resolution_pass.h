#pragma once

#include <string>
#include <vector>

#include "ankerl/unordered_dense.h"
#include "sqlsh/script.h"

namespace sqlsh {

class Catalog;

/// The names introduced by a statement.
/// Both maps iterate in the order the names appear in the text.
struct QueryNames {
    /// The common table expressions with their column names
    ankerl::unordered_dense::map<std::string, std::vector<std::string>> ctes;
    /// The table aliases with the text of the aliased table
    ankerl::unordered_dense::map<std::string, std::string> aliases;
};

class NameResolutionPass {
   protected:
    /// The catalog used to plan CTE bodies
    Catalog& catalog;

    /// Collect the CTEs of all WITH clauses
    void ResolveCTEs(const SyntaxNode& statement, QueryNames& names);
    /// Collect the table aliases
    void ResolveAliases(const SyntaxNode& statement, QueryNames& names);

   public:
    /// Constructor
    explicit NameResolutionPass(Catalog& catalog);

    /// Resolve the names of a statement, never fails and returns empty maps in the worst case
    QueryNames Resolve(const SyntaxNode& statement);
};

}  // namespace sqlsh
