#pragma once

#include <vector>

#include "sqlsh/script.h"

namespace sqlsh {

class StatementSplitter {
   public:
    /// Get the top-level statements in source order, statements that failed to parse are included as error nodes
    static std::vector<SyntaxNode> Split(const ParsedScript& parsed);
};

}  // namespace sqlsh
