#pragma once

#include <memory>
#include <utility>

#include "sqlsh/parser/parser_generated.h"

namespace sqlsh {

class ParsedScript;
class ScannedScript;

namespace parser {

class Parser : public ParserBase {
    using ParserBase::ParserBase;

   public:
    /// Parse a scanned script
    static std::pair<std::shared_ptr<ParsedScript>, proto::StatusCode> Parse(std::shared_ptr<ScannedScript> in);
};

}  // namespace parser
}  // namespace sqlsh
