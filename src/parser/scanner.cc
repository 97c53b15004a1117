#include "sqlsh/parser/scanner.h"

#include <cstring>
#include <limits>
#include <optional>

#include "sqlsh/parser/grammar/keywords.h"
#include "sqlsh/parser/parser.h"
#include "sqlsh/script.h"
#include "sqlsh/utils/string_conversion.h"

using Parser = sqlsh::parser::Parser;

extern Parser::symbol_type sqlsh_yylex(void* state);
extern int sqlsh_yylex_init_extra(sqlsh::parser::Scanner* extra, void** state);
extern int sqlsh_yylex_destroy(void* state);

namespace sqlsh {
namespace parser {

/// Constructor
Scanner::Scanner(std::string_view text) : input_data(text), output(std::make_shared<ScannedScript>(std::string{text})) {}
/// Destructor
Scanner::~Scanner() {
    if (scanner_state_ptr != nullptr) {
        sqlsh_yylex_destroy(scanner_state_ptr);
        scanner_state_ptr = nullptr;
    }
}

/// Add an error
void Scanner::AddError(proto::Location location, const char* message) {
    output->errors.push_back({location, message});
}
/// Add a line break
void Scanner::AddLineBreak(proto::Location location) { output->line_breaks.push_back(location); }
/// Add a comment
void Scanner::AddComment(proto::Location location) { output->comments.push_back(location); }

/// Read an unquoted identifier
Parser::symbol_type Scanner::ReadIdentifier(std::string_view text, proto::Location loc) {
    // Keywords are matched on the ASCII lower-case text
    temp_buffer = tolower_ascii(text);
    if (auto k = Keyword::Find(temp_buffer); !!k) {
        return Parser::symbol_type(k->token, loc);
    }
    return Parser::make_IDENT(loc);
}

/// Scan the next input data
void Scanner::ScanNextInputData(char* out_buffer, size_t& out_bytes_read, size_t max_size) {
    auto read_here = std::min<size_t>(max_size, input_data.size() - input_consumed);
    std::memcpy(out_buffer, input_data.data() + input_consumed, read_here);
    input_consumed += read_here;
    out_bytes_read = read_here;
}

/// Advance the location
void Scanner::AdvanceLocation(size_t length) {
    current_location = proto::Location(current_offset, static_cast<uint32_t>(length));
    current_offset += static_cast<uint32_t>(length);
}

/// Scan input and produce all tokens
std::pair<std::shared_ptr<ScannedScript>, proto::StatusCode> Scanner::Scan(std::string_view text) {
    if (text.size() >= std::numeric_limits<uint32_t>::max()) {
        return {nullptr, proto::StatusCode::INPUT_TOO_LARGE};
    }

    // Function to get next token
    auto next = [](void* scanner_state_ptr, std::optional<Parser::symbol_type>& lookahead_symbol) {
        // Have lookahead?
        Parser::symbol_type current_symbol;
        if (lookahead_symbol) {
            current_symbol.move(*lookahead_symbol);
            lookahead_symbol.reset();
        } else {
            auto t = sqlsh_yylex(scanner_state_ptr);
            current_symbol.move(t);
        }

        // Requires additional lookahead?
        switch (current_symbol.kind()) {
            case Parser::symbol_kind::S_NOT:
            case Parser::symbol_kind::S_IS:
                break;
            default:
                return current_symbol;
        }

        // Get next token
        auto next_symbol = sqlsh_yylex(scanner_state_ptr);
        auto next_symbol_kind = next_symbol.kind();

        switch (current_symbol.kind()) {
            case Parser::symbol_kind::S_NOT:
                // Replace NOT by NOT_LA if it's followed by BETWEEN, IN, etc
                lookahead_symbol.emplace(std::move(next_symbol));
                switch (next_symbol_kind) {
                    case Parser::symbol_kind::S_BETWEEN:
                    case Parser::symbol_kind::S_IN_P:
                    case Parser::symbol_kind::S_LIKE:
                    case Parser::symbol_kind::S_GLOB:
                    case Parser::symbol_kind::S_MATCH:
                    case Parser::symbol_kind::S_REGEXP:
                        return Parser::make_NOT_LA(current_symbol.location);
                    default:
                        break;
                }
                break;
            case Parser::symbol_kind::S_IS:
                // Merge IS NOT into a single token
                if (next_symbol_kind == Parser::symbol_kind::S_NOT) {
                    return Parser::make_IS_NOT(Loc({current_symbol.location, next_symbol.location}));
                }
                lookahead_symbol.emplace(std::move(next_symbol));
                break;
            default:
                break;
        }
        return current_symbol;
    };

    // Create the scanner
    Scanner scanner{text};
    if (sqlsh_yylex_init_extra(&scanner, &scanner.scanner_state_ptr) != 0) {
        return {nullptr, proto::StatusCode::SCANNER_SETUP_FAILED};
    }
    // Collect all tokens until we hit EOF
    std::optional<Parser::symbol_type> lookahead_symbol;
    while (true) {
        auto token = next(scanner.scanner_state_ptr, lookahead_symbol);
        auto kind = token.kind();
        scanner.output->symbols.push_back(std::move(token));
        if (kind == Parser::symbol_kind::S_EOF) break;
    }
    return {std::move(scanner.output), proto::StatusCode::OK};
}

}  // namespace parser
}  // namespace sqlsh
