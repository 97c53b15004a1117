#include "sqlsh/parser/grammar/keywords.h"

#include <algorithm>
#include <array>

#include "frozen/string.h"
#include "frozen/unordered_map.h"

namespace sqlsh {
namespace parser {

constexpr size_t KEYWORD_COUNT = 0
#define X(CATEGORY, NAME, TOKEN) +1
#include "../../grammar/lists/sql_reserved_keywords.list"
#include "../../grammar/lists/sql_unreserved_keywords.list"
#undef X
    ;

constexpr int64_t KEYWORD_MAX_SYMBOL_ID = std::max<int64_t>({
#define X(CATEGORY, NAME, TOKEN) static_cast<int64_t>(Parser::symbol_kind_type::S_##TOKEN),
#include "../../grammar/lists/sql_reserved_keywords.list"
#include "../../grammar/lists/sql_unreserved_keywords.list"
#undef X
    0});
constexpr size_t KEYWORD_SYMBOL_COUNT = KEYWORD_MAX_SYMBOL_ID + 1;

constexpr frozen::unordered_map<frozen::string, Keyword, KEYWORD_COUNT> KEYWORD_MAP = {
#define X(CATEGORY, NAME, TOKEN) \
    {NAME, Keyword{NAME, Parser::token::SQL_##TOKEN, Parser::symbol_kind_type::S_##TOKEN, KeywordCategory::CATEGORY}},
#include "../../grammar/lists/sql_reserved_keywords.list"
#include "../../grammar/lists/sql_unreserved_keywords.list"
#undef X
};

static std::array<std::string_view, KEYWORD_SYMBOL_COUNT> GetKeywordSymbolNames() {
    std::array<std::string_view, KEYWORD_SYMBOL_COUNT> names;
    for (auto& [key, value] : KEYWORD_MAP) {
        auto i = static_cast<int64_t>(value.parser_symbol);
        if (i >= 0) {
            names[i] = value.name;
        }
    }
    return names;
}
static const std::array<std::string_view, KEYWORD_SYMBOL_COUNT> KEYWORD_SYMBOL_NAMES = GetKeywordSymbolNames();

static std::array<Keyword, KEYWORD_COUNT> SortKeywords() {
    std::array<Keyword, KEYWORD_COUNT> keywords{
#define X(CATEGORY, NAME, TOKEN) \
    Keyword{NAME, Parser::token::SQL_##TOKEN, Parser::symbol_kind_type::S_##TOKEN, KeywordCategory::CATEGORY},
#include "../../grammar/lists/sql_reserved_keywords.list"
#include "../../grammar/lists/sql_unreserved_keywords.list"
#undef X
    };
    std::sort(keywords.begin(), keywords.end(), [](auto& l, auto& r) { return l.name < r.name; });
    return keywords;
}
static const std::array<Keyword, KEYWORD_COUNT> SORTED_KEYWORDS = SortKeywords();

constexpr size_t MAX_KEYWORD_LENGTH = std::max<size_t>({
#define X(CATEGORY, NAME, TOKEN) Keyword::ConstLength(NAME),
#include "../../grammar/lists/sql_reserved_keywords.list"
#include "../../grammar/lists/sql_unreserved_keywords.list"
#undef X
});

/// Get sorted keywords
std::span<const Keyword> Keyword::GetKeywords() { return {SORTED_KEYWORDS.begin(), SORTED_KEYWORDS.size()}; }
/// Get a keyword name
std::string_view Keyword::GetKeywordName(Parser::symbol_kind_type sym) {
    auto sym_id = static_cast<int64_t>(sym);
    if (sym_id >= 0 && sym_id < static_cast<int64_t>(KEYWORD_SYMBOL_COUNT)) {
        return KEYWORD_SYMBOL_NAMES[sym_id];
    }
    return "";
}
/// Find a keyword
const Keyword* Keyword::Find(std::string_view text) {
    if (text.size() > MAX_KEYWORD_LENGTH) return nullptr;
    if (auto iter = KEYWORD_MAP.find(frozen::string{text.data(), text.size()}); iter != KEYWORD_MAP.end()) {
        return &iter->second;
    }
    return nullptr;
}

}  // namespace parser
}  // namespace sqlsh
