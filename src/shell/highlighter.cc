#include "sqlsh/shell/highlighter.h"

#include <algorithm>
#include <iterator>
#include <optional>

#include "fmt/color.h"
#include "fmt/format.h"
#include "sqlsh/parser/scanner.h"
#include "sqlsh/script.h"

namespace sqlsh {
namespace shell {

static std::optional<fmt::text_style> GetTokenStyle(proto::HighlightingTokenType type) {
    switch (type) {
        case proto::HighlightingTokenType::KEYWORD:
            return fmt::fg(fmt::terminal_color::blue) | fmt::emphasis::bold;
        case proto::HighlightingTokenType::LITERAL_NUMBER:
            return fmt::fg(fmt::terminal_color::yellow) | fmt::emphasis::bold;
        case proto::HighlightingTokenType::LITERAL_STRING:
        case proto::HighlightingTokenType::LITERAL_BLOB:
        case proto::HighlightingTokenType::PARAMETER:
            return fmt::fg(fmt::terminal_color::magenta) | fmt::emphasis::bold;
        case proto::HighlightingTokenType::COMMENT:
            return fmt::fg(fmt::terminal_color::green) | fmt::emphasis::bold;
        default:
            return std::nullopt;
    }
}

/// Highlight SQL text
std::string HighlightSQL(std::string_view text) {
    auto [scanned, status] = parser::Scanner::Scan(text);
    if (status != proto::StatusCode::OK) {
        return std::string{text};
    }
    auto highlighting = scanned->BuildHighlighting();
    auto& offsets = highlighting->token_offsets;
    auto& types = highlighting->token_types;

    fmt::memory_buffer out;
    auto out_iter = std::back_inserter(out);
    // Text before the first token is never styled
    size_t pos = offsets.empty() ? text.size() : std::min<size_t>(offsets[0], text.size());
    fmt::format_to(out_iter, "{}", text.substr(0, pos));
    for (size_t i = 0; i < offsets.size(); ++i) {
        auto begin = std::min<size_t>(offsets[i], text.size());
        auto end = (i + 1 < offsets.size()) ? std::min<size_t>(offsets[i + 1], text.size()) : text.size();
        if (end <= begin) continue;
        auto part = text.substr(begin, end - begin);
        if (auto style = GetTokenStyle(types[i]); style.has_value()) {
            fmt::format_to(out_iter, "{}", fmt::styled(part, *style));
        } else {
            fmt::format_to(out_iter, "{}", part);
        }
    }
    return fmt::to_string(out);
}

}  // namespace shell
}  // namespace sqlsh
