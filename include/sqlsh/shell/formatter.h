#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sqlsh {
namespace shell {

/// Parenthesized groups longer than this are broken into one line per element
constexpr size_t FORMAT_INLINE_MAX_LENGTH = 50;
/// The indentation of broken groups
constexpr std::string_view FORMAT_INDENT = "  ";

/// Format SQL text.
///
/// Whitespace between tokens is collapsed to a single space. A parenthesized group that would exceed
/// FORMAT_INLINE_MAX_LENGTH is opened on its own line, its comma-separated elements are written one per line with
/// one more indentation level and the closing parenthesis goes back to the outer level.
/// Text with comments or scanner errors is returned unchanged.
std::string FormatSQL(std::string_view text);

}  // namespace shell
}  // namespace sqlsh
