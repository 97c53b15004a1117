#pragma once

#include <string>
#include <string_view>

namespace sqlsh {
namespace shell {

/// Render SQL text with ANSI colors.
/// Text that cannot be scanned is returned unchanged.
std::string HighlightSQL(std::string_view text);

}  // namespace shell
}  // namespace sqlsh
