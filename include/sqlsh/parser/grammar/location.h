#pragma once

#include <algorithm>
#include <initializer_list>
#include <limits>

#include "sqlsh/proto/proto_generated.h"

namespace sqlsh {
namespace parser {

/// Union of locations.
/// Zero-width locations only count when there is nothing else to span.
inline proto::Location Loc(std::initializer_list<proto::Location> locs) {
    uint32_t begin = std::numeric_limits<uint32_t>::max();
    uint32_t end = 0;
    for (auto& loc : locs) {
        if (loc.length() == 0) continue;
        begin = std::min(begin, loc.offset());
        end = std::max(end, loc.offset() + loc.length());
    }
    if (begin > end) {
        return locs.size() == 0 ? proto::Location() : *locs.begin();
    }
    return proto::Location(begin, end - begin);
}

}  // namespace parser
}  // namespace sqlsh

/// Location of a reduced rule.
/// Empty rules are placed directly behind the previous symbol.
#define YYLLOC_DEFAULT(Cur, Rhs, N)                                                   \
    do {                                                                              \
        if (N) {                                                                      \
            uint32_t loc_begin = std::numeric_limits<uint32_t>::max();                \
            uint32_t loc_end = 0;                                                     \
            for (int loc_i = 1; loc_i <= (N); ++loc_i) {                              \
                auto& loc = YYRHSLOC(Rhs, loc_i);                                     \
                if (loc.length() == 0) continue;                                      \
                loc_begin = std::min(loc_begin, loc.offset());                        \
                loc_end = std::max(loc_end, loc.offset() + loc.length());             \
            }                                                                         \
            if (loc_begin > loc_end) {                                                \
                (Cur) = YYRHSLOC(Rhs, 1);                                             \
            } else {                                                                  \
                (Cur) = sqlsh::proto::Location(loc_begin, loc_end - loc_begin);       \
            }                                                                         \
        } else {                                                                      \
            auto& prev = YYRHSLOC(Rhs, 0);                                            \
            (Cur) = sqlsh::proto::Location(prev.offset() + prev.length(), 0);         \
        }                                                                             \
    } while (false)
