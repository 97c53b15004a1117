#pragma once

#include <string_view>

#include "gtest/gtest.h"
#include "pugixml.hpp"
#include "sqlsh/proto/proto_generated.h"

namespace sqlsh::testing {

/// Make sure the xml nodes match
::testing::AssertionResult Matches(const pugi::xml_node& have, const pugi::xml_node& expected);
/// Encode a location
void EncodeLocation(pugi::xml_node n, proto::Location loc, std::string_view text, const char* loc_key = "loc",
                    const char* text_key = "text");

}  // namespace sqlsh::testing
