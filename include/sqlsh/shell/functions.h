#pragma once

#include <cstdint>
#include <string>

#include "sqlsh/proto/proto_generated.h"

namespace sqlsh {
namespace engine {
class Connection;
}  // namespace engine

namespace shell {

/// Format a byte count with decimal units, e.g. 1500 -> "1.50 kB"
std::string FormatByteSize(int64_t bytes);

/// Register the display functions of the shell, currently fmt_byte_size(n)
proto::StatusCode RegisterFunctions(engine::Connection& connection);

}  // namespace shell
}  // namespace sqlsh
