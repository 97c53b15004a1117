#include "sqlsh/shell/functions.h"

#include <sqlite3.h>

#include <array>
#include <string_view>

#include "fmt/format.h"
#include "spdlog/spdlog.h"
#include "sqlsh/engine/connection.h"

namespace sqlsh {
namespace shell {

namespace {

constexpr std::array<std::string_view, 7> DECIMAL_UNITS{"B", "kB", "MB", "GB", "TB", "PB", "EB"};

void FormatByteSizeFunction(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    if (argc != 1 || sqlite3_value_type(argv[0]) != SQLITE_INTEGER) {
        sqlite3_result_error(ctx, "fmt_byte_size expects an integer", -1);
        return;
    }
    auto text = FormatByteSize(sqlite3_value_int64(argv[0]));
    sqlite3_result_text(ctx, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

}  // namespace

/// Format a byte count
std::string FormatByteSize(int64_t bytes) {
    // Plain bytes are printed without decimals
    if (bytes > -1000 && bytes < 1000) {
        return fmt::format("{} {}", bytes, DECIMAL_UNITS[0]);
    }
    auto value = static_cast<double>(bytes);
    size_t unit = 0;
    while ((value <= -1000.0 || value >= 1000.0) && (unit + 1) < DECIMAL_UNITS.size()) {
        value /= 1000.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, DECIMAL_UNITS[unit]);
}

/// Register the display functions
proto::StatusCode RegisterFunctions(engine::Connection& connection) {
    auto rc = sqlite3_create_function_v2(connection.Handle(), "fmt_byte_size", 1, SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                                         nullptr, FormatByteSizeFunction, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::warn("[shell] cannot register fmt_byte_size: {}", sqlite3_errstr(rc));
        return proto::StatusCode::ENGINE_REGISTER_FUNCTION_FAILED;
    }
    return proto::StatusCode::OK;
}

}  // namespace shell
}  // namespace sqlsh
