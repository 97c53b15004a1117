#include <iostream>
#include <string>

#include "gflags/gflags.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include "sqlsh/engine/connection.h"
#include "sqlsh/proto/proto_generated.h"
#include "sqlsh/shell/functions.h"
#include "sqlsh/shell/output.h"
#include "sqlsh/shell/shell.h"

using namespace sqlsh;

DEFINE_string(history_file, "history.txt", "File to load the history from and save it to");
DEFINE_string(mode, "table", "Output mode: null, table or sql");
DEFINE_string(log_level, "warn", "Log level: trace, debug, info, warn, error or off");
DEFINE_bool(color, true, "Use terminal colors");
DEFINE_string(pager, "less", "Pager for tables with more than 100 rows, empty prints them directly");

static bool ValidateMode(const char*, const std::string& value) { return shell::ParseOutputMode(value).has_value(); }
DEFINE_validator(mode, &ValidateMode);

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("Usage: ./sqlsh_shell [options] <database>");
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    if (argc != 2) {
        std::cerr << gflags::ProgramUsage() << std::endl;
        return 1;
    }

    // Log to stderr
    auto logger = spdlog::stderr_color_mt("sqlsh");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(FLAGS_log_level));

    auto [connection, status] = engine::Connection::Open(argv[1]);
    if (status != proto::StatusCode::OK) {
        std::cerr << "Error: cannot open " << argv[1] << std::endl;
        return 1;
    }
    if (auto fn_status = shell::RegisterFunctions(*connection); fn_status != proto::StatusCode::OK) {
        std::cerr << "Error: " << proto::EnumNameStatusCode(fn_status) << std::endl;
        return 1;
    }

    shell::ShellOptions options;
    options.mode = *shell::ParseOutputMode(FLAGS_mode);
    options.color = FLAGS_color;
    options.pager = FLAGS_pager;
    shell::Shell shell{*connection, std::cout, options};
    shell.Run(FLAGS_history_file);
    return 0;
}
