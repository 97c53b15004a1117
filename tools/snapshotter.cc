#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

#include "gflags/gflags.h"
#include "pugixml.hpp"
#include "sqlsh/analyzer/completion.h"
#include "sqlsh/catalog.h"
#include "sqlsh/engine/connection.h"
#include "sqlsh/proto/proto_generated.h"
#include "sqlsh/script.h"
#include "sqlsh/testing/completion_snapshot_test.h"

using namespace sqlsh;
using namespace sqlsh::testing;

DEFINE_string(source_dir, "", "Source directory");

static void generate_completion_snapshots(const std::filesystem::path& source_dir) {
    auto snapshot_dir = source_dir / "snapshots" / "completion";
    for (auto& p : std::filesystem::directory_iterator(snapshot_dir)) {
        auto filename = p.path().filename().filename().string();

        // Is template file file
        auto out = p.path();
        if (out.extension() != ".xml") continue;
        out.replace_extension();
        if (out.extension() != ".tpl") continue;
        out.replace_extension(".xml");

        // Open input stream
        std::ifstream in(p.path(), std::ios::in | std::ios::binary);
        if (!in) {
            std::cout << "[" << filename << "] failed to read file" << std::endl;
            continue;
        }

        // Open output stream
        std::cout << "FILE " << out << std::endl;
        std::ofstream outs;
        outs.open(out, std::ofstream::out | std::ofstream::trunc);

        // Parse xml document
        pugi::xml_document doc;
        doc.load(in);
        auto root = doc.child("completion-snapshots");

        for (auto test : root.children()) {
            auto name = test.attribute("name").as_string();
            std::cout << "  TEST " << name << std::endl;

            auto [connection, connection_status] =
                CompletionSnapshotTest::OpenCatalog(CompletionSnapshotTest::ReadCatalog(test.child("catalog")));
            if (connection_status != proto::StatusCode::OK) {
                std::cout << "  ERROR " << proto::EnumNameStatusCode(connection_status) << std::endl;
                continue;
            }
            SQLiteCatalog catalog{*connection};

            std::string input = test.child("input").last_child().value();
            auto cursor_search_node = test.child("cursor").child("search");
            auto cursor_search_text = cursor_search_node.attribute("text").value();
            auto cursor_search_index = cursor_search_node.attribute("index").as_uint();
            auto cursor_pos = CompletionSnapshotTest::FindCursor(input, cursor_search_text, cursor_search_index);
            if (cursor_pos == std::string_view::npos) {
                std::cout << "  ERROR couldn't locate cursor `" << cursor_search_text << "`" << std::endl;
                continue;
            }

            Script script{catalog};
            script.ReplaceText(input);
            auto [completion, completion_status] = script.CompleteAt(cursor_pos);
            if (completion_status != proto::StatusCode::OK) {
                std::cout << "  ERROR " << proto::EnumNameStatusCode(completion_status) << std::endl;
                continue;
            }

            // Replace the expected completions
            test.remove_child("completions");
            auto completions_node = test.append_child("completions");
            CompletionSnapshotTest::EncodeCompletion(completions_node, *completion, input);
        }

        // Write xml document
        doc.save(outs, "    ", pugi::format_default | pugi::format_no_declaration);
    }
}

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("Usage: ./sqlsh_snapshotter --source_dir <dir>");
    gflags::ParseCommandLineFlags(&argc, &argv, false);

    if (!std::filesystem::exists(FLAGS_source_dir)) {
        std::cout << "Invalid source directory: " << FLAGS_source_dir << std::endl;
        return 1;
    }
    auto source_dir = std::filesystem::path{FLAGS_source_dir};
    generate_completion_snapshots(source_dir);
    return 0;
}
