#include "gtest/gtest.h"
#include "pugixml.hpp"
#include "sqlsh/analyzer/completion.h"
#include "sqlsh/catalog.h"
#include "sqlsh/engine/connection.h"
#include "sqlsh/proto/proto_generated.h"
#include "sqlsh/script.h"
#include "sqlsh/testing/completion_snapshot_test.h"
#include "sqlsh/testing/xml_tests.h"

using namespace sqlsh;
using namespace sqlsh::testing;

namespace {

struct CompletionSnapshotTestSuite : public ::testing::TestWithParam<const CompletionSnapshotTest*> {};

TEST_P(CompletionSnapshotTestSuite, Test) {
    auto* test = GetParam();

    // Set up the database
    auto [connection, connection_status] = CompletionSnapshotTest::OpenCatalog(test->catalog_statements);
    ASSERT_EQ(connection_status, proto::StatusCode::OK) << proto::EnumNameStatusCode(connection_status);
    SQLiteCatalog catalog{*connection};

    auto cursor_pos = CompletionSnapshotTest::FindCursor(test->input, test->cursor_search_string,
                                                         test->cursor_search_index);
    ASSERT_NE(cursor_pos, std::string::npos);

    // Complete at the cursor
    Script script{catalog};
    script.ReplaceText(test->input);
    auto [completion, completion_status] = script.CompleteAt(cursor_pos);
    ASSERT_EQ(completion_status, proto::StatusCode::OK);
    ASSERT_NE(completion, nullptr);

    pugi::xml_document out;
    auto completions = out.append_child("completions");
    CompletionSnapshotTest::EncodeCompletion(completions, *completion, test->input);

    ASSERT_TRUE(Matches(out.child("completions"), test->completions.child("completions")));
}

// clang-format off
INSTANTIATE_TEST_SUITE_P(Basic, CompletionSnapshotTestSuite, ::testing::ValuesIn(CompletionSnapshotTest::GetTests("basic.xml")), CompletionSnapshotTest::TestPrinter());
INSTANTIATE_TEST_SUITE_P(Keywords, CompletionSnapshotTestSuite, ::testing::ValuesIn(CompletionSnapshotTest::GetTests("keywords.xml")), CompletionSnapshotTest::TestPrinter());

}
