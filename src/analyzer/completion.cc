#include "sqlsh/analyzer/completion.h"

#include <algorithm>

#include "spdlog/spdlog.h"
#include "sqlsh/analyzer/name_resolution_pass.h"
#include "sqlsh/catalog.h"
#include "sqlsh/utils/string_conversion.h"

namespace sqlsh {

namespace {

/// Render a keyword in the letter case of the typed text.
/// Lower-case input gets lower-case keywords, everything else the canonical upper case.
std::string MatchCase(std::string_view keyword, std::string_view input) {
    if (alllower_ascii(input)) {
        return tolower_ascii(keyword);
    }
    return std::string{keyword};
}

}  // namespace

/// Constructor
Completion::Completion(size_t text_offset) : text_offset(text_offset) {}

/// Add a candidate
void Completion::AddCandidate(uint32_t replace_from, std::string text) {
    if (candidate_texts.find(text) != candidate_texts.end()) {
        return;
    }
    candidate_texts.insert(text);
    candidates.push_back(Candidate{replace_from, std::move(text)});
}

/// Complete the keywords that start a statement
void Completion::CompleteStatementKeywords(const SyntaxNode& node) {
    auto content = node.GetText();
    auto replace_from = node.GetLocation().offset();
    for (auto keyword : STATEMENT_KEYWORDS) {
        if (starts_with_ci(keyword, content)) {
            AddCandidate(replace_from, MatchCase(keyword, content) + " ");
        }
    }
}

/// Complete table names, CTE names and aliases
void Completion::CompleteTableNames(const SyntaxNode& node, Catalog& catalog) {
    auto [tables, status] = catalog.ListTables();
    if (status != proto::StatusCode::OK) {
        spdlog::debug("[completion] tables are not available: {}", proto::EnumNameStatusCode(status));
        return;
    }

    // Resolve the names of the statement containing the node
    auto statement = node;
    for (auto parent = statement.GetParent(); parent.has_value(); parent = statement.GetParent()) {
        if (parent->GetNodeType() == proto::NodeType::STATEMENT_LIST) break;
        statement = *parent;
    }
    NameResolutionPass pass{catalog};
    auto names = pass.Resolve(statement);

    auto content = node.GetText();
    auto replace_from = node.GetLocation().offset();
    for (auto& table : tables) {
        if (starts_with_ci(table, content)) {
            AddCandidate(replace_from, table + " ");
        }
    }
    for (auto& [cte, columns] : names.ctes) {
        if (starts_with_ci(cte, content)) {
            AddCandidate(replace_from, cte + " ");
        }
    }
    for (auto& [alias, table] : names.aliases) {
        if (starts_with_ci(alias, content)) {
            AddCandidate(replace_from, alias + " ");
        }
    }
}

/// Get the inline hint
std::optional<std::string> Completion::GetHint() const {
    if (candidates.empty()) {
        return std::nullopt;
    }
    auto& first = candidates.front();
    if (text_offset < first.replace_from) {
        return std::nullopt;
    }
    auto typed = text_offset - first.replace_from;
    if (typed > first.replacement_text.size()) {
        return std::nullopt;
    }
    return first.replacement_text.substr(typed);
}

/// Pack the completion
flatbuffers::Offset<proto::Completion> Completion::Pack(flatbuffers::FlatBufferBuilder& builder) const {
    std::vector<flatbuffers::Offset<proto::CompletionCandidate>> packed;
    packed.reserve(candidates.size());
    for (auto& candidate : candidates) {
        auto text_ofs = builder.CreateString(candidate.replacement_text);
        proto::CompletionCandidateBuilder candidateBuilder{builder};
        candidateBuilder.add_replace_from(candidate.replace_from);
        candidateBuilder.add_replacement_text(text_ofs);
        packed.push_back(candidateBuilder.Finish());
    }
    auto candidatesOfs = builder.CreateVector(packed);

    proto::CompletionBuilder completionBuilder{builder};
    completionBuilder.add_text_offset(static_cast<uint32_t>(text_offset));
    completionBuilder.add_context_node_type(context_node_type);
    completionBuilder.add_candidates(candidatesOfs);
    return completionBuilder.Finish();
}

/// Compute the completion at a text offset
std::pair<std::unique_ptr<Completion>, proto::StatusCode> Completion::Compute(const ParsedScript& parsed,
                                                                              size_t text_offset, Catalog& catalog) {
    auto completion = std::make_unique<Completion>(text_offset);
    if (text_offset > parsed.GetText().size()) {
        return {std::move(completion), proto::StatusCode::OK};
    }

    // Look a few bytes behind the cursor for the first node below the statement list.
    // The cursor is often placed right after a token that ends at the cursor.
    auto root = parsed.GetRootNode();
    std::optional<SyntaxNode> relevant;
    auto lookbehind = std::min(MAX_LOOKBEHIND, text_offset);
    for (size_t i = 0; i < lookbehind; ++i) {
        auto node = root.FindSmallestCovering(text_offset - i);
        if (node.GetNodeType() == proto::NodeType::STATEMENT_LIST) {
            continue;
        }
        relevant = node;
        break;
    }
    if (!relevant.has_value()) {
        return {std::move(completion), proto::StatusCode::OK};
    }
    completion->context_node_type = relevant->GetNodeType();

    // Only the first child of its parent is completed
    auto parent = relevant->GetParent();
    if (!parent.has_value() || relevant->GetPreviousSibling().has_value()) {
        return {std::move(completion), proto::StatusCode::OK};
    }
    auto node_type = relevant->GetNodeType();
    auto parent_type = parent->GetNodeType();
    if (node_type == proto::NodeType::ERROR && parent_type == proto::NodeType::STATEMENT_LIST) {
        completion->CompleteStatementKeywords(*relevant);
    } else if (node_type == proto::NodeType::IDENTIFIER && parent_type == proto::NodeType::TABLE_REFERENCE) {
        completion->CompleteTableNames(*relevant, catalog);
    }
    return {std::move(completion), proto::StatusCode::OK};
}

}  // namespace sqlsh
