#pragma once

#include <flatbuffers/flatbuffers.h>

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ankerl/unordered_dense.h"
#include "sqlsh/proto/proto_generated.h"
#include "sqlsh/script.h"

namespace sqlsh {

class Catalog;

class Completion {
   public:
    /// The keywords that begin a statement, in the order they are offered
    static constexpr std::array<std::string_view, 15> STATEMENT_KEYWORDS{
        "SELECT", "DELETE", "CREATE", "DROP", "ATTACH", "DETACH", "EXPLAIN", "PRAGMA",
        "WITH",   "UPDATE", "ALTER",  "BEGIN", "END",   "COMMIT", "ROLLBACK",
    };
    /// The number of bytes before the cursor that are searched for a relevant node
    static constexpr size_t MAX_LOOKBEHIND = 5;

    /// A completion candidate
    struct Candidate {
        /// The text offset where the replacement starts
        uint32_t replace_from;
        /// The replacement text
        std::string replacement_text;
    };

   protected:
    /// The cursor offset
    size_t text_offset;
    /// The type of the node that was completed
    proto::NodeType context_node_type = proto::NodeType::NONE;
    /// The candidates
    std::vector<Candidate> candidates;
    /// The candidate texts, for deduplication
    ankerl::unordered_dense::set<std::string> candidate_texts;

    /// Add a candidate unless the text was already added
    void AddCandidate(uint32_t replace_from, std::string text);
    /// Complete the keywords that start a statement
    void CompleteStatementKeywords(const SyntaxNode& node);
    /// Complete table names, CTE names and aliases, adds nothing if the catalog fails
    void CompleteTableNames(const SyntaxNode& node, Catalog& catalog);

   public:
    /// Constructor
    explicit Completion(size_t text_offset);

    /// Get the cursor offset
    size_t GetTextOffset() const { return text_offset; }
    /// Get the type of the completed node
    proto::NodeType GetContextNodeType() const { return context_node_type; }
    /// Get the candidates
    auto& GetCandidates() const { return candidates; }
    /// Get the text the first candidate would add after the cursor
    std::optional<std::string> GetHint() const;
    /// Pack the completion
    flatbuffers::Offset<proto::Completion> Pack(flatbuffers::FlatBufferBuilder& builder) const;

    /// Compute the completion at a text offset
    static std::pair<std::unique_ptr<Completion>, proto::StatusCode> Compute(const ParsedScript& parsed,
                                                                             size_t text_offset, Catalog& catalog);
};

}  // namespace sqlsh
