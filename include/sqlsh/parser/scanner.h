#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "sqlsh/parser/parser.h"
#include "sqlsh/proto/proto_generated.h"

namespace sqlsh {

class ScannedScript;

namespace parser {

class Scanner {
   protected:
    /// The flex scanner state
    void* scanner_state_ptr = nullptr;
    /// The input text
    std::string_view input_data;
    /// The bytes handed to flex so far
    size_t input_consumed = 0;
    /// The offset of the current token
    uint32_t current_offset = 0;
    /// The location of the current token
    proto::Location current_location;
    /// Temporary buffer for lower-casing identifiers
    std::string temp_buffer;
    /// The output
    std::shared_ptr<ScannedScript> output;

    /// Constructor
    explicit Scanner(std::string_view text);

   public:
    /// Destructor
    ~Scanner();
    /// Delete the copy constructor
    Scanner(const Scanner& other) = delete;
    /// Delete the copy assignment
    Scanner& operator=(const Scanner& other) = delete;

    /// Copy the next input chunk into a flex buffer
    void ScanNextInputData(char* out_buffer, size_t& out_bytes_read, size_t max_size);
    /// Advance the location past the current token
    void AdvanceLocation(size_t length);
    /// Get the location of the current token
    proto::Location GetLocation() const { return current_location; }
    /// Get the zero-width location at the end of the input
    proto::Location GetEndLocation() const { return proto::Location(static_cast<uint32_t>(input_data.size()), 0); }

    /// Read an unquoted identifier or keyword
    Parser::symbol_type ReadIdentifier(std::string_view text, proto::Location loc);

    /// Add an error
    void AddError(proto::Location location, const char* message);
    /// Add a line break
    void AddLineBreak(proto::Location location);
    /// Add a comment
    void AddComment(proto::Location location);

    /// Scan input and produce all tokens
    static std::pair<std::shared_ptr<ScannedScript>, proto::StatusCode> Scan(std::string_view text);
};

}  // namespace parser
}  // namespace sqlsh
